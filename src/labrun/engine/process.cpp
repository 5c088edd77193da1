#include "labrun/engine/process.hpp"

#include "labrun/core/constants.hpp"
#include "labrun/util/log.hpp"

#include <sys/wait.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace labrun {

namespace {

class UniqueFd {
public:
  UniqueFd() noexcept = default;
  explicit UniqueFd(int fd) noexcept : fd_(fd) {}

  UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
  auto operator=(UniqueFd&& other) noexcept -> UniqueFd& {
    if (this != &other) {
      reset();
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }

  UniqueFd(const UniqueFd&) = delete;
  auto operator=(const UniqueFd&) -> UniqueFd& = delete;

  ~UniqueFd() { reset(); }

  [[nodiscard]] auto get() const noexcept -> int { return fd_; }
  [[nodiscard]] auto valid() const noexcept -> bool { return fd_ >= 0; }

  auto reset() noexcept -> void {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

private:
  int fd_{-1};
};

struct Pipe {
  UniqueFd read;
  UniqueFd write;
};

auto create_pipe() -> Result<Pipe> {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) {
    log::error("pipe2 failed: {}", std::strerror(errno));
    return fail(Error::SpawnFailed);
  }
  // Only our end is non-blocking; the child's end must stay blocking.
  int flags = fcntl(fds[0], F_GETFL);
  fcntl(fds[0], F_SETFL, flags | O_NONBLOCK);
  return Pipe{UniqueFd{fds[0]}, UniqueFd{fds[1]}};
}

auto get_exit_code(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

// Returns false once the fd reached EOF or failed.
auto drain(int fd, std::string& out) -> bool {
  std::array<char, io::kReadBufferSize> buffer;
  while (true) {
    ssize_t n = ::read(fd, buffer.data(), buffer.size());
    if (n > 0) {
      out.append(buffer.data(), static_cast<std::size_t>(n));
      continue;
    }
    if (n == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return true;
    }
    log::warn("read from child pipe failed: {}", std::strerror(errno));
    return false;
  }
}

}  // namespace

auto run_process(const std::vector<std::string>& argv, ProcessOptions options)
    -> Result<ProcessResult> {
  if (argv.empty() || argv.front().empty()) {
    log::error("run_process: empty command line");
    return fail(Error::InvalidArgument);
  }

  auto out_pipe = create_pipe();
  if (!out_pipe) {
    return fail(out_pipe.error());
  }
  Result<Pipe> err_pipe = Pipe{};
  if (!options.merge_stderr) {
    err_pipe = create_pipe();
    if (!err_pipe) {
      return fail(err_pipe.error());
    }
  }

  UniqueFd dev_null{::open("/dev/null", O_RDONLY | O_CLOEXEC)};

  // Everything the child touches is prepared before fork.
  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& a : argv) {
    args.push_back(const_cast<char*>(a.c_str()));
  }
  args.push_back(nullptr);

  const int stdout_fd = out_pipe->write.get();
  const int stderr_fd =
      options.merge_stderr ? out_pipe->write.get() : err_pipe->write.get();
  const int stdin_fd = dev_null.get();

  pid_t pid = fork();
  if (pid < 0) {
    log::error("fork failed for {}: {}", argv.front(), std::strerror(errno));
    return fail(Error::SpawnFailed);
  }

  if (pid == 0) {
    // Child process - async-signal-safe calls only
    if (stdin_fd >= 0) {
      dup2(stdin_fd, STDIN_FILENO);
    }
    dup2(stdout_fd, STDOUT_FILENO);
    dup2(stderr_fd, STDERR_FILENO);
    execvp(args[0], args.data());
    _exit(127);
  }

  out_pipe->write.reset();
  if (!options.merge_stderr) {
    err_pipe->write.reset();
  }
  dev_null.reset();

  ProcessResult result;
  result.stdout_output.reserve(io::kInitialOutputReserve);

  bool out_open = true;
  bool err_open = !options.merge_stderr;
  while (out_open || err_open) {
    std::array<pollfd, 2> fds{};
    nfds_t count = 0;
    if (out_open) {
      fds[count++] = pollfd{out_pipe->read.get(), POLLIN, 0};
    }
    if (err_open) {
      fds[count++] = pollfd{err_pipe->read.get(), POLLIN, 0};
    }

    int ready = ::poll(fds.data(), count, -1);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      log::warn("poll on child pipes failed: {}", std::strerror(errno));
      break;
    }

    for (nfds_t i = 0; i < count; ++i) {
      if (fds[i].revents == 0) {
        continue;
      }
      if (out_open && fds[i].fd == out_pipe->read.get()) {
        out_open = drain(fds[i].fd, result.stdout_output);
      } else if (err_open) {
        err_open = drain(fds[i].fd, result.stderr_output);
      }
    }
  }

  int status = 0;
  pid_t waited = -1;
  do {
    waited = ::waitpid(pid, &status, 0);
  } while (waited < 0 && errno == EINTR);

  if (waited < 0) {
    log::error("waitpid failed for pid {}: {}", pid, std::strerror(errno));
    return fail(Error::SpawnFailed);
  }

  result.exit_code = get_exit_code(status);
  log::trace("{} exited with {} ({} bytes stdout, {} bytes stderr)",
             argv.front(), result.exit_code, result.stdout_output.size(),
             result.stderr_output.size());
  return ok(std::move(result));
}

}  // namespace labrun
