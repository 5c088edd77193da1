#include "labrun/runner/orchestrator.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>

using namespace labrun;
using namespace std::chrono_literals;

class OrchestratorTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_FALSE(dir_.path().empty());
    config_ = test::test_config();
    config_.timeout = 5s;
    config_.poll_interval = 3000ms;
  }

  auto artifact(const std::string& name) -> std::filesystem::path {
    auto p = dir_.write(name);
    artifacts_.push_back(p);
    return p;
  }

  auto run() -> Result<std::vector<FinishedInstance>> {
    Orchestrator orchestrator(config_, engine_, clock_);
    auto results = orchestrator.run(artifacts_);
    iterations_ = orchestrator.poll_iterations();
    return results;
  }

  test::TempDir dir_;
  RunConfig config_;
  test::FakeEngine engine_;
  test::ManualClock clock_;
  std::vector<std::filesystem::path> artifacts_;
  std::size_t iterations_{0};
};

TEST_F(OrchestratorTest, NaturalExitIsReportedWithItsCode) {
  auto path = artifact("alice.tar.gz");
  engine_.queue({.running_polls = 0, .exit_code = 7, .log = "2 of 3 tests passed\n"});

  auto results = run();

  ASSERT_TRUE(results.has_value());
  ASSERT_EQ(results->size(), 1u);
  const auto& r = (*results)[0];
  EXPECT_EQ(r.instance.source_path.string(), path.string());
  EXPECT_EQ(r.exit_reason, ExitReason::Exited);
  EXPECT_EQ(r.return_code, 7);
  EXPECT_EQ(r.log, "2 of 3 tests passed\n");
  EXPECT_EQ(iterations_, 1u);
  EXPECT_TRUE(clock_.sleeps().empty());
  EXPECT_EQ(engine_.count("stop:"), 0u);
}

TEST_F(OrchestratorTest, RunawayContainerIsStoppedAfterTimeout) {
  artifact("loop.tar.gz");
  engine_.queue({.running_polls = std::nullopt, .log = "spinning\n"});

  auto results = run();

  ASSERT_TRUE(results.has_value());
  ASSERT_EQ(results->size(), 1u);
  EXPECT_EQ((*results)[0].exit_reason, ExitReason::TimedOut);
  EXPECT_EQ((*results)[0].return_code, 137);
  EXPECT_EQ((*results)[0].log, "spinning\n");

  // Polls at 0s, 3s and 6s; the last one crosses the 5s budget.
  EXPECT_EQ(iterations_, 3u);
  EXPECT_EQ(engine_.count("inspect:"), 3u);
  EXPECT_EQ(clock_.sleeps(), (std::vector<std::chrono::milliseconds>{3000ms, 3000ms}));

  EXPECT_EQ(engine_.count("stop:c0001"), 1u);
  EXPECT_LT(engine_.index_of("stop:c0001"), engine_.index_of("wait:c0001"));
  EXPECT_LT(engine_.index_of("stop:c0001"), engine_.index_of("logs:c0001"));
  EXPECT_EQ(engine_.count("wait-on-running:"), 0u);
}

TEST_F(OrchestratorTest, LongRunningContainerThatWouldExitLaterStillTimesOut) {
  artifact("slow.tar.gz");
  engine_.queue({.running_polls = 20, .exit_code = 0});

  auto results = run();

  ASSERT_TRUE(results.has_value());
  ASSERT_EQ(results->size(), 1u);
  EXPECT_EQ((*results)[0].exit_reason, ExitReason::TimedOut);
  EXPECT_EQ(iterations_, 3u);
  EXPECT_EQ(engine_.count("wait-on-running:"), 0u);
}

TEST_F(OrchestratorTest, TimedOutResultsComeBeforeExitedOnes) {
  artifact("quick.tar.gz");   // c0001
  artifact("runaway.tar.gz"); // c0002
  engine_.queue({.running_polls = 1, .exit_code = 0});
  engine_.queue({.running_polls = std::nullopt});

  auto results = run();

  ASSERT_TRUE(results.has_value());
  ASSERT_EQ(results->size(), 2u);
  EXPECT_EQ((*results)[0].instance.container_id.str(), "c0002");
  EXPECT_EQ((*results)[0].exit_reason, ExitReason::TimedOut);
  EXPECT_EQ((*results)[1].instance.container_id.str(), "c0001");
  EXPECT_EQ((*results)[1].exit_reason, ExitReason::Exited);
  EXPECT_EQ((*results)[1].return_code, 0);
  EXPECT_EQ(engine_.count("stop:c0001"), 0u);
}

TEST_F(OrchestratorTest, EverySubmissionIsReportedExactlyOnce) {
  config_.timeout = 10s;
  for (int i = 0; i < 6; ++i) {
    artifact(std::format("s{}.tar.gz", i));
  }
  engine_.queue({.running_polls = 0});
  engine_.queue({.running_polls = 2, .exit_code = 1});
  engine_.queue({.running_polls = std::nullopt});
  engine_.queue({.running_polls = 1, .exit_code = 3});
  engine_.queue({.running_polls = std::nullopt});
  engine_.queue({.running_polls = 0, .exit_code = 2});

  auto results = run();

  ASSERT_TRUE(results.has_value());
  ASSERT_EQ(results->size(), 6u);

  std::set<std::string> sources;
  for (const auto& r : *results) {
    sources.insert(r.instance.source_path.filename().string());
  }
  EXPECT_EQ(sources.size(), 6u);

  auto timed_out = std::count_if(results->begin(), results->end(), [](const auto& r) {
    return r.exit_reason == ExitReason::TimedOut;
  });
  EXPECT_EQ(timed_out, 2);
  EXPECT_EQ((*results)[0].exit_reason, ExitReason::TimedOut);
  EXPECT_EQ((*results)[1].exit_reason, ExitReason::TimedOut);
  EXPECT_EQ(engine_.count("wait:"), 6u);
  EXPECT_EQ(engine_.count("wait-on-running:"), 0u);
}

TEST_F(OrchestratorTest, KeepsPollingUntilNothingRuns) {
  config_.timeout = 300s;
  artifact("a.tar.gz");
  engine_.queue({.running_polls = 4, .exit_code = 0});

  auto results = run();

  ASSERT_TRUE(results.has_value());
  ASSERT_EQ(results->size(), 1u);
  EXPECT_EQ((*results)[0].exit_reason, ExitReason::Exited);
  EXPECT_EQ(iterations_, 5u);
  EXPECT_EQ(clock_.sleeps().size(), 4u);
}

TEST_F(OrchestratorTest, NoLaunchableSubmissionsMeansNoPolling) {
  artifact("notes.txt");
  artifact("report.pdf");

  auto results = run();

  ASSERT_TRUE(results.has_value());
  EXPECT_TRUE(results->empty());
  EXPECT_EQ(iterations_, 0u);
  EXPECT_TRUE(engine_.calls().empty());
}

TEST_F(OrchestratorTest, InvalidArtifactsAreSkipped) {
  artifact("a.tar.gz");
  artifact("readme.md");
  artifact("b.tar.gz");
  engine_.queue({.running_polls = 0});
  engine_.queue({.running_polls = 0});

  auto results = run();

  ASSERT_TRUE(results.has_value());
  ASSERT_EQ(results->size(), 2u);
  EXPECT_EQ(engine_.count("create:"), 2u);
  EXPECT_EQ((*results)[0].instance.source_path.filename().string(), "a.tar.gz");
  EXPECT_EQ((*results)[1].instance.source_path.filename().string(), "b.tar.gz");
}

TEST_F(OrchestratorTest, EngineFailureAbortsTheRun) {
  artifact("a.tar.gz");
  engine_.queue({.running_polls = std::nullopt});
  engine_.fail_on("inspect");

  auto results = run();

  ASSERT_FALSE(results.has_value());
  EXPECT_EQ(results.error(), Error::EngineCommandFailed);
  EXPECT_EQ(engine_.count("wait:"), 0u);
}

TEST_F(OrchestratorTest, StopFailureAbortsTheRun) {
  artifact("a.tar.gz");
  engine_.queue({.running_polls = std::nullopt});
  engine_.fail_on("stop");

  auto results = run();

  ASSERT_FALSE(results.has_value());
  EXPECT_EQ(results.error(), Error::EngineCommandFailed);
}

TEST_F(OrchestratorTest, DuplicateContainerIdIsFatal) {
  artifact("a.tar.gz");
  artifact("b.tar.gz");
  engine_.reuse_ids();

  auto results = run();

  ASSERT_FALSE(results.has_value());
  EXPECT_EQ(results.error(), Error::DuplicateContainerId);
  EXPECT_EQ(engine_.count("inspect:"), 0u);
}

TEST_F(OrchestratorTest, StopGraceIsPassedToEngine) {
  config_.stop_grace = 2s;
  artifact("a.tar.gz");
  engine_.queue({.running_polls = std::nullopt});

  ASSERT_TRUE(run().has_value());
  EXPECT_EQ(engine_.last_grace(), std::optional<std::chrono::seconds>(2s));
}

TEST_F(OrchestratorTest, RemovesContainersOnlyWhenAsked) {
  artifact("a.tar.gz");
  engine_.queue({.running_polls = 0});
  ASSERT_TRUE(run().has_value());
  EXPECT_EQ(engine_.count("rm:"), 0u);

  test::FakeEngine engine;
  engine.queue({.running_polls = 0});
  config_.remove_containers = true;
  Orchestrator orchestrator(config_, engine, clock_);
  ASSERT_TRUE(orchestrator.run(artifacts_).has_value());
  EXPECT_EQ(engine.count("rm:c0001"), 1u);
}
