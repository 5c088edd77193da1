#pragma once

#include <compare>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace labrun {

struct ContainerTag {};

// Phantom-typed string id; keeps engine handles apart from plain strings
template <typename Tag>
class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  TypedId() = default;

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }

  [[nodiscard]] explicit operator std::string_view() const { return value_; }

  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId& lhs, const TypedId& rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId& lhs, const TypedId& rhs) -> bool = default;

  // Short form as printed by `docker ps`
  [[nodiscard]] auto short_id() const -> std::string_view {
    return std::string_view{value_}.substr(0, 12);
  }

private:
  std::string value_;
};

using ContainerId = TypedId<ContainerTag>;

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id) -> std::ostream& {
  return os << id.value();
}

}  // namespace labrun

template <typename Tag>
struct std::hash<labrun::TypedId<Tag>> {
  auto operator()(const labrun::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<labrun::TypedId<Tag>> : std::formatter<std::string_view> {
  auto format(const labrun::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
