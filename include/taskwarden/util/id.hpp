#pragma once

#include <compare>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>

namespace taskwarden {

// Phantom type tags for type-safe ID disambiguation
struct OwnerTag {};
struct ResourceTag {};
struct TaskTag {};

// Integer row id wrapper. An owner id can never be passed where a task id
// is expected, which keeps tenant-scoped signatures honest.
template <typename Tag>
class TypedId {
public:
  using value_type = std::int64_t;

  constexpr explicit TypedId(value_type value) noexcept : value_(value) {}

  constexpr TypedId() = default;

  [[nodiscard]] constexpr auto value() const noexcept -> value_type {
    return value_;
  }

  [[nodiscard]] constexpr auto valid() const noexcept -> bool {
    return value_ > 0;
  }

  [[nodiscard]] friend constexpr auto operator<=>(const TypedId& lhs,
                                                  const TypedId& rhs) = default;
  [[nodiscard]] friend constexpr auto operator==(const TypedId& lhs,
                                                 const TypedId& rhs)
      -> bool = default;

private:
  value_type value_{0};
};

using OwnerId = TypedId<OwnerTag>;
using ResourceId = TypedId<ResourceTag>;
using TaskId = TypedId<TaskTag>;

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id)
    -> std::ostream& {
  return os << id.value();
}

}  // namespace taskwarden

template <typename Tag>
struct std::hash<taskwarden::TypedId<Tag>> {
  auto operator()(const taskwarden::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::int64_t>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<taskwarden::TypedId<Tag>>
    : std::formatter<std::int64_t> {
  auto format(const taskwarden::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::int64_t>::format(id.value(), ctx);
  }
};
