#pragma once

#include <concepts>
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace taskwarden {

enum class Error : int {
  Success,
  FileNotFound,
  FileOpenFailed,
  ParseError,
  DatabaseError,
  DatabaseQueryFailed,
  ConnectionFailed,
  StorageUnavailable,
  InvalidArgument,
  NotFound,
  AlreadyExists,
  Timeout,
  ExecutionFailed,
  ExecutorNotFound,
  InvalidState,
  Unknown,
};

[[nodiscard]] constexpr auto error_message(Error e) noexcept
    -> std::string_view {
  switch (e) {
    case Error::Success: return "success";
    case Error::FileNotFound: return "file not found";
    case Error::FileOpenFailed: return "failed to open file";
    case Error::ParseError: return "parse error";
    case Error::DatabaseError: return "database error";
    case Error::DatabaseQueryFailed: return "database query failed";
    case Error::ConnectionFailed:
      return "connection to storage endpoint failed";
    case Error::StorageUnavailable: return "no storage endpoint available";
    case Error::InvalidArgument: return "invalid argument";
    case Error::NotFound: return "not found";
    case Error::AlreadyExists: return "already exists";
    case Error::Timeout: return "timeout";
    case Error::ExecutionFailed: return "task execution failed";
    case Error::ExecutorNotFound:
      return "no executor registered for task type";
    case Error::InvalidState: return "operation not allowed in current state";
    case Error::Unknown: break;
  }
  return "unknown error";
}

class ErrorCategory : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "taskwarden";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    return std::string{error_message(static_cast<Error>(ev))};
  }
};

inline auto error_category() -> const ErrorCategory& {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

// Result<T> itself is unconstrained so it can name incomplete types.
template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T>
using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T&& value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> {
  return {};
}

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

}  // namespace taskwarden

template <>
struct std::is_error_code_enum<taskwarden::Error> : std::true_type {};

namespace taskwarden {

// Errors that say the endpoint itself is gone, as opposed to a bad query.
[[nodiscard]] inline auto is_connection_error(std::error_code ec) noexcept
    -> bool {
  return ec == Error::ConnectionFailed;
}

}  // namespace taskwarden
