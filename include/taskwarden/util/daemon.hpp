#pragma once

#include "taskwarden/core/error.hpp"

namespace taskwarden::process {

// Detaches from the controlling terminal. Must run before any thread starts.
[[nodiscard]] auto detach() -> Result<void>;

// SIGINT and SIGTERM request a shutdown; SIGPIPE is ignored so a closed
// shell pipe surfaces as a write error instead.
[[nodiscard]] auto install_shutdown_handlers() -> Result<void>;

// Async-signal-safe.
auto request_shutdown() noexcept -> void;
[[nodiscard]] auto shutdown_requested() noexcept -> bool;

// Blocks until request_shutdown() has been called.
auto wait_for_shutdown() noexcept -> void;

}  // namespace taskwarden::process
