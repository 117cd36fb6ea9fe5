#pragma once

#include "taskwarden/core/constants.hpp"
#include "taskwarden/core/lockfree_queue.hpp"
#include "taskwarden/util/id.hpp"
#include "taskwarden/util/log.hpp"
#include "taskwarden/util/time.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <list>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

namespace taskwarden {

// Per-tenant, append-only log channel. append() never blocks and never
// fails from the caller's point of view.
class LogSink {
public:
  virtual ~LogSink() = default;
  virtual auto append(OwnerId owner, log::Level level,
                      std::string_view message) -> void = 0;
};

class NullLogSink final : public LogSink {
public:
  auto append(OwnerId, log::Level, std::string_view) -> void override {
  }
};

// Writes <root>/<owner>/logs/user.log from a background thread. Lines that
// do not fit in the queue are dropped and counted. At most max_open_files
// tenant files stay open; the least recently written one is closed first.
class FileLogSink final : public LogSink {
public:
  explicit FileLogSink(std::filesystem::path root,
                       std::size_t capacity = limits::kTenantLogQueueCapacity,
                       NowFn now = system_now,
                       std::size_t max_open_files = 256);
  ~FileLogSink() override;

  FileLogSink(const FileLogSink&) = delete;
  FileLogSink& operator=(const FileLogSink&) = delete;

  auto start() -> void;
  // Drains queued lines, then closes every file.
  auto stop() -> void;

  auto append(OwnerId owner, log::Level level, std::string_view message)
      -> void override;

  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }

  [[nodiscard]] auto open_files() const noexcept -> std::size_t {
    return open_files_.load(std::memory_order_relaxed);
  }

  [[nodiscard]] auto path_for(OwnerId owner) const -> std::filesystem::path;

private:
  struct Line {
    OwnerId owner;
    std::string text;
  };

  auto writer_loop() -> void;
  auto write(const Line& line) -> void;
  [[nodiscard]] auto file_for(OwnerId owner) -> std::FILE*;
  auto close_files() -> void;

  struct OpenFile {
    std::FILE* file;
    std::list<OwnerId>::iterator recency;
  };

  std::filesystem::path root_;
  NowFn now_;
  BoundedMPSCQueue<Line> queue_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> dropped_{0};
  std::atomic<std::size_t> open_files_{0};
  std::size_t max_open_files_;
  std::thread writer_;

  // Touched only by the writer thread (or by stop() after it joined).
  std::unordered_map<OwnerId, OpenFile> files_;
  // Most recently written owner at the front.
  std::list<OwnerId> recency_;
};

}  // namespace taskwarden
