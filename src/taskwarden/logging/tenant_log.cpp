#include "taskwarden/logging/tenant_log.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <iterator>
#include <system_error>
#include <vector>

namespace taskwarden {

namespace {

auto upper(std::string_view s) -> std::string {
  std::string out;
  out.reserve(s.size());
  std::ranges::transform(s, std::back_inserter(out), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return out;
}

}  // namespace

FileLogSink::FileLogSink(std::filesystem::path root, std::size_t capacity,
                         NowFn now, std::size_t max_open_files)
    : root_(std::move(root)),
      now_(std::move(now)),
      queue_(capacity),
      max_open_files_(std::max<std::size_t>(max_open_files, 1)) {
}

FileLogSink::~FileLogSink() {
  stop();
}

auto FileLogSink::path_for(OwnerId owner) const -> std::filesystem::path {
  return root_ / std::to_string(owner.value()) / "logs" / "user.log";
}

auto FileLogSink::start() -> void {
  if (running_.exchange(true)) {
    return;
  }
  writer_ = std::thread([this] { writer_loop(); });
}

auto FileLogSink::stop() -> void {
  if (running_.exchange(false) && writer_.joinable()) {
    writer_.join();
  }
  // Anything left when the writer never ran still goes to disk.
  while (auto line = queue_.try_pop()) {
    write(*line);
  }
  close_files();
}

auto FileLogSink::append(OwnerId owner, log::Level level,
                         std::string_view message) -> void {
  auto time = std::chrono::floor<std::chrono::milliseconds>(now_());
  auto text = std::format("{:%Y-%m-%d %H:%M:%S} {} user={} {}\n", time,
                          upper(log::level_name(level)), owner, message);
  if (!queue_.push(Line{owner, std::move(text)})) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
  }
}

auto FileLogSink::writer_loop() -> void {
  std::vector<Line> batch;
  batch.reserve(64);

  while (running_.load(std::memory_order_acquire)) {
    batch.clear();
    while (batch.size() < 64) {
      if (auto line = queue_.try_pop()) {
        batch.push_back(std::move(*line));
      } else {
        break;
      }
    }
    for (const auto& line : batch) {
      write(line);
    }
    if (batch.empty()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    } else {
      for (auto& [owner, open] : files_) {
        std::fflush(open.file);
      }
    }
  }
}

auto FileLogSink::file_for(OwnerId owner) -> std::FILE* {
  if (auto it = files_.find(owner); it != files_.end()) {
    recency_.splice(recency_.begin(), recency_, it->second.recency);
    return it->second.file;
  }

  auto path = path_for(owner);
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) {
    log::warn("Cannot create tenant log directory {}: {}",
              path.parent_path().string(), ec.message());
    return nullptr;
  }

  if (files_.size() >= max_open_files_) {
    auto victim = recency_.back();
    recency_.pop_back();
    if (auto it = files_.find(victim); it != files_.end()) {
      std::fclose(it->second.file);
      files_.erase(it);
    }
  }

  std::FILE* f = std::fopen(path.c_str(), "a");
  if (!f) {
    log::warn("Cannot open tenant log {}", path.string());
    open_files_.store(files_.size(), std::memory_order_relaxed);
    return nullptr;
  }
  recency_.push_front(owner);
  files_.emplace(owner, OpenFile{f, recency_.begin()});
  open_files_.store(files_.size(), std::memory_order_relaxed);
  return f;
}

auto FileLogSink::write(const Line& line) -> void {
  std::FILE* f = file_for(line.owner);
  if (!f) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  std::fputs(line.text.c_str(), f);
}

auto FileLogSink::close_files() -> void {
  for (auto& [owner, open] : files_) {
    std::fclose(open.file);
  }
  files_.clear();
  recency_.clear();
  open_files_.store(0, std::memory_order_relaxed);
}

}  // namespace taskwarden
