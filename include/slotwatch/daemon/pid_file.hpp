#pragma once

#include "slotwatch/common/result.hpp"

#include <filesystem>
#include <optional>

namespace slotwatch::daemon {

/// Guards against two pollers sharing one snapshot. Released on destruction.
class PidFile {
public:
  explicit PidFile(std::filesystem::path path);
  ~PidFile();

  PidFile(const PidFile &) = delete;
  PidFile &operator=(const PidFile &) = delete;

  /// Fails while another live process holds the file; stale files are replaced.
  [[nodiscard]] common::Status acquire();
  void release();

  [[nodiscard]] bool acquired() const { return acquired_; }
  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

  /// Pid recorded in the file, if it holds one.
  [[nodiscard]] std::optional<int> read_pid() const;

  [[nodiscard]] static bool is_process_running(int pid);
  [[nodiscard]] static int current_pid();

private:
  std::filesystem::path path_;
  bool acquired_ = false;
};

} // namespace slotwatch::daemon
