#include "slotwatch/daemon/pid_file.hpp"

#include "slotwatch/common/fs.hpp"

#include <cerrno>
#include <fstream>
#include <iostream>
#include <mutex>
#include <set>

#ifndef _WIN32
#include <signal.h>
#include <unistd.h>
#else
#include <windows.h>
#endif

namespace slotwatch::daemon {

namespace {

// Pid files held by this process. A file naming our own pid is only stale
// when no PidFile here holds it (e.g. a container restarted as pid 1).
std::mutex g_held_mutex;
std::set<std::string> g_held_paths;

std::string held_key(const std::filesystem::path &path) {
  std::error_code ec;
  const auto absolute = std::filesystem::absolute(path, ec);
  return (ec ? path : absolute).lexically_normal().string();
}

} // namespace

PidFile::PidFile(std::filesystem::path path) : path_(std::move(path)) {}

PidFile::~PidFile() { release(); }

std::optional<int> PidFile::read_pid() const {
  std::ifstream in(path_);
  if (!in) {
    return std::nullopt;
  }
  int pid = 0;
  if (!(in >> pid) || pid <= 0) {
    return std::nullopt;
  }
  return pid;
}

common::Status PidFile::acquire() {
  if (acquired_) {
    return common::Status::success();
  }

  std::lock_guard<std::mutex> lock(g_held_mutex);
  const std::string key = held_key(path_);
  if (g_held_paths.contains(key)) {
    return common::Status::error("slotwatch already running with pid " +
                                 std::to_string(current_pid()) + " (" + path_.string() + ")");
  }

  std::error_code ec;
  if (std::filesystem::exists(path_, ec)) {
    const auto existing_pid = read_pid();
    if (existing_pid.has_value() && *existing_pid != current_pid() &&
        is_process_running(*existing_pid)) {
      return common::Status::error("slotwatch already running with pid " +
                                   std::to_string(*existing_pid) + " (" + path_.string() + ")");
    }
    std::cerr << "[daemon] replacing stale pid file " << path_.string() << "\n";
    std::filesystem::remove(path_, ec);
  }

  auto written = common::write_file_atomic(path_, std::to_string(current_pid()) + "\n");
  if (!written.ok()) {
    return written.with_context("pid file");
  }
  g_held_paths.insert(key);
  acquired_ = true;
  return common::Status::success();
}

void PidFile::release() {
  if (!acquired_) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  {
    std::lock_guard<std::mutex> lock(g_held_mutex);
    g_held_paths.erase(held_key(path_));
  }
  acquired_ = false;
}

int PidFile::current_pid() {
#ifdef _WIN32
  return static_cast<int>(GetCurrentProcessId());
#else
  return static_cast<int>(getpid());
#endif
}

bool PidFile::is_process_running(const int pid) {
  if (pid <= 0) {
    return false;
  }
#ifdef _WIN32
  HANDLE process = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid));
  if (process != nullptr) {
    CloseHandle(process);
    return true;
  }
  return false;
#else
  // EPERM means the process exists but belongs to another user.
  return kill(pid, 0) == 0 || errno == EPERM;
#endif
}

} // namespace slotwatch::daemon
