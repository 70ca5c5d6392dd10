#pragma once

#include "slotwatch/availability/time_range.hpp"
#include "slotwatch/common/result.hpp"
#include "slotwatch/common/time.hpp"

#include <filesystem>
#include <string>

namespace slotwatch::snapshot {

class SnapshotStore {
public:
  virtual ~SnapshotStore() = default;
  [[nodiscard]] virtual common::Result<availability::AvailabilityList> load() = 0;
  [[nodiscard]] virtual common::Status save(const availability::AvailabilityList &list) = 0;
};

/// Last announced availability as a JSON document, replaced atomically on save.
class JsonFileSnapshotStore final : public SnapshotStore {
public:
  explicit JsonFileSnapshotStore(std::filesystem::path path);

  [[nodiscard]] common::Result<availability::AvailabilityList> load() override;
  [[nodiscard]] common::Status save(const availability::AvailabilityList &list) override;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

[[nodiscard]] std::string serialize_snapshot(const availability::AvailabilityList &list,
                                             const common::Timestamp &written_at);

/// Fails only when the document itself is unreadable; bad entries are dropped with a warning.
[[nodiscard]] common::Result<availability::AvailabilityList>
parse_snapshot(const std::string &text);

} // namespace slotwatch::snapshot
