#pragma once

#include "slotwatch/availability/time_range.hpp"
#include "slotwatch/common/result.hpp"
#include "slotwatch/common/time.hpp"
#include "slotwatch/notify/notifier.hpp"
#include "slotwatch/snapshot/snapshot_store.hpp"
#include "slotwatch/source/source_client.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace slotwatch::poller {

/// Collaborators of one poll cycle. The context does not own them.
struct CycleContext {
  source::SourceClient &source;
  snapshot::SnapshotStore &store;
  notify::Notifier &notifier;
  std::uint32_t lookahead_days = 14;
  std::uint32_t notify_retries = 2;
  std::chrono::milliseconds retry_delay{1000};
};

struct CycleReport {
  availability::AvailabilityList available;
  availability::AvailabilityList fresh;
  bool notified = false;
  // Last notifier error when every attempt failed.
  std::string notify_error;
};

/// fetch -> compute -> load previous -> diff -> persist -> notify.
/// Fails when fetching, loading or saving fails; a failed notification is only reported.
[[nodiscard]] common::Result<CycleReport> run_cycle(CycleContext &context,
                                                    const common::Timestamp &now);

/// Fetch and compute without touching the snapshot or the notifier.
[[nodiscard]] common::Result<availability::AvailabilityList>
preview_availability(source::SourceClient &source, std::uint32_t lookahead_days,
                     const common::Timestamp &now);

} // namespace slotwatch::poller
