#include "slotwatch/snapshot/snapshot_store.hpp"

#include "slotwatch/common/fs.hpp"
#include "slotwatch/common/json_util.hpp"

#include <iostream>
#include <optional>
#include <sstream>

namespace slotwatch::snapshot {

namespace {

std::optional<availability::TimeRange> parse_entry(const std::string &object_json,
                                                   std::string &why) {
  const auto parsed = common::json_parse_flat(object_json);
  if (!parsed.ok()) {
    why = parsed.error();
    return std::nullopt;
  }
  const auto &object = parsed.value();
  const auto start_it = object.find("start");
  const auto end_it = object.find("end");
  if (start_it == object.end() || !start_it->second.is_string() || end_it == object.end() ||
      !end_it->second.is_string()) {
    why = "entry needs string 'start' and 'end'";
    return std::nullopt;
  }
  const auto start = common::parse_rfc3339(start_it->second.text);
  if (!start.ok()) {
    why = start.error();
    return std::nullopt;
  }
  const auto end = common::parse_rfc3339(end_it->second.text);
  if (!end.ok()) {
    why = end.error();
    return std::nullopt;
  }
  availability::TimeRange range{.start = start.value(), .end = end.value()};
  if (!range.valid()) {
    why = "entry ends before it starts";
    return std::nullopt;
  }
  return range;
}

} // namespace

JsonFileSnapshotStore::JsonFileSnapshotStore(std::filesystem::path path)
    : path_(std::move(path)) {}

common::Result<availability::AvailabilityList> JsonFileSnapshotStore::load() {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return common::Result<availability::AvailabilityList>::success({});
  }

  const auto content = common::read_file(path_);
  if (!content.ok()) {
    return common::Result<availability::AvailabilityList>::failure("snapshot load: " +
                                                                   content.error());
  }
  if (common::trim(content.value()).empty()) {
    return common::Result<availability::AvailabilityList>::success({});
  }

  auto parsed = parse_snapshot(content.value());
  if (!parsed.ok()) {
    std::cerr << "[snapshot] ignoring unreadable " << path_.string() << ": " << parsed.error()
              << "\n";
    return common::Result<availability::AvailabilityList>::success({});
  }
  return parsed;
}

common::Status JsonFileSnapshotStore::save(const availability::AvailabilityList &list) {
  return common::write_file_atomic(path_, serialize_snapshot(list, common::now_utc()))
      .with_context("snapshot save");
}

std::string serialize_snapshot(const availability::AvailabilityList &list,
                               const common::Timestamp &written_at) {
  std::ostringstream out;
  out << "{\n";
  out << "  \"written_at\": \"" << common::format_rfc3339_utc(written_at) << "\",\n";
  out << "  \"available\": [";
  for (std::size_t i = 0; i < list.size(); ++i) {
    out << (i == 0 ? "\n" : ",\n");
    out << "    {\"start\": \"" << common::json_escape(common::format_rfc3339(list[i].start))
        << "\", \"end\": \"" << common::json_escape(common::format_rfc3339(list[i].end)) << "\"}";
  }
  if (!list.empty()) {
    out << "\n  ";
  }
  out << "]\n";
  out << "}\n";
  return out.str();
}

common::Result<availability::AvailabilityList> parse_snapshot(const std::string &text) {
  const auto document = common::json_parse_flat(text);
  if (!document.ok()) {
    return common::Result<availability::AvailabilityList>::failure(document.error());
  }

  const auto available_it = document.value().find("available");
  if (available_it == document.value().end() ||
      available_it->second.kind != common::JsonKind::Array) {
    return common::Result<availability::AvailabilityList>::failure("missing 'available' array");
  }

  const auto entries = common::json_split_top_level_objects(available_it->second.text);
  if (!entries.ok()) {
    return common::Result<availability::AvailabilityList>::failure(entries.error());
  }

  availability::AvailabilityList list;
  list.reserve(entries.value().size());
  for (const auto &entry : entries.value()) {
    std::string why;
    if (auto range = parse_entry(entry, why); range.has_value()) {
      list.push_back(*range);
    } else {
      std::cerr << "[snapshot] skipping entry: " << why << "\n";
    }
  }
  return common::Result<availability::AvailabilityList>::success(std::move(list));
}

} // namespace slotwatch::snapshot
