#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "slotwatch/snapshot/snapshot_store.hpp"

#include <filesystem>

void register_snapshot_tests(std::vector<slotwatch::tests::TestCase> &tests) {
  using slotwatch::tests::require;
  namespace snapshot = slotwatch::snapshot;
  using slotwatch::testing::range;
  using slotwatch::testing::ts;

  tests.push_back({"snapshot_missing_file_loads_empty", [] {
                     const slotwatch::testing::TempWorkspace workspace;
                     snapshot::JsonFileSnapshotStore store(workspace.path() / "snapshot.json");
                     const auto loaded = store.load();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().empty(), "no file, no history");
                   }});

  tests.push_back({"snapshot_save_then_load_preserves_ranges", [] {
                     const slotwatch::testing::TempWorkspace workspace;
                     const auto path = workspace.path() / "state" / "snapshot.json";
                     snapshot::JsonFileSnapshotStore store(path);
                     const slotwatch::availability::AvailabilityList list{
                         range("2023-12-01T08:00:00+02:00", "2023-12-01T10:00:00+02:00"),
                         range("2023-12-01T11:00:00+02:00", "2023-12-01T16:00:00+02:00")};

                     const auto saved = store.save(list);
                     require(saved.ok(), saved.error());
                     require(std::filesystem::exists(path), "parent directories created");
                     require(!std::filesystem::exists(path.string() + ".tmp"), "tmp file renamed");

                     const auto loaded = store.load();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value() == list, "loaded list should match saved list");
                     require(loaded.value()[0].start.offset == std::chrono::minutes(120),
                             "local offset preserved");
                   }});

  tests.push_back({"snapshot_save_overwrites_previous_list", [] {
                     const slotwatch::testing::TempWorkspace workspace;
                     snapshot::JsonFileSnapshotStore store(workspace.path() / "snapshot.json");
                     require(store.save({range("2023-12-01T08:00:00Z", "2023-12-01T09:00:00Z")}).ok(),
                             "first save");
                     require(store.save({}).ok(), "second save");
                     const auto loaded = store.load();
                     require(loaded.ok() && loaded.value().empty(), "empty list replaces old one");
                   }});

  tests.push_back({"snapshot_unparseable_file_loads_empty", [] {
                     const slotwatch::testing::TempWorkspace workspace;
                     workspace.create_file("snapshot.json", "{ this is not json");
                     snapshot::JsonFileSnapshotStore store(workspace.path() / "snapshot.json");
                     const auto loaded = store.load();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().empty(), "corrupt history is treated as empty");
                   }});

  tests.push_back({"snapshot_skips_invalid_entries", [] {
                     const auto parsed = snapshot::parse_snapshot(R"({
  "written_at": "2023-12-01T00:00:00Z",
  "available": [
    {"start": "2023-12-01T08:00:00Z", "end": "2023-12-01T09:00:00Z"},
    {"start": "yesterday", "end": "2023-12-01T09:00:00Z"},
    {"start": "2023-12-01T12:00:00Z", "end": "2023-12-01T11:00:00Z"},
    {"end": "2023-12-01T09:00:00Z"}
  ]
})");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().size() == 1, "only the valid entry survives");
                     require(parsed.value()[0].start == ts("2023-12-01T08:00:00Z"), "valid entry");
                   }});

  tests.push_back({"snapshot_document_shape", [] {
                     const auto text = snapshot::serialize_snapshot(
                         {range("2023-12-01T08:00:00+02:00", "2023-12-01T10:00:00+02:00")},
                         ts("2023-12-01T07:00:00Z"));
                     require(text.find(R"("written_at": "2023-12-01T07:00:00Z")") != std::string::npos,
                             text);
                     require(text.find(R"("start": "2023-12-01T08:00:00+02:00")") != std::string::npos,
                             text);
                     require(!snapshot::parse_snapshot(R"({"written_at": "x"})").ok(),
                             "missing 'available' is not a snapshot");
                     const auto empty = snapshot::parse_snapshot(
                         snapshot::serialize_snapshot({}, ts("2023-12-01T07:00:00Z")));
                     require(empty.ok() && empty.value().empty(), "empty list document");
                   }});

  tests.push_back({"snapshot_save_failure_keeps_previous_file", [] {
                     const slotwatch::testing::TempWorkspace workspace;
                     // A directory squatting on the tmp path makes the write fail.
                     const auto path = workspace.path() / "snapshot.json";
                     snapshot::JsonFileSnapshotStore store(path);
                     require(store.save({range("2023-12-01T08:00:00Z", "2023-12-01T09:00:00Z")}).ok(),
                             "initial save");
                     std::filesystem::create_directories(path.string() + ".tmp");

                     const auto failed = store.save({});
                     require(!failed.ok(), "save should fail");
                     require(failed.error().find("snapshot save") != std::string::npos,
                             failed.error());
                     const auto loaded = store.load();
                     require(loaded.ok() && loaded.value().size() == 1, "old snapshot intact");
                   }});
}
