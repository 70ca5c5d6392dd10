#include "slotwatch/source/source_client.hpp"

#include "slotwatch/common/fs.hpp"
#include "slotwatch/common/json_util.hpp"

#include <chrono>
#include <iostream>

namespace slotwatch::source {

namespace {

using common::JsonFlatMap;
using common::JsonKind;
using common::Result;

Result<common::Timestamp> required_timestamp(const JsonFlatMap &object, const std::string &field) {
  const auto it = object.find(field);
  if (it == object.end() || !it->second.is_string()) {
    return Result<common::Timestamp>::failure("missing '" + field + "'");
  }
  return common::parse_rfc3339(it->second.text);
}

Result<availability::OpeningHours> parse_opening(const std::string &object_json) {
  const auto parsed = common::json_parse_flat(object_json);
  if (!parsed.ok()) {
    return Result<availability::OpeningHours>::failure(parsed.error());
  }
  const auto &object = parsed.value();

  availability::OpeningHours opening;
  const auto date_it = object.find("date");
  if (date_it == object.end() || !date_it->second.is_string()) {
    return Result<availability::OpeningHours>::failure("opening without 'date'");
  }
  opening.date = date_it->second.text;

  const auto opens_it = object.find("opens");
  const auto closes_it = object.find("closes");
  const bool has_opens = opens_it != object.end() && !opens_it->second.is_null();
  const bool has_closes = closes_it != object.end() && !closes_it->second.is_null();
  if (!has_opens || !has_closes) {
    // Closed that day.
    return Result<availability::OpeningHours>::success(std::move(opening));
  }

  auto opens = required_timestamp(object, "opens");
  if (!opens.ok()) {
    return Result<availability::OpeningHours>::failure(opening.date + ": " + opens.error());
  }
  auto closes = required_timestamp(object, "closes");
  if (!closes.ok()) {
    return Result<availability::OpeningHours>::failure(opening.date + ": " + closes.error());
  }
  availability::TimeRange window{.start = opens.value(), .end = closes.value()};
  if (!window.valid()) {
    return Result<availability::OpeningHours>::failure(opening.date +
                                                       ": opening hours end before they start");
  }
  opening.window = window;
  return Result<availability::OpeningHours>::success(std::move(opening));
}

Result<availability::TimeRange> parse_reservation(const std::string &object_json) {
  const auto parsed = common::json_parse_flat(object_json);
  if (!parsed.ok()) {
    return Result<availability::TimeRange>::failure(parsed.error());
  }
  auto begin = required_timestamp(parsed.value(), "begin");
  if (!begin.ok()) {
    return Result<availability::TimeRange>::failure("reservation: " + begin.error());
  }
  auto end = required_timestamp(parsed.value(), "end");
  if (!end.ok()) {
    return Result<availability::TimeRange>::failure("reservation: " + end.error());
  }
  availability::TimeRange range{.start = begin.value(), .end = end.value()};
  if (!range.valid()) {
    return Result<availability::TimeRange>::failure(
        "reservation ends before it begins: " + common::format_rfc3339(range.start));
  }
  return Result<availability::TimeRange>::success(range);
}

} // namespace

RespaSourceClient::RespaSourceClient(config::SourceConfig config,
                                     std::shared_ptr<http::HttpClient> http_client)
    : config_(std::move(config)), http_client_(std::move(http_client)) {}

std::string_view RespaSourceClient::name() const { return "respa"; }

std::string RespaSourceClient::resource_url(const FetchWindow &window) const {
  std::string base = common::trim(config_.base_url);
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + "/resource/" + common::trim(config_.resource_id) +
         "/?start=" + common::format_rfc3339_utc(window.begin) +
         "&end=" + common::format_rfc3339_utc(window.end) + "&format=json";
}

Result<SourceData> RespaSourceClient::fetch(const FetchWindow &window) {
  if (http_client_ == nullptr) {
    return Result<SourceData>::failure("respa http client unavailable");
  }

  const std::string url = resource_url(window);
  const auto response =
      http_client_->get(url, {{"Accept", "application/json"}}, config_.timeout_ms);
  if (!response.is_success()) {
    return Result<SourceData>::failure("respa fetch failed " + http::describe_failure(response));
  }

  auto parsed = parse_respa_resource(response.body);
  if (!parsed.ok()) {
    std::cerr << "[respa] rejected payload from " << url << ": " << parsed.error() << "\n";
    return Result<SourceData>::failure("respa payload invalid: " + parsed.error());
  }
  return parsed;
}

Result<SourceData> parse_respa_resource(const std::string &body) {
  const auto document = common::json_parse_flat(body);
  if (!document.ok()) {
    return Result<SourceData>::failure(document.error());
  }
  const auto &root = document.value();

  SourceData data;

  const auto openings_it = root.find("opening_hours");
  if (openings_it == root.end() || openings_it->second.kind != JsonKind::Array) {
    return Result<SourceData>::failure("missing 'opening_hours' array");
  }
  const auto openings = common::json_split_top_level_objects(openings_it->second.text);
  if (!openings.ok()) {
    return Result<SourceData>::failure("opening_hours: " + openings.error());
  }
  for (const auto &object_json : openings.value()) {
    auto opening = parse_opening(object_json);
    if (!opening.ok()) {
      return Result<SourceData>::failure("opening_hours: " + opening.error());
    }
    data.openings.push_back(std::move(opening.value()));
  }

  const auto reservations_it = root.find("reservations");
  if (reservations_it == root.end() || reservations_it->second.is_null()) {
    return Result<SourceData>::success(std::move(data));
  }
  if (reservations_it->second.kind != JsonKind::Array) {
    return Result<SourceData>::failure("'reservations' is not an array");
  }
  const auto reservations = common::json_split_top_level_objects(reservations_it->second.text);
  if (!reservations.ok()) {
    return Result<SourceData>::failure("reservations: " + reservations.error());
  }
  for (const auto &object_json : reservations.value()) {
    auto reservation = parse_reservation(object_json);
    if (!reservation.ok()) {
      return Result<SourceData>::failure(reservation.error());
    }
    data.reservations.push_back(reservation.value());
  }

  return Result<SourceData>::success(std::move(data));
}

FetchWindow make_fetch_window(const common::Timestamp &now, const std::uint32_t lookahead_days) {
  const auto span = std::chrono::hours(24) * static_cast<int>(lookahead_days);
  return FetchWindow{.begin = now,
                     .end = now.shifted(std::chrono::duration_cast<std::chrono::seconds>(span))};
}

} // namespace slotwatch::source
