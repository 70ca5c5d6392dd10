#pragma once

#include "slotwatch/availability/time_range.hpp"
#include "slotwatch/common/result.hpp"
#include "slotwatch/common/time.hpp"
#include "slotwatch/config/schema.hpp"
#include "slotwatch/http/client.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace slotwatch::source {

struct FetchWindow {
  common::Timestamp begin;
  common::Timestamp end;
};

struct SourceData {
  std::vector<availability::OpeningHours> openings;
  std::vector<availability::TimeRange> reservations;
};

class SourceClient {
public:
  virtual ~SourceClient() = default;
  [[nodiscard]] virtual common::Result<SourceData> fetch(const FetchWindow &window) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Reads opening hours and reservations of one resource from a Respa API.
class RespaSourceClient final : public SourceClient {
public:
  explicit RespaSourceClient(
      config::SourceConfig config,
      std::shared_ptr<http::HttpClient> http_client = std::make_shared<http::CurlHttpClient>());

  [[nodiscard]] common::Result<SourceData> fetch(const FetchWindow &window) override;
  [[nodiscard]] std::string_view name() const override;

  [[nodiscard]] std::string resource_url(const FetchWindow &window) const;

private:
  config::SourceConfig config_;
  std::shared_ptr<http::HttpClient> http_client_;
};

/// Parse a Respa resource document. Any malformed opening or reservation rejects the payload.
[[nodiscard]] common::Result<SourceData> parse_respa_resource(const std::string &body);

[[nodiscard]] FetchWindow make_fetch_window(const common::Timestamp &now,
                                            std::uint32_t lookahead_days);

} // namespace slotwatch::source
