#pragma once

#include "slotwatch/common/result.hpp"
#include "slotwatch/config/schema.hpp"
#include "slotwatch/http/client.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace slotwatch::notify {

class Notifier {
public:
  virtual ~Notifier() = default;
  [[nodiscard]] virtual common::Status notify(const std::string &text) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

class TelegramNotifier final : public Notifier {
public:
  explicit TelegramNotifier(
      config::TelegramConfig config,
      std::shared_ptr<http::HttpClient> http_client = std::make_shared<http::CurlHttpClient>());

  [[nodiscard]] common::Status notify(const std::string &text) override;
  [[nodiscard]] std::string_view name() const override;

private:
  [[nodiscard]] common::Status check_api_response(const http::HttpResponse &response,
                                                  std::string_view operation) const;

  config::TelegramConfig config_;
  std::shared_ptr<http::HttpClient> http_client_;
};

} // namespace slotwatch::notify
