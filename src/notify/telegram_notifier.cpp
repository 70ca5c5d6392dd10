#include "slotwatch/notify/notifier.hpp"

#include "slotwatch/common/fs.hpp"
#include "slotwatch/common/json_util.hpp"

#include <sstream>

namespace slotwatch::notify {

namespace {

constexpr std::size_t kBodySnippetLimit = 240;

std::string api_root(const std::string &api_base) {
  std::string base = common::trim(api_base);
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base;
}

} // namespace

TelegramNotifier::TelegramNotifier(config::TelegramConfig config,
                                   std::shared_ptr<http::HttpClient> http_client)
    : config_(std::move(config)), http_client_(std::move(http_client)) {}

std::string_view TelegramNotifier::name() const { return "telegram"; }

common::Status TelegramNotifier::notify(const std::string &text) {
  if (http_client_ == nullptr) {
    return common::Status::error("telegram http client unavailable");
  }
  const std::string token = common::trim(config_.bot_token);
  if (token.empty()) {
    return common::Status::error("telegram bot_token is required");
  }
  const std::string chat_id = common::trim(config_.chat_id);
  if (chat_id.empty()) {
    return common::Status::error("telegram chat_id is required");
  }
  if (common::trim(text).empty()) {
    return common::Status::error("text is required");
  }

  std::ostringstream body;
  body << "{";
  body << "\"chat_id\":\"" << common::json_escape(chat_id) << "\",";
  body << "\"text\":\"" << common::json_escape(text) << "\"";
  body << "}";

  const auto response =
      http_client_->post_json(api_root(config_.api_base) + "/bot" + token + "/sendMessage",
                              {{"Content-Type", "application/json"}}, body.str(),
                              config_.timeout_ms);
  return check_api_response(response, "sendMessage");
}

common::Status TelegramNotifier::check_api_response(const http::HttpResponse &response,
                                                    const std::string_view operation) const {
  if (response.timeout) {
    return common::Status::error(std::string(operation) + " timeout");
  }
  if (response.network_error) {
    return common::Status::error(std::string(operation) + " network error: " +
                                 response.network_error_message);
  }
  if (response.status >= 400) {
    std::string snippet = common::trim(response.body);
    if (snippet.size() > kBodySnippetLimit) {
      snippet.resize(kBodySnippetLimit);
    }
    return common::Status::error(std::string(operation) + " failed status=" +
                                 std::to_string(response.status) + " body=" + snippet);
  }
  if (response.status < 200 || response.status >= 300) {
    return common::Status::error(std::string(operation) + " unexpected status=" +
                                 std::to_string(response.status));
  }

  const auto document = common::json_parse_flat(response.body);
  if (!document.ok()) {
    return common::Status::error(std::string(operation) + " unreadable response: " +
                                 document.error());
  }
  const auto ok_it = document.value().find("ok");
  if (ok_it == document.value().end() || ok_it->second.kind != common::JsonKind::Bool ||
      ok_it->second.text != "true") {
    return common::Status::error(std::string(operation) + " response missing ok=true");
  }
  return common::Status::success();
}

} // namespace slotwatch::notify
