#include "webhook_notifier.hpp"

#include <curl/curl.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <memory>
#include <mutex>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace fleetwatch::notify {

using fleetwatch::observability::IntField;
using fleetwatch::observability::StringField;

namespace {

struct CurlEasyDeleter {
  void operator()(CURL* handle) const {
    curl_easy_cleanup(handle);
  }
};

struct CurlListDeleter {
  void operator()(curl_slist* list) const {
    curl_slist_free_all(list);
  }
};

size_t CollectResponse(char* data, size_t size, size_t count, void* user) {
  auto* out = static_cast<std::string*>(user);
  out->append(data, size * count);
  return size * count;
}

void GlobalInitOnce() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("curl_global_init failed");
    }
  });
}

} // namespace

WebhookNotifier::WebhookNotifier(WebhookOptions options) : options_(std::move(options)) {
  if (options_.url.empty()) {
    throw std::invalid_argument("webhook notifier requires a url");
  }
  GlobalInitOnce();
}

std::string WebhookNotifier::BuildBody(const std::string& recipient, const std::string& message) const {
  google::protobuf::Struct body;
  auto&                    fields = *body.mutable_fields();
  for (const auto& [key, value] : options_.static_fields) {
    fields[key].set_string_value(value);
  }
  fields[options_.recipient_field].set_string_value(recipient);
  fields[options_.message_field].set_string_value(message);

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(body, &json);
  if (!status.ok()) {
    throw std::runtime_error("webhook body serialization failed: " + std::string(status.message()));
  }
  return json;
}

bool WebhookNotifier::Send(const std::string& recipient, const std::string& message) {
  std::string body;
  try {
    body = BuildBody(recipient, message);
  } catch (const std::exception& e) {
    FLEETWATCH_LOG_ERROR("Webhook body build failed", {StringField("recipient", recipient), StringField("error", e.what())});
    return false;
  }

  std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
  if (!curl) {
    FLEETWATCH_LOG_ERROR("Webhook send failed", {StringField("recipient", recipient), StringField("error", "curl_easy_init failed")});
    return false;
  }

  curl_slist* raw_headers = curl_slist_append(nullptr, "Content-Type: application/json");
  for (const auto& [name, value] : options_.headers) {
    raw_headers = curl_slist_append(raw_headers, (name + ": " + value).c_str());
  }
  std::unique_ptr<curl_slist, CurlListDeleter> headers(raw_headers);

  std::string response;
  curl_easy_setopt(curl.get(), CURLOPT_URL, options_.url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, CollectResponse);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  const CURLcode rc = curl_easy_perform(curl.get());
  if (rc != CURLE_OK) {
    FLEETWATCH_LOG_WARN("Webhook send failed", {StringField("recipient", recipient), StringField("error", curl_easy_strerror(rc))});
    return false;
  }

  long http_status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);
  if (http_status < 200 || http_status >= 300) {
    FLEETWATCH_LOG_WARN("Webhook rejected alert",
                        {StringField("recipient", recipient), IntField("http_status", http_status), StringField("response", response)});
    return false;
  }

  FLEETWATCH_LOG_INFO("Webhook alert delivered", {StringField("recipient", recipient), IntField("http_status", http_status)});
  return true;
}

} // namespace fleetwatch::notify
