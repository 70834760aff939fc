#include "pairgate/common/http_client.hpp"

#include "pairgate/common/fs.hpp"
#include "pairgate/version.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <memory>

namespace pairgate::common {

namespace {

struct EasyDeleter {
  void operator()(CURL *handle) const { curl_easy_cleanup(handle); }
};
struct SlistDeleter {
  void operator()(curl_slist *list) const { curl_slist_free_all(list); }
};
using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

size_t append_body(char *ptr, size_t size, size_t nmemb, void *userdata) {
  static_cast<std::string *>(userdata)->append(ptr, size * nmemb);
  return size * nmemb;
}

// Headers of the final response only; an interim "HTTP/1.1 100" block is discarded.
size_t collect_header(char *buffer, size_t size, size_t nitems, void *userdata) {
  const std::string line(buffer, size * nitems);
  auto &headers = *static_cast<HeaderMap *>(userdata);
  if (starts_with(line, "HTTP/")) {
    headers.clear();
    return line.size();
  }
  if (const auto colon = line.find(':'); colon != std::string::npos) {
    headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
  }
  return line.size();
}

bool has_header(const HeaderMap &headers, const std::string &name) {
  return std::any_of(headers.begin(), headers.end(),
                     [&](const auto &entry) { return to_lower(entry.first) == name; });
}

HeaderList build_header_list(const HeaderMap &headers, const bool has_body) {
  curl_slist *list = nullptr;
  for (const auto &[key, value] : headers) {
    list = curl_slist_append(list, (key + ": " + value).c_str());
  }
  if (has_body && !has_header(headers, "content-type")) {
    list = curl_slist_append(list, "Content-Type: application/json");
  }
  return HeaderList(list);
}

} // namespace

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpClientResponse CurlHttpClient::request(const std::string &method, const std::string &url,
                                           const HeaderMap &headers,
                                           const std::optional<std::string> &body,
                                           const std::uint64_t timeout_ms) {
  HttpClientResponse response;
  EasyHandle curl(curl_easy_init());
  if (!curl) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  const std::string user_agent = std::string("pairgate/") + VERSION;
  CURL *handle = curl.get();
  curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle, CURLOPT_USERAGENT, user_agent.c_str());
  curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, append_body);
  curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, collect_header);
  curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response.headers);

  if (body) {
    curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    curl_easy_setopt(handle, CURLOPT_POSTFIELDS, body->data());
  }
  if (method != "GET" || body) {
    curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, method.c_str());
  }
  const HeaderList header_list = build_header_list(headers, body.has_value());
  if (header_list) {
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list.get());
  }

  if (const CURLcode code = curl_easy_perform(handle); code != CURLE_OK) {
    response.network_error = true;
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
    response.network_error_message = curl_easy_strerror(code);
    return response;
  }
  long status = 0;
  curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
  response.status = static_cast<std::uint16_t>(status);
  return response;
}

} // namespace pairgate::common
