/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "net/HttpClient.hpp"
#include "core/Logger.hpp"
#include <curl/curl.h>
#include <format>
#include <memory>
#include <mutex>

namespace DexVault {

namespace {

size_t appendToBody(void *contents, size_t size, size_t nmemb, void *userp) {
  const size_t bytes = size * nmemb;
  auto *body = static_cast<std::vector<uint8_t> *>(userp);
  const auto *data = static_cast<const uint8_t *>(contents);
  body->insert(body->end(), data, data + bytes);
  return bytes;
}

void ensureCurlGlobalInit() {
  static std::once_flag once;
  std::call_once(once, []() {
    CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (code != CURLE_OK) {
      HTTP_CRITICAL(std::format("curl_global_init failed: {}", curl_easy_strerror(code)));
    }
  });
}

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

} // namespace

CurlTransport::CurlTransport(long connectTimeoutSeconds, long transferTimeoutSeconds)
    : m_connectTimeout(connectTimeoutSeconds),
      m_transferTimeout(transferTimeoutSeconds) {
  ensureCurlGlobalInit();
}

HttpResponse CurlTransport::get(const std::string &url) {
  HttpResponse response;

  CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    response.error = "curl_easy_init failed";
    HTTP_ERROR(response.error);
    return response;
  }

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
  curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, DEXVAULT_APP_NAME "/1.0");
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, appendToBody);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, m_connectTimeout);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, m_transferTimeout);
  // Worker threads must not receive SIGALRM from the resolver
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  const CURLcode code = curl_easy_perform(curl.get());
  if (code != CURLE_OK) {
    response.error = curl_easy_strerror(code);
    response.body.clear();
    HTTP_DEBUG(std::format("GET {} failed: {}", url, response.error));
    return response;
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  HTTP_DEBUG(std::format("GET {} -> {} ({} bytes)", url, response.status,
                         response.body.size()));
  return response;
}

} // namespace DexVault
