/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace DexVault {

struct HttpResponse {
  long status{0};
  std::vector<uint8_t> body;
  std::string error; // transport-level failure, empty when a response arrived

  bool ok() const { return error.empty() && status >= 200 && status < 300; }
  std::string text() const { return std::string(body.begin(), body.end()); }
};

/**
 * @brief Blocking GET transport used by the fetcher and the sprite cache
 *
 * Implementations must be safe to call from several worker threads at once.
 */
class IHttpTransport {
public:
  virtual ~IHttpTransport() = default;
  virtual HttpResponse get(const std::string &url) = 0;
};

/**
 * @brief libcurl transport: follows redirects, accepts compressed bodies
 *
 * Each call uses its own easy handle, so one instance can be shared across
 * threads.
 */
class CurlTransport : public IHttpTransport {
public:
  CurlTransport(long connectTimeoutSeconds, long transferTimeoutSeconds);

  HttpResponse get(const std::string &url) override;

private:
  long m_connectTimeout;
  long m_transferTimeout;
};

} // namespace DexVault

#endif // HTTP_CLIENT_HPP
