// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_HTTP_TRANSPORT_HPP
#define IMGDROP_HTTP_TRANSPORT_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace imgdrop {
namespace uploader {

enum class HttpMethod { GET, POST };

struct HttpRequest {
  HttpMethod method = HttpMethod::GET;
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string content_type;  // Empty for bodiless requests
  std::string body;
  std::chrono::milliseconds timeout{30000};  // Whole exchange, resolve to last byte
};

/**
 * Result of one HTTP exchange.
 *
 * completed is true whenever a status line was received, including non-2xx.
 * Otherwise error_message describes the transport failure.
 */
struct HttpResponse {
  bool completed = false;
  int status_code = 0;
  std::string reason;
  std::string content_type;
  std::string body;
  bool timed_out = false;
  bool cancelled = false;
  std::string error_message;

  bool ok() const {
    return completed && status_code >= 200 && status_code < 300;
  }
};

/**
 * Cooperative cancellation flag shared between the caller and in-flight requests.
 * Copies observe the same flag.
 */
class CancellationToken {
public:
  CancellationToken()
      : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const {
    flag_->store(true);
  }

  bool isCancelled() const {
    return flag_->load();
  }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * One-shot HTTP client seam. Implementations never retry and never throw for
 * network failures; everything is reported through HttpResponse.
 */
class IHttpTransport {
public:
  virtual ~IHttpTransport() = default;

  virtual HttpResponse perform(const HttpRequest& request, const CancellationToken& token) = 0;
};

}  // namespace uploader
}  // namespace imgdrop

#endif  // IMGDROP_HTTP_TRANSPORT_HPP
