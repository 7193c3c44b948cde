// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_BEAST_HTTP_TRANSPORT_HPP
#define IMGDROP_BEAST_HTTP_TRANSPORT_HPP

#include <chrono>
#include <cstdint>
#include <string>

#include "http_transport.hpp"

namespace imgdrop {
namespace uploader {

/**
 * IHttpTransport over Boost.Beast, with OpenSSL for https.
 *
 * Each perform() runs its own io_context on the calling thread. The request
 * deadline covers resolve, connect, handshake, write and read; the
 * cancellation token is polled while the exchange runs.
 */
class BeastHttpTransport : public IHttpTransport {
public:
  struct Config {
    std::string user_agent = "imgdrop/1.0";
    bool verify_peer = true;
    std::uint64_t max_body_bytes = 64ull * 1024 * 1024;
    std::chrono::milliseconds poll_interval{50};
  };

  BeastHttpTransport();
  explicit BeastHttpTransport(const Config& config);
  ~BeastHttpTransport() override = default;

  HttpResponse perform(const HttpRequest& request, const CancellationToken& token) override;

private:
  Config config_;
};

}  // namespace uploader
}  // namespace imgdrop

#endif  // IMGDROP_BEAST_HTTP_TRANSPORT_HPP
