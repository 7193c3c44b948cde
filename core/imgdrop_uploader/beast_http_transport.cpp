// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "beast_http_transport.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <functional>
#include <type_traits>

#include "url_utils.hpp"

#define IMGDROP_LOG_COMPONENT "http_transport"
#include <imgdrop_log_macros.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace imgdrop {
namespace uploader {

using imgdrop::logging::kv;

namespace {

using SslStream = beast::ssl_stream<beast::tcp_stream>;

/**
 * Drive resolve -> connect -> (handshake) -> write -> read on ioc, polling the
 * cancellation token and the overall deadline between run_for() slices.
 */
template <class Stream>
HttpResponse runExchange(
  net::io_context& ioc, Stream& stream, const ParsedUrl& url,
  http::request<http::string_body>& req, const HttpRequest& request,
  const CancellationToken& token, const BeastHttpTransport::Config& config
) {
  constexpr bool kUseSsl = std::is_same<Stream, SslStream>::value;

  tcp::resolver resolver(ioc);
  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(config.max_body_bytes);

  auto& lowest = beast::get_lowest_layer(stream);
  const auto deadline = std::chrono::steady_clock::now() + request.timeout;
  auto remaining = [deadline]() {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now()
    );
    return std::max(left, std::chrono::milliseconds(1));
  };

  bool done = false;
  beast::error_code result_ec;
  auto finish = [&](beast::error_code ec) {
    result_ec = ec;
    done = true;
  };

  std::function<void()> send = [&]() {
    lowest.expires_after(remaining());
    http::async_write(stream, req, [&](beast::error_code ec, std::size_t) {
      if (ec) {
        return finish(ec);
      }
      lowest.expires_after(remaining());
      http::async_read(stream, buffer, parser, [&](beast::error_code ec, std::size_t) {
        finish(ec);
      });
    });
  };

  resolver.async_resolve(
    url.host, url.port, [&](beast::error_code ec, tcp::resolver::results_type results) {
      if (ec) {
        return finish(ec);
      }
      lowest.expires_after(remaining());
      lowest.async_connect(results, [&](beast::error_code ec, tcp::endpoint) {
        if (ec) {
          return finish(ec);
        }
        if constexpr (kUseSsl) {
          lowest.expires_after(remaining());
          stream.async_handshake(ssl::stream_base::client, [&](beast::error_code ec) {
            if (ec) {
              return finish(ec);
            }
            send();
          });
        } else {
          send();
        }
      });
    }
  );

  bool timed_out = false;
  bool cancelled = false;
  while (!done) {
    ioc.run_for(config.poll_interval);
    if (done) {
      break;
    }
    if (!cancelled && token.isCancelled()) {
      cancelled = true;
      resolver.cancel();
      lowest.cancel();
    } else if (!timed_out && std::chrono::steady_clock::now() >= deadline) {
      timed_out = true;
      resolver.cancel();
      lowest.cancel();
    }
    if (ioc.stopped() && !done) {
      // Ran out of work without reaching a completion handler
      result_ec = net::error::operation_aborted;
      break;
    }
  }

  HttpResponse response;
  if (cancelled) {
    response.cancelled = true;
    response.error_message = "Request aborted";
  } else if (timed_out || result_ec == beast::error::timeout) {
    response.timed_out = true;
    response.error_message =
      "Request timed out after " + std::to_string(request.timeout.count()) + " ms";
  } else if (result_ec) {
    response.error_message = "Network error: " + result_ec.message();
  } else {
    auto res = parser.release();
    response.completed = true;
    response.status_code = static_cast<int>(res.result_int());
    const auto reason = res.reason();
    const auto content_type = res[http::field::content_type];
    response.reason.assign(reason.data(), reason.size());
    response.content_type.assign(content_type.data(), content_type.size());
    response.body = std::move(res.body());
  }

  // Peers frequently drop the connection without close_notify; just close.
  beast::error_code close_ec;
  lowest.socket().shutdown(tcp::socket::shutdown_both, close_ec);
  lowest.close();
  return response;
}

}  // namespace

BeastHttpTransport::BeastHttpTransport()
    : config_() {}

BeastHttpTransport::BeastHttpTransport(const Config& config)
    : config_(config) {}

HttpResponse BeastHttpTransport::perform(
  const HttpRequest& request, const CancellationToken& token
) {
  auto parsed = parseUrl(request.url);
  if (!parsed) {
    HttpResponse response;
    response.error_message = "Invalid URL format: " + request.url;
    return response;
  }

  http::request<http::string_body> req{
    request.method == HttpMethod::POST ? http::verb::post : http::verb::get, parsed->target, 11
  };
  const bool default_port = (parsed->use_ssl && parsed->port == "443") ||
                            (!parsed->use_ssl && parsed->port == "80");
  req.set(http::field::host, default_port ? parsed->host : parsed->host + ":" + parsed->port);
  req.set(http::field::user_agent, config_.user_agent);
  for (const auto& header : request.headers) {
    req.set(header.first, header.second);
  }
  if (!request.content_type.empty()) {
    req.set(http::field::content_type, request.content_type);
  }
  if (request.method == HttpMethod::POST) {
    req.body() = request.body;
    req.prepare_payload();
  }

  IMGDROP_LOG_DEBUG(
    "HTTP request" << kv("method", request.method == HttpMethod::POST ? "POST" : "GET")
                   << kv("host", parsed->host) << kv("bytes", request.body.size())
                   << kv("timeout_ms", request.timeout.count())
  );

  try {
    net::io_context ioc;
    if (parsed->use_ssl) {
      ssl::context ctx(ssl::context::tls_client);
      ctx.set_default_verify_paths();
      ctx.set_verify_mode(config_.verify_peer ? ssl::verify_peer : ssl::verify_none);

      SslStream stream(ioc, ctx);
      if (!SSL_set_tlsext_host_name(stream.native_handle(), parsed->host.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
        HttpResponse response;
        response.error_message = "Network error: SNI hostname failed: " + ec.message();
        return response;
      }
      return runExchange(ioc, stream, *parsed, req, request, token, config_);
    }

    beast::tcp_stream stream(ioc);
    return runExchange(ioc, stream, *parsed, req, request, token, config_);
  } catch (const std::exception& e) {
    IMGDROP_LOG_WARN("HTTP exchange failed" << kv("host", parsed->host) << kv("error", e.what()));
    HttpResponse response;
    response.error_message = std::string("Network error: ") + e.what();
    return response;
  }
}

}  // namespace uploader
}  // namespace imgdrop
