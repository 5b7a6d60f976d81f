/**
 * VOXRELAY - Realtime Voice Gateway
 * HTTP Client implementation
 */

#include "backend/http_client.hpp"

#include "pipeline/errors.hpp"
#include "util/logger.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>

#include <algorithm>
#include <cctype>
#include <limits>

namespace voxrelay::backend {

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;
using util::log_component::Backend;

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

// Error bodies can be large; keep log lines short
std::string excerpt(std::string_view body) {
    constexpr std::size_t max_length = 200;
    if (body.size() <= max_length) {
        return std::string(body);
    }
    return std::string(body.substr(0, max_length)) + "...";
}

} // namespace

std::string HttpResult::header(std::string_view name) const {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return value;
        }
    }
    return {};
}

HttpClient::HttpClient(EndpointConfig config, std::string name)
    : config_(std::move(config))
    , name_(std::move(name))
{
    VOXRELAY_LOG_INFO(Backend, "{} backend: http://{}:{}{} (timeout={}ms)",
                      name_, config_.host, config_.port, config_.path, config_.timeout.count());
}

HttpResult HttpClient::post(const std::string& body, std::string_view content_type,
                            std::string_view query) const {
    auto start_time = std::chrono::steady_clock::now();

    std::string target = config_.path;
    if (!query.empty()) {
        target += '?';
        target += query;
    }

    http::request<http::string_body> request{http::verb::post, target, 11};
    request.set(http::field::host, config_.host + ":" + std::to_string(config_.port));
    request.set(http::field::user_agent, "voxrelay");
    request.set(http::field::content_type, beast::string_view(content_type.data(), content_type.size()));
    request.set(http::field::connection, "close");
    if (!config_.api_key.empty()) {
        request.set(config_.api_key_header, config_.api_key);
    }
    request.body() = body;
    request.prepare_payload();

    http::response<http::string_body> response;

    try {
        asio::io_context io_context;
        tcp::resolver resolver(io_context);
        beast::tcp_stream stream(io_context);
        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(std::numeric_limits<std::uint64_t>::max());

        beast::error_code result_ec;
        bool done = false;
        auto finish = [&](beast::error_code ec) {
            if (!done) {
                done = true;
                result_ec = ec;
            }
        };

        // One deadline covers the whole exchange; it only applies to async operations
        stream.expires_after(config_.timeout);

        resolver.async_resolve(config_.host, std::to_string(config_.port),
            [&](beast::error_code ec, tcp::resolver::results_type endpoints) {
                if (ec) {
                    return finish(ec);
                }
                stream.async_connect(endpoints,
                    [&](beast::error_code ec, const tcp::endpoint&) {
                        if (ec) {
                            return finish(ec);
                        }
                        http::async_write(stream, request,
                            [&](beast::error_code ec, std::size_t) {
                                if (ec) {
                                    return finish(ec);
                                }
                                http::async_read(stream, buffer, parser,
                                    [&](beast::error_code ec, std::size_t) {
                                        finish(ec);
                                    });
                            });
                    });
            });

        io_context.run_for(config_.timeout);

        if (!done) {
            // Resolve is not covered by the stream timer
            finish(beast::error::timeout);
            resolver.cancel();
            stream.cancel();
            io_context.restart();
            io_context.run();
        }

        if (result_ec) {
            throw beast::system_error(result_ec);
        }
        response = parser.release();

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    } catch (const beast::system_error& e) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (e.code() == beast::error::timeout) {
            VOXRELAY_LOG_WARN(Backend, "{}: timeout after {}ms", name_, elapsed.count());
            throw pipeline::TransientBackendError(name_ + " backend timed out");
        }
        if (e.code() == asio::error::connection_refused ||
            e.code() == asio::error::connection_reset ||
            e.code() == asio::error::broken_pipe) {
            VOXRELAY_LOG_WARN(Backend, "{}: connection error: {}", name_, e.code().message());
            throw pipeline::TransientBackendError(name_ + " backend connection failed: " +
                                                  e.code().message());
        }
        VOXRELAY_LOG_WARN(Backend, "{}: communication error: {}", name_, e.code().message());
        throw pipeline::TransientBackendError(name_ + " backend communication error: " +
                                              e.code().message());
    }

    HttpResult result;
    result.status = response.result();
    result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (http::to_status_class(result.status) != http::status_class::successful) {
        raise_for_status(result.status, name_, response.body());
    }

    if (auto it = response.find(http::field::content_type); it != response.end()) {
        result.content_type = std::string(it->value());
    }
    for (const auto& field : response) {
        result.headers.emplace_back(std::string(field.name_string()), std::string(field.value()));
    }
    result.body = std::move(response.body());

    VOXRELAY_LOG_DEBUG(Backend, "{}: {} in {}ms ({} bytes)", name_,
                       static_cast<unsigned>(result.status), result.latency.count(),
                       result.body.size());
    return result;
}

bool HttpClient::is_transient_status(http::status status) {
    return http::to_status_class(status) == http::status_class::server_error ||
           status == http::status::request_timeout;
}

void HttpClient::raise_for_status(http::status status, std::string_view name,
                                  std::string_view body) {
    auto code = static_cast<unsigned>(status);
    std::string message = std::string(name) + " backend returned HTTP " + std::to_string(code);

    if (is_transient_status(status)) {
        VOXRELAY_LOG_WARN(Backend, "{}: HTTP {}: {}", name, code, excerpt(body));
        throw pipeline::TransientBackendError(message);
    }

    VOXRELAY_LOG_ERROR(Backend, "{}: HTTP {} rejected: {}", name, code, excerpt(body));
    throw pipeline::PermanentBackendError(message);
}

} // namespace voxrelay::backend
