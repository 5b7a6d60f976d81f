/**
 * VOXRELAY - Realtime Voice Gateway
 * HTTP Client - Blocking Beast client for backend calls
 *
 * One connection per call, bounded by a single stream deadline that covers
 * resolve, connect, write and read. Failures are classified:
 * - timeout, refused/reset connection, 5xx, 408: TransientBackendError
 * - other 4xx: PermanentBackendError
 *
 * Runs on the pipeline worker threads, never on the I/O threads.
 */

#ifndef VOXRELAY_BACKEND_HTTP_CLIENT_HPP
#define VOXRELAY_BACKEND_HTTP_CLIENT_HPP

#include <boost/beast/http.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace voxrelay::backend {

namespace http = boost::beast::http;

/**
 * Backend endpoint configuration
 */
struct EndpointConfig {
    std::string host{"127.0.0.1"};
    std::uint16_t port{8080};
    std::string path{"/"};
    std::chrono::milliseconds timeout{30000};
    std::string api_key;                        // Empty for no auth header
    std::string api_key_header{"xi-api-key"};
};

/**
 * Successful (2xx) backend response
 */
struct HttpResult {
    http::status status{http::status::ok};
    std::string content_type;
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;
    std::chrono::milliseconds latency{0};

    /**
     * Header value by name (case-insensitive), empty if absent
     */
    std::string header(std::string_view name) const;
};

class HttpClient {
public:
    HttpClient(EndpointConfig config, std::string name);

    /**
     * POST a body to the configured path (plus optional query string)
     *
     * @throws pipeline::TransientBackendError or pipeline::PermanentBackendError
     */
    HttpResult post(const std::string& body, std::string_view content_type,
                    std::string_view query = {}) const;

    /**
     * Map a non-2xx status to the matching backend error
     */
    [[noreturn]] static void raise_for_status(http::status status, std::string_view name,
                                              std::string_view body);

    static bool is_transient_status(http::status status);

    const EndpointConfig& config() const noexcept { return config_; }

    const std::string& name() const noexcept { return name_; }

private:
    EndpointConfig config_;
    std::string name_;
};

} // namespace voxrelay::backend

#endif // VOXRELAY_BACKEND_HTTP_CLIENT_HPP
