/**
 * VOXRELAY - Realtime Voice Gateway
 * HTTP Routes implementation
 */

#include "server/routes.hpp"

#include "pipeline/message_codec.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

namespace voxrelay::server {

namespace {

constexpr std::string_view log_tag = util::log_component::Server;

constexpr std::string_view index_page = R"(<!DOCTYPE html>
<html>
<head><title>VOXRELAY</title></head>
<body>
<h1>VOXRELAY Realtime Voice Gateway</h1>
<p>Connect a WebSocket client to <code>/ws/voice</code>.</p>
<ul>
<li><a href="/health">/health</a></li>
<li><a href="/stats">/stats</a></li>
</ul>
</body>
</html>
)";

std::string dump(const nlohmann::json& body) {
    return body.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

HttpResponse json_response(http::status status, const nlohmann::json& body) {
    return HttpResponse{
        .status = status,
        .content_type = "application/json",
        .body = dump(body)
    };
}

std::string_view path_of(std::string_view target) {
    auto query = target.find('?');
    return query == std::string_view::npos ? target : target.substr(0, query);
}

} // namespace

RequestHandler make_routes(pipeline::PipelineDispatcher& dispatcher) {
    return [&dispatcher](const HttpRequest& req) -> HttpResponse {
        const auto path = path_of(req.target);

        VOXRELAY_LOG_DEBUG(log_tag, "Request: {} {} Client={}",
                           std::string(http::to_string(req.method)), req.target,
                           req.client_ip.empty() ? "(unknown)" : req.client_ip);

        if (path == "/health" && req.method == http::verb::get) {
            auto health = dispatcher.health();
            // Degraded is still serving; the cache layer fails open
            return json_response(http::status::ok, pipeline::to_json(health));
        }

        if (path == "/stats" && req.method == http::verb::get) {
            return json_response(http::status::ok,
                                 pipeline::stats_report(dispatcher.stats(),
                                                        dispatcher.cache_stats(),
                                                        dispatcher.breaker_status()));
        }

        if (path == "/circuit-breaker/reset" && req.method == http::verb::post) {
            dispatcher.reset_breaker();
            nlohmann::json body = {
                {"status", "reset"},
                {"circuit_breaker", std::string(breaker::to_string(dispatcher.breaker_status().state))}
            };
            return json_response(http::status::ok, body);
        }

        if (path == "/" && req.method == http::verb::get) {
            return HttpResponse{
                .status = http::status::ok,
                .content_type = "text/html; charset=utf-8",
                .body = std::string(index_page)
            };
        }

        return json_response(http::status::not_found, {{"error", "Not found"}});
    };
}

} // namespace voxrelay::server
