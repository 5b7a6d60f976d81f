/**
 * VOXRELAY - Realtime Voice Gateway
 * HTTP Routes - Health, stats and service info
 *
 * GET  /                     service info (HTML)
 * GET  /health               readiness: cache reachability and breaker state
 * GET  /stats                counters, cache layer detail and breaker status
 * POST /circuit-breaker/reset  force the synthesis breaker closed
 */

#ifndef VOXRELAY_SERVER_ROUTES_HPP
#define VOXRELAY_SERVER_ROUTES_HPP

#include "pipeline/dispatcher.hpp"
#include "server/connection.hpp"

namespace voxrelay::server {

/**
 * Build the request handler for plain HTTP requests
 *
 * The dispatcher must outlive the returned handler.
 */
RequestHandler make_routes(pipeline::PipelineDispatcher& dispatcher);

} // namespace voxrelay::server

#endif // VOXRELAY_SERVER_ROUTES_HPP
