#pragma once

#include "Bridge.hpp"
#include "common/utils/Response.hpp"

/**
 * @brief HTTP surface of the bridge
 *
 * /command returns the bare {success, error?} body the business system expects;
 * the other routes use the {code, message, data} envelope.
 */
class BridgeController : public drogon::HttpController<BridgeController> {
public:
    using enum drogon::HttpMethod;
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    template<typename T = void> using Task = drogon::Task<T>;

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(BridgeController::command, "/api/bridge/command", Post);
    ADD_METHOD_TO(BridgeController::connectionTest, "/api/bridge/connection-test", Post);
    ADD_METHOD_TO(BridgeController::status, "/api/bridge/status", Get);
    ADD_METHOD_TO(BridgeController::events, "/api/bridge/events", Get);
    ADD_METHOD_TO(BridgeController::reload, "/api/bridge/reload", Post);
    METHOD_LIST_END

    /**
     * @brief {signal_name, value} or {action_name, parameters}
     *
     * Rejections before I/O (unknown signal, read-only kind, bad value) go through
     * the exception handler with their status; device failures are a 200 with
     * success=false.
     */
    Task<HttpResponsePtr> command(HttpRequestPtr req) {
        auto json = req->getJsonObject();
        if (!json) co_return Response::badRequest("Request body must be JSON");

        auto result = co_await Bridge::instance().commands().execute(*json);
        co_return Response::json(result);
    }

    /**
     * @brief Probe a device: {host, port, unit_id?, connection?}
     * When `connection` names a catalogue entry its signals are read too.
     */
    Task<HttpResponsePtr> connectionTest(HttpRequestPtr req) {
        auto json = req->getJsonObject();
        if (!json) co_return Response::badRequest("Request body must be JSON");

        auto& bridge = Bridge::instance();
        ConnectionTester::Request request;
        request.connection = JsonHelper::getString(*json, "connection");
        request.host = JsonHelper::getString(*json, "host");

        auto snapshot = bridge.registry().snapshot();
        const ConnectionPlan* plan = request.connection.empty() ? nullptr
                                                                : snapshot->findConnection(request.connection);
        if (plan) {
            if (request.host.empty()) request.host = plan->connection.host;
            request.port = plan->connection.port;
            request.unitId = plan->connection.unitId;
            for (size_t index : plan->signals) {
                request.signals.push_back(snapshot->signals[index]);
            }
        }

        if (json->isMember("port")) {
            int port = (*json)["port"].asInt();
            if (port <= 0 || port > 65535) co_return Response::badRequest("port must be 1-65535");
            request.port = static_cast<uint16_t>(port);
        }
        if (json->isMember("unit_id")) {
            int unit = (*json)["unit_id"].asInt();
            if (unit < 0 || unit > 255) co_return Response::badRequest("unit_id must be 0-255");
            request.unitId = static_cast<uint8_t>(unit);
        }

        auto result = co_await bridge.tester().test(std::move(request));
        co_return Response::json(result.toJson());
    }

    Task<HttpResponsePtr> status(HttpRequestPtr req) {
        co_return Response::ok(Bridge::instance().status());
    }

    /**
     * @brief Recent events, newest first: ?limit=&type=
     */
    Task<HttpResponsePtr> events(HttpRequestPtr req) {
        size_t limit = 100;
        auto limitParam = req->getParameter("limit");
        if (!limitParam.empty()) {
            int parsed = 0;
            auto [ptr, ec] = std::from_chars(limitParam.data(), limitParam.data() + limitParam.size(), parsed);
            if (ec != std::errc() || parsed <= 0) co_return Response::badRequest("limit must be a positive integer");
            limit = static_cast<size_t>(parsed);
        }

        std::optional<EventType> type;
        auto typeParam = req->getParameter("type");
        if (!typeParam.empty()) {
            type = parseEventType(typeParam);
            if (!type) co_return Response::badRequest("Unknown event type '" + typeParam + "'");
        }

        Json::Value items(Json::arrayValue);
        for (const auto& event : Bridge::instance().events().recent(limit, type)) {
            items.append(event.toJson());
        }
        co_return Response::ok(items);
    }

    /**
     * @brief Reload the catalogue; 503 when the business system is unreachable
     */
    Task<HttpResponsePtr> reload(HttpRequestPtr req) {
        auto& bridge = Bridge::instance();
        co_await bridge.reload();

        auto snapshot = bridge.registry().snapshot();
        Json::Value data;
        data["version"] = static_cast<Json::UInt64>(snapshot->version);
        data["connections"] = static_cast<Json::UInt>(snapshot->connections.size());
        data["signals"] = static_cast<Json::UInt>(snapshot->signals.size());
        data["actions"] = static_cast<Json::UInt>(snapshot->actions.size());
        co_return Response::ok(data, "Catalogue reloaded");
    }
};
