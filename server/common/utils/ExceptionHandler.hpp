#pragma once

#include "AppException.hpp"
#include "ErrorCodes.hpp"
#include "Response.hpp"

/**
 * @brief Turns exceptions escaping a bridge handler into HTTP replies
 *
 * AppException keeps its own code and status. Device-side failures (3xxx that
 * map to 5xx) are logged as warnings since the bridge itself is healthy;
 * anything else is an internal error.
 */
class AppExceptionHandler {
public:
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    using HttpStatusCode = drogon::HttpStatusCode;
    using enum drogon::HttpStatusCode;

    static void setup() {
        drogon::app().setExceptionHandler([](const std::exception& e,
                                             const HttpRequestPtr& req,
                                             std::function<void(const HttpResponsePtr&)>&& callback) {
            auto [body, status] = toBody(e, req ? req->getPath() : "");
            callback(Response::json(body, status));
        });
    }

    /**
     * @brief Reply body {code, message, status} and HTTP status for an exception
     */
    static std::pair<Json::Value, HttpStatusCode> toBody(const std::exception& e, const std::string& path) {
        Json::Value json;
        HttpStatusCode status = k500InternalServerError;

        if (const auto* appEx = dynamic_cast<const AppException*>(&e)) {
            status = appEx->getStatus();
            json["code"] = appEx->getCode();
            json["message"] = appEx->getMessage();
            if (static_cast<int>(status) >= 500) {
                LOG_WARN << "[HTTP] " << path << ": " << appEx->getMessage();
            }
        } else if (dynamic_cast<const Json::Exception*>(&e)) {
            status = k400BadRequest;
            json["code"] = ErrorCodes::BAD_REQUEST;
            json["message"] = std::string("Malformed JSON: ") + e.what();
        } else {
            LOG_ERROR << "[HTTP] Unhandled exception on " << path << ": " << e.what();
            json["code"] = ErrorCodes::INTERNAL_ERROR;
            json["message"] = "Internal server error";
        }

        json["status"] = static_cast<int>(status);
        return {json, status};
    }
};
