#pragma once

#include "ErrorCodes.hpp"

/**
 * @brief Reply builders for the bridge HTTP API
 *
 * ok() and error() produce the {code, message, data?} envelope; json() sends a
 * body whose shape the caller fixes, e.g. {success, error?} for writes.
 */
class Response {
public:
    using HttpResponsePtr = drogon::HttpResponsePtr;
    using HttpStatusCode = drogon::HttpStatusCode;
    using enum drogon::HttpStatusCode;

    static HttpResponsePtr json(const Json::Value &body, HttpStatusCode status = k200OK) {
        auto resp = drogon::HttpResponse::newHttpJsonResponse(body);
        resp->setStatusCode(status);
        return resp;
    }

    static HttpResponsePtr ok(const Json::Value &data = Json::Value::null, const std::string &message = "Success") {
        auto body = envelope(ErrorCodes::SUCCESS, message);
        if (!data.isNull()) body["data"] = data;
        return json(body);
    }

    static HttpResponsePtr error(int code, const std::string &message, HttpStatusCode status = k400BadRequest) {
        return json(envelope(code, message), status);
    }

    static HttpResponsePtr badRequest(const std::string &message) {
        return error(ErrorCodes::BAD_REQUEST, message);
    }

private:
    static Json::Value envelope(int code, const std::string &message) {
        Json::Value body;
        body["code"] = code;
        body["message"] = message;
        return body;
    }
};
