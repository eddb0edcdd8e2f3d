#pragma once

#include "common/utils/AppException.hpp"
#include "common/utils/Constants.hpp"
#include "common/utils/JsonHelper.hpp"

/**
 * @brief REST client for the business system (Frappe)
 *
 * Auth: "Authorization: token <api_key>:<api_secret>".
 * Every failure (transport, non-2xx status, non-JSON body) throws BusinessSystemError.
 */
class FrappeClient {
public:
    template<typename T = void> using Task = drogon::Task<T>;
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using enum drogon::HttpMethod;

    struct Options {
        std::string baseUrl;
        std::string apiKey;
        std::string apiSecret;
        double timeoutSec = Constants::BUSINESS_REQUEST_TIMEOUT_SEC;
    };

    explicit FrappeClient(Options options) : options_(std::move(options)) {}

    const std::string& baseUrl() const { return options_.baseUrl; }

    /**
     * @brief GET /api/resource/<doctype>?filters=..&fields=..
     * @return the "data" array
     */
    Task<Json::Value> listResource(const std::string& doctype,
                                   const Json::Value& filters = Json::Value(Json::arrayValue),
                                   const Json::Value& fields = Json::Value(Json::arrayValue),
                                   int limit = 0) {
        auto req = newRequest(Get, "/api/resource/" + doctype);
        if (!filters.empty()) req->setParameter("filters", JsonHelper::serialize(filters));
        if (!fields.empty()) req->setParameter("fields", JsonHelper::serialize(fields));
        // limit_page_length=0 means "no limit" to Frappe
        req->setParameter("limit_page_length", std::to_string(limit));

        auto body = co_await send(req);
        if (!body["data"].isArray()) {
            throw BusinessSystemError("List of " + doctype + " returned no data array");
        }
        co_return body["data"];
    }

    /**
     * @brief GET /api/resource/<doctype>/<name>, including child tables
     */
    Task<Json::Value> getResource(const std::string& doctype, const std::string& name) {
        auto req = newRequest(Get, "/api/resource/" + doctype + "/" + name);
        auto body = co_await send(req);
        if (!body["data"].isObject()) {
            throw BusinessSystemError(doctype + " '" + name + "' returned no document");
        }
        co_return body["data"];
    }

    /**
     * @brief POST /api/resource/<doctype> (generic record creation)
     */
    Task<Json::Value> insertResource(const std::string& doctype, const Json::Value& doc) {
        auto req = newRequest(Post, "/api/resource/" + doctype);
        req->setContentTypeCode(drogon::CT_APPLICATION_JSON);
        req->setBody(JsonHelper::serialize(doc));
        auto body = co_await send(req);
        co_return body["data"];
    }

    /**
     * @brief POST /api/method/<method>
     * @return the "message" member of the reply
     */
    Task<Json::Value> callMethod(const std::string& method, const Json::Value& args) {
        auto req = newRequest(Post, "/api/method/" + method);
        req->setContentTypeCode(drogon::CT_APPLICATION_JSON);
        req->setBody(JsonHelper::serialize(args));
        auto body = co_await send(req);
        co_return body["message"];
    }

private:
    Options options_;
    std::shared_ptr<drogon::HttpClient> client_;
    std::mutex clientMutex_;

    std::shared_ptr<drogon::HttpClient> client() {
        std::lock_guard<std::mutex> lock(clientMutex_);
        if (!client_) {
            client_ = drogon::HttpClient::newHttpClient(options_.baseUrl);
        }
        return client_;
    }

    HttpRequestPtr newRequest(drogon::HttpMethod method, const std::string& path) {
        auto req = drogon::HttpRequest::newHttpRequest();
        req->setMethod(method);
        req->setPath(path);
        if (!options_.apiKey.empty()) {
            req->addHeader("Authorization", "token " + options_.apiKey + ":" + options_.apiSecret);
        }
        req->addHeader("Accept", "application/json");
        return req;
    }

    Task<Json::Value> send(HttpRequestPtr req) {
        const std::string what = std::string(req->getMethodString()) + " " + req->getPath();
        drogon::HttpResponsePtr resp;
        try {
            resp = co_await client()->sendRequestCoro(req, options_.timeoutSec);
        } catch (const std::exception& e) {
            throw BusinessSystemError(what + " failed: " + e.what());
        }

        auto status = static_cast<int>(resp->getStatusCode());
        if (status < 200 || status >= 300) {
            std::string body(resp->getBody());
            if (body.size() > 200) body = body.substr(0, 200) + "...";
            throw BusinessSystemError(what + " returned HTTP " + std::to_string(status) + ": " + body);
        }

        auto json = resp->getJsonObject();
        if (!json) {
            throw BusinessSystemError(what + " returned a non-JSON body");
        }
        LOG_TRACE << "[Frappe] " << what << " -> " << status;
        co_return *json;
    }
};
