#pragma once

#include "ErrorCodes.hpp"

/**
 * @brief Base application exception
 */
class AppException : public std::exception {
public:
    using HttpStatusCode = drogon::HttpStatusCode;
    using enum drogon::HttpStatusCode;

private:
    int code_;
    std::string message_;
    HttpStatusCode status_;

public:
    AppException(int code, std::string message, HttpStatusCode status = k400BadRequest)
        : code_(code), message_(std::move(message)), status_(status) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    int getCode() const { return code_; }
    const std::string& getMessage() const { return message_; }
    HttpStatusCode getStatus() const { return status_; }
};

/**
 * Code ranges:
 * 1xxx - generic request errors
 * 3xxx - bridge errors (address, catalogue, device session, command)
 */

/**
 * @brief Generic - resource not found
 */
class NotFoundException : public AppException {
public:
    explicit NotFoundException(const std::string& message = "Resource not found")
        : AppException(ErrorCodes::NOT_FOUND, message, k404NotFound) {}
};

/**
 * @brief Generic - validation failed
 */
class ValidationException : public AppException {
public:
    explicit ValidationException(const std::string& message = "Validation failed")
        : AppException(ErrorCodes::BAD_REQUEST, message, k400BadRequest) {}
};

/**
 * @brief Generic - service is shutting down or not ready yet
 */
class ServiceUnavailableException : public AppException {
public:
    explicit ServiceUnavailableException(const std::string& message = "Service unavailable")
        : AppException(ErrorCodes::SERVICE_UNAVAILABLE, message, k503ServiceUnavailable) {}
};

// ==================== Address translation ====================

/** Malformed hierarchical address, prefix/kind mismatch or out-of-range linear index */
class AddressFormatError : public AppException {
public:
    explicit AddressFormatError(const std::string& message)
        : AppException(ErrorCodes::ADDRESS_FORMAT, message, k400BadRequest) {}
};

class UnknownSignalKindError : public AppException {
public:
    explicit UnknownSignalKindError(const std::string& message)
        : AppException(ErrorCodes::UNKNOWN_SIGNAL_KIND, message, k400BadRequest) {}
};

// ==================== Catalogue ====================

/**
 * @brief The business system could not deliver the catalogue
 * The registry keeps serving its last good snapshot.
 */
class CatalogueUnavailableError : public AppException {
public:
    explicit CatalogueUnavailableError(const std::string& message)
        : AppException(ErrorCodes::CATALOGUE_UNAVAILABLE, message, k503ServiceUnavailable) {}
};

// ==================== Device session ====================

class ConnectionError : public AppException {
public:
    explicit ConnectionError(const std::string& message)
        : AppException(ErrorCodes::CONNECTION_FAILED, message, k502BadGateway) {}

protected:
    ConnectionError(int code, const std::string& message, HttpStatusCode status)
        : AppException(code, message, status) {}
};

/** An exchange got no response within the request timeout */
class TimeoutError : public ConnectionError {
public:
    explicit TimeoutError(const std::string& message)
        : ConnectionError(ErrorCodes::EXCHANGE_TIMEOUT, message, k504GatewayTimeout) {}
};

/**
 * @brief Device-reported Modbus exception
 */
class ProtocolError : public AppException {
public:
    ProtocolError(const std::string& message, uint8_t exceptionCode)
        : AppException(ErrorCodes::PROTOCOL_EXCEPTION, message, k502BadGateway),
          exceptionCode_(exceptionCode) {}

    uint8_t exceptionCode() const { return exceptionCode_; }

private:
    uint8_t exceptionCode_;
};

// ==================== Command ====================

class NotWritableError : public AppException {
public:
    explicit NotWritableError(const std::string& message)
        : AppException(ErrorCodes::NOT_WRITABLE, message, k400BadRequest) {}
};

// ==================== Business system ====================

/** Business system REST call failed (transport, status or body) */
class BusinessSystemError : public AppException {
public:
    explicit BusinessSystemError(const std::string& message)
        : AppException(ErrorCodes::EXTERNAL_SERVICE_ERROR, message, k502BadGateway) {}
};
