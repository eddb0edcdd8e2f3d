#pragma once

/**
 * @brief Error code table
 *
 * - 0: success
 * - 1xxx: client errors (bad parameters, missing resources)
 * - 3xxx: bridge errors
 * - 5xxx: internal errors
 */
namespace ErrorCodes {

// ==================== Success ====================

inline constexpr int SUCCESS = 0;

// ==================== Client errors (1xxx) ====================

/** Resource not found */
inline constexpr int NOT_FOUND = 1001;

/** Bad request parameters */
inline constexpr int BAD_REQUEST = 1002;

// ==================== Bridge errors (3xxx) ====================

/** Malformed hierarchical address */
inline constexpr int ADDRESS_FORMAT = 3001;

/** Signal kind missing from the prefix table */
inline constexpr int UNKNOWN_SIGNAL_KIND = 3002;

/** Business system unreachable while loading the catalogue */
inline constexpr int CATALOGUE_UNAVAILABLE = 3101;

/** Device connection failed or is not established */
inline constexpr int CONNECTION_FAILED = 3201;

/** Device exchange timed out */
inline constexpr int EXCHANGE_TIMEOUT = 3202;

/** Device answered with a Modbus exception */
inline constexpr int PROTOCOL_EXCEPTION = 3203;

/** Write attempted on a read-only signal kind */
inline constexpr int NOT_WRITABLE = 3301;

// ==================== Server errors (5xxx) ====================

inline constexpr int INTERNAL_ERROR = 5000;

/** Business system call failed */
inline constexpr int EXTERNAL_SERVICE_ERROR = 5002;

/** Shutting down or not started */
inline constexpr int SERVICE_UNAVAILABLE = 5003;

}  // namespace ErrorCodes
