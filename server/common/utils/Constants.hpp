#pragma once

/**
 * @brief Global constants
 *
 * Keeps the project's magic numbers in one place
 */
namespace Constants {

// ==================== Logging ====================

/** Request body log truncation length */
inline constexpr int REQUEST_LOG_MAX_LENGTH = 1000;

// ==================== Polling ====================

/** Default poll interval (ms) */
inline constexpr int DEFAULT_POLL_INTERVAL_MS = 1000;

/** Lower bound for any poll interval (ms) */
inline constexpr int MIN_POLL_INTERVAL_MS = 50;

/** Per-exchange response timeout (ms) */
inline constexpr int DEFAULT_REQUEST_TIMEOUT_MS = 3000;

/** Gap (in addresses) still merged into one batch read; 0 = contiguous only */
inline constexpr int DEFAULT_BATCH_MAX_GAP = 0;

// ==================== Modbus limits ====================

/** Bits per read request (FC01/FC02) */
inline constexpr int MAX_BITS_PER_READ = 2000;

/** Registers per read request (FC03/FC04) */
inline constexpr int MAX_REGISTERS_PER_READ = 125;

/** Highest linear address on the wire */
inline constexpr uint32_t MAX_LINEAR_ADDRESS = 65535;

/** Default Modbus unit identifier */
inline constexpr int DEFAULT_UNIT_ID = 1;

// ==================== Address translation ====================

/** Bits per hierarchical major component */
inline constexpr uint32_t ADDRESS_BITS_PER_MAJOR = 8;

/** Highest linear address of the primary coil/contact range */
inline constexpr uint32_t SLAVE_ADDRESS_THRESHOLD = 799;

// ==================== Reconnect policy ====================

/** Session reconnect base delay (s) */
inline constexpr double RECONNECT_BASE_DELAY_SEC = 1.0;

/** Session reconnect cap (s) */
inline constexpr double RECONNECT_MAX_DELAY_SEC = 30.0;

/** Reconnect jitter (+/-20%) */
inline constexpr double RECONNECT_JITTER_RATIO = 0.2;

// ==================== Catalogue ====================

/** Retry period while the first catalogue load keeps failing (s) */
inline constexpr int CATALOGUE_RETRY_SEC = 10;

// ==================== Event log ====================

/** Events kept in memory for /api/bridge/events */
inline constexpr size_t EVENT_LOG_CAPACITY = 500;

// ==================== Redis channels ====================

inline constexpr const char* CHANNEL_SIGNAL_UPDATE = "plc:signal_update";
inline constexpr const char* CHANNEL_STATUS = "plc:status";
inline constexpr const char* CHANNEL_COMMAND = "plc:command";

// ==================== Business system doctypes ====================

inline constexpr const char* DOCTYPE_CONNECTION = "Modbus Connection";
inline constexpr const char* DOCTYPE_ACTION = "Modbus Action";
inline constexpr const char* DOCTYPE_EVENT = "Modbus Event";

/** Business system REST timeout (s) */
inline constexpr double BUSINESS_REQUEST_TIMEOUT_SEC = 10.0;

}  // namespace Constants
