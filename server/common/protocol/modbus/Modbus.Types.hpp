#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace modbus {

// ==================== Enums ====================

/** Modbus data table */
enum class RegisterType {
    COIL,               // FC01 Read Coils
    DISCRETE_INPUT,     // FC02 Read Discrete Inputs
    HOLDING_REGISTER,   // FC03 Read Holding Registers
    INPUT_REGISTER      // FC04 Read Input Registers
};

// ==================== Function codes ====================

struct FuncCodes {
    static constexpr uint8_t READ_COILS = 0x01;
    static constexpr uint8_t READ_DISCRETE_INPUTS = 0x02;
    static constexpr uint8_t READ_HOLDING_REGISTERS = 0x03;
    static constexpr uint8_t READ_INPUT_REGISTERS = 0x04;
    static constexpr uint8_t WRITE_SINGLE_COIL = 0x05;
    static constexpr uint8_t WRITE_SINGLE_REGISTER = 0x06;
    static constexpr uint8_t WRITE_MULTIPLE_REGISTERS = 0x10;
};

// ==================== Frames ====================

/** Read request (FC01-04) */
struct ModbusRequest {
    uint8_t slaveId;
    uint8_t functionCode;
    uint16_t startAddress;
    uint16_t quantity;
    uint16_t transactionId = 0;
};

/** Write request (FC05/06/10) */
struct ModbusWriteRequest {
    uint8_t slaveId;
    uint8_t functionCode;
    uint16_t address;
    std::vector<uint8_t> data;    // big-endian payload, 0/1 for FC05
    uint16_t quantity = 1;        // register count (FC10)
    uint16_t transactionId = 0;
};

/** Parsed response */
struct ModbusResponse {
    uint8_t slaveId = 0;
    uint8_t functionCode = 0;
    std::vector<uint8_t> data;    // read: payload after ByteCount; write: echoed Addr+Value
    bool isException = false;
    uint8_t exceptionCode = 0;
    uint16_t transactionId = 0;
};

// ==================== Batch planning ====================

/** One point to read; `tag` is the caller's index (signal slot) */
struct RegisterDef {
    int groupKey;                 // points only merge within the same key
    RegisterType registerType;
    uint16_t address;
    uint16_t quantity;            // bits or registers occupied
    size_t tag;
};

/** Merged read request */
struct ReadGroup {
    int groupKey;
    RegisterType registerType;
    uint8_t functionCode;
    uint16_t startAddress;
    uint16_t totalQuantity;
    std::vector<RegisterDef> registers;
};

// ==================== Helpers ====================

inline std::string registerTypeToString(RegisterType type) {
    switch (type) {
        case RegisterType::COIL: return "COIL";
        case RegisterType::DISCRETE_INPUT: return "DISCRETE_INPUT";
        case RegisterType::HOLDING_REGISTER: return "HOLDING_REGISTER";
        case RegisterType::INPUT_REGISTER: return "INPUT_REGISTER";
    }
    return "HOLDING_REGISTER";
}

inline uint8_t registerTypeToFuncCode(RegisterType type) {
    switch (type) {
        case RegisterType::COIL: return FuncCodes::READ_COILS;
        case RegisterType::DISCRETE_INPUT: return FuncCodes::READ_DISCRETE_INPUTS;
        case RegisterType::HOLDING_REGISTER: return FuncCodes::READ_HOLDING_REGISTERS;
        case RegisterType::INPUT_REGISTER: return FuncCodes::READ_INPUT_REGISTERS;
    }
    return FuncCodes::READ_HOLDING_REGISTERS;
}

inline bool isBitRegister(RegisterType type) {
    return type == RegisterType::COIL || type == RegisterType::DISCRETE_INPUT;
}

inline bool isWriteFunction(uint8_t fc) {
    return fc == FuncCodes::WRITE_SINGLE_COIL ||
           fc == FuncCodes::WRITE_SINGLE_REGISTER ||
           fc == FuncCodes::WRITE_MULTIPLE_REGISTERS;
}

/** Standard exception code names */
inline std::string exceptionCodeToString(uint8_t code) {
    switch (code) {
        case 0x01: return "ILLEGAL FUNCTION";
        case 0x02: return "ILLEGAL DATA ADDRESS";
        case 0x03: return "ILLEGAL DATA VALUE";
        case 0x04: return "SERVER DEVICE FAILURE";
        case 0x05: return "ACKNOWLEDGE";
        case 0x06: return "SERVER DEVICE BUSY";
        case 0x0A: return "GATEWAY PATH UNAVAILABLE";
        case 0x0B: return "GATEWAY TARGET DEVICE FAILED TO RESPOND";
        default: return "UNKNOWN EXCEPTION (" + std::to_string(code) + ")";
    }
}

}  // namespace modbus
