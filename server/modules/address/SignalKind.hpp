#pragma once

#include "common/protocol/modbus/Modbus.Types.hpp"

/**
 * @brief Signal kinds known to the bridge
 */
enum class SignalKind {
    DigitalOutputCoil,
    DigitalOutputSlaveCoil,
    DigitalInputContact,
    DigitalInputSlaveContact,
    AnalogInputRegister,
    AnalogOutputHoldingRegister,
    MemoryRegister16,
    MemoryRegister32,
    MemoryRegister64
};

/**
 * @brief Static facts about one kind
 */
struct SignalKindInfo {
    SignalKind kind;
    const char* label;              // business system signal_type
    const char* slug;               // stable identifier used in logs and JSON
    const char* prefix;             // hierarchical address prefix
    modbus::RegisterType table;     // Modbus data table
    uint16_t quantity;              // bits (digital) or 16-bit words occupied
    uint8_t bitWidth;               // value width
    bool writable;
    bool digital;
};

inline constexpr std::array<SignalKindInfo, 9> SIGNAL_KINDS = {{
    {SignalKind::DigitalOutputCoil, "Digital Output Coil", "digital-output-coil", "%QX",
     modbus::RegisterType::COIL, 1, 1, true, true},
    {SignalKind::DigitalOutputSlaveCoil, "Digital Output Slave Coil", "digital-output-slave-coil", "%QX",
     modbus::RegisterType::COIL, 1, 1, true, true},
    {SignalKind::DigitalInputContact, "Digital Input Contact", "digital-input-contact", "%IX",
     modbus::RegisterType::DISCRETE_INPUT, 1, 1, false, true},
    {SignalKind::DigitalInputSlaveContact, "Digital Input Slave Contact", "digital-input-slave-contact", "%IX",
     modbus::RegisterType::DISCRETE_INPUT, 1, 1, false, true},
    {SignalKind::AnalogInputRegister, "Analog Input Register", "analog-input-register", "%IW",
     modbus::RegisterType::INPUT_REGISTER, 1, 16, false, false},
    {SignalKind::AnalogOutputHoldingRegister, "Analog Output Holding Register", "analog-output-holding-register", "%QW",
     modbus::RegisterType::HOLDING_REGISTER, 1, 16, true, false},
    {SignalKind::MemoryRegister16, "Memory Register (16 bit)", "memory-register-16", "%MW",
     modbus::RegisterType::HOLDING_REGISTER, 1, 16, true, false},
    {SignalKind::MemoryRegister32, "Memory Register (32 bit)", "memory-register-32", "%MD",
     modbus::RegisterType::HOLDING_REGISTER, 2, 32, true, false},
    {SignalKind::MemoryRegister64, "Memory Register (64 bit)", "memory-register-64", "%ML",
     modbus::RegisterType::HOLDING_REGISTER, 4, 64, true, false},
}};

/** Table entry for a kind, nullptr when the kind is not in the table */
inline const SignalKindInfo* findSignalKindInfo(SignalKind kind) {
    for (const auto& info : SIGNAL_KINDS) {
        if (info.kind == kind) return &info;
    }
    return nullptr;
}

inline std::string signalKindToString(SignalKind kind) {
    const auto* info = findSignalKindInfo(kind);
    return info ? info->slug : "unknown-kind(" + std::to_string(static_cast<int>(kind)) + ")";
}
