#pragma once

#include "AddressTranslator.hpp"
#include "common/protocol/modbus/Modbus.Utils.hpp"
#include "modules/catalogue/domain/SignalValue.hpp"

/**
 * @brief Signal values to and from Modbus payloads
 *
 * Digital kinds are one bit. Register kinds are 1, 2 or 4 big-endian words,
 * high word first; 16 and 32 bit values are unsigned, 64 bit values keep their
 * two's complement bit pattern in an int64_t.
 */
class SignalCodec {
public:
    /** One write on the wire */
    struct WriteFrame {
        uint8_t functionCode;
        std::vector<uint8_t> data;
    };

    /**
     * @brief Value of a signal inside a read payload
     * @param offset bits (digital) or words (registers) from the start of the read
     * @return nullopt when the payload is too short
     */
    static std::optional<SignalValue> decode(SignalKind kind, uint16_t offset, const std::vector<uint8_t>& data) {
        const auto& info = AddressTranslator::info(kind);
        if (info.digital) {
            if (offset / 8u >= data.size()) return std::nullopt;
            return modbus::ModbusUtils::extractBit(data.data(), offset, data.size());
        }

        auto raw = modbus::ModbusUtils::extractWords(data, offset, info.quantity);
        if (!raw) return std::nullopt;
        if (info.quantity == 4) {
            return std::bit_cast<int64_t>(*raw);
        }
        return static_cast<int64_t>(*raw);
    }

    /**
     * @brief Check and convert a requested value for a kind
     *
     * Digital: JSON bool, 0/1, or "true"/"false".
     * Registers: integer, float (truncated toward zero) or numeric text within the kind's width.
     * @throws ValidationException
     */
    static SignalValue coerce(SignalKind kind, const Json::Value& value) {
        const auto& info = AddressTranslator::info(kind);
        if (info.digital) return coerceBool(info, value);
        return coerceInteger(info, value);
    }

    /**
     * @brief Function code and payload writing `value` to a signal of `kind`
     * @throws NotWritableError kind is read-only
     */
    static WriteFrame encode(SignalKind kind, const SignalValue& value) {
        const auto& info = AddressTranslator::info(kind);
        if (!info.writable) {
            throw NotWritableError(std::string(info.label) + " is read-only");
        }

        if (info.digital) {
            bool on = SignalValues::isBool(value) ? std::get<bool>(value) : std::get<int64_t>(value) != 0;
            return {modbus::FuncCodes::WRITE_SINGLE_COIL, {static_cast<uint8_t>(on ? 1 : 0)}};
        }

        uint64_t raw = SignalValues::isBool(value)
            ? (std::get<bool>(value) ? 1u : 0u)
            : std::bit_cast<uint64_t>(std::get<int64_t>(value));
        auto bytes = modbus::ModbusUtils::encodeWords(raw, info.quantity);
        uint8_t fc = info.quantity == 1 ? modbus::FuncCodes::WRITE_SINGLE_REGISTER
                                        : modbus::FuncCodes::WRITE_MULTIPLE_REGISTERS;
        return {fc, std::move(bytes)};
    }

private:
    static SignalValue coerceBool(const SignalKindInfo& info, const Json::Value& value) {
        if (value.isBool()) return value.asBool();
        if (value.isIntegral() || (value.isDouble() && std::trunc(value.asDouble()) == value.asDouble())) {
            double number = value.asDouble();
            if (number == 0.0) return false;
            if (number == 1.0) return true;
        }
        if (value.isString()) {
            std::string text = value.asString();
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (text == "true") return true;
            if (text == "false") return false;
        }
        throw ValidationException(std::string(info.label) + " expects a boolean, got " + describe(value));
    }

    static SignalValue coerceInteger(const SignalKindInfo& info, const Json::Value& value) {
        std::optional<int64_t> number;
        bool unsignedWide = false;

        if (value.isInt64()) {
            number = value.asInt64();
        } else if (value.isUInt64()) {
            // above INT64_MAX, only a 64 bit pattern
            number = std::bit_cast<int64_t>(static_cast<uint64_t>(value.asUInt64()));
            unsignedWide = true;
        } else if (value.isDouble()) {
            double d = value.asDouble();
            if (std::isfinite(d) && std::fabs(d) < 9.2e18) {
                number = static_cast<int64_t>(std::trunc(d));
            }
        } else if (value.isString()) {
            const std::string text = value.asString();
            int64_t parsed = 0;
            auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
            if (ec == std::errc() && end == text.data() + text.size() && !text.empty()) {
                number = parsed;
            }
        }

        if (!number) {
            throw ValidationException(std::string(info.label) + " expects an integer, got " + describe(value));
        }

        if (info.bitWidth < 64) {
            int64_t max = (int64_t{1} << info.bitWidth) - 1;
            if (unsignedWide || *number < 0 || *number > max) {
                throw ValidationException(std::string(info.label) + " value " + describe(value) +
                                          " outside 0.." + std::to_string(max));
            }
        }
        return *number;
    }

    static std::string describe(const Json::Value& value) {
        if (value.isNull()) return "null";
        if (value.isString()) return "\"" + value.asString() + "\"";
        if (value.isArray()) return "an array";
        if (value.isObject()) return "an object";
        return value.asString();
    }
};
