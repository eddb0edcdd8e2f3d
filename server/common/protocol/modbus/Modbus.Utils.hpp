#pragma once

#include "Modbus.Types.hpp"

#include <algorithm>
#include <cstring>
#include <map>
#include <optional>
#include <sstream>
#include <iomanip>

namespace modbus {

/**
 * @brief Modbus TCP helpers
 * Frame building/parsing, value extraction and read batching
 */
class ModbusUtils {
public:
    /** Corrupt frame marker; the caller drops one byte and resynchronises */
    static constexpr size_t FRAME_CORRUPT = SIZE_MAX;

    // ==================== Frame building ====================

    /**
     * @brief Build a Modbus TCP read request
     * [TransID(2)][ProtocolID(2)=0][Length(2)=6][UnitID(1)][FC(1)][StartAddr(2)][Quantity(2)]
     */
    static std::vector<uint8_t> buildTcpRequest(const ModbusRequest& req) {
        std::vector<uint8_t> frame;
        frame.reserve(12);
        putMbap(frame, req.transactionId, 6, req.slaveId, req.functionCode);
        putU16(frame, req.startAddress);
        putU16(frame, req.quantity);
        return frame;
    }

    /**
     * @brief Build a Modbus TCP write request
     * FC05/FC06: MBAP(7) + FC(1) + Addr(2) + Value(2)
     * FC10:      MBAP(7) + FC(1) + Addr(2) + Qty(2) + ByteCount(1) + Data
     */
    static std::vector<uint8_t> buildWriteTcpRequest(const ModbusWriteRequest& req) {
        std::vector<uint8_t> frame;

        if (req.functionCode == FuncCodes::WRITE_MULTIPLE_REGISTERS) {
            auto byteCount = static_cast<uint8_t>(req.data.size());
            frame.reserve(13 + byteCount);
            putMbap(frame, req.transactionId, static_cast<uint16_t>(7 + byteCount), req.slaveId, req.functionCode);
            putU16(frame, req.address);
            putU16(frame, req.quantity);
            frame.push_back(byteCount);
            frame.insert(frame.end(), req.data.begin(), req.data.end());
            return frame;
        }

        frame.reserve(12);
        putMbap(frame, req.transactionId, 6, req.slaveId, req.functionCode);
        putU16(frame, req.address);
        if (req.functionCode == FuncCodes::WRITE_SINGLE_COIL) {
            // 0xFF00 = ON, 0x0000 = OFF
            putU16(frame, (!req.data.empty() && req.data[0]) ? 0xFF00 : 0x0000);
        } else {
            frame.push_back(!req.data.empty() ? req.data[0] : 0);
            frame.push_back(req.data.size() > 1 ? req.data[1] : 0);
        }
        return frame;
    }

    // ==================== Frame parsing ====================

    /**
     * @brief Parse one Modbus TCP response from the head of the buffer
     * @return bytes consumed, 0 when more data is needed, FRAME_CORRUPT on a bad header
     *
     * Normal:    [TransID(2)][ProtocolID(2)][Length(2)][UnitID(1)][FC(1)][ByteCount(1)][Data...]
     * Exception: [TransID(2)][ProtocolID(2)][Length(2)][UnitID(1)][FC|0x80(1)][ExceptionCode(1)]
     */
    static size_t parseTcpResponse(const std::vector<uint8_t>& buffer, ModbusResponse& out) {
        if (buffer.size() < 8) return 0;

        uint16_t transId = getU16(buffer.data());
        uint16_t protoId = getU16(buffer.data() + 2);
        uint16_t length  = getU16(buffer.data() + 4);

        // Length covers UnitID + PDU, at most 254
        if (protoId != 0 || length < 2 || length > 254) return FRAME_CORRUPT;

        size_t totalLen = 6 + length;
        if (buffer.size() < totalLen) return 0;

        out.transactionId = transId;
        out.slaveId = buffer[6];
        out.functionCode = buffer[7];
        out.data.clear();

        if (out.functionCode & 0x80) {
            out.isException = true;
            out.functionCode &= 0x7F;
            out.exceptionCode = (totalLen > 8) ? buffer[8] : 0;
            return totalLen;
        }

        out.isException = false;
        out.exceptionCode = 0;

        // Write echo (FC05/06/10): Addr(2) + Value/Qty(2), no ByteCount
        if (isWriteFunction(out.functionCode)) {
            if (totalLen >= 12) {
                out.data.assign(buffer.begin() + 8, buffer.begin() + 12);
            }
            return totalLen;
        }

        // Read (FC01-04): buffer[8] = ByteCount
        if (totalLen < 9) return totalLen;

        uint8_t byteCount = buffer[8];
        if (totalLen < static_cast<size_t>(9 + byteCount)) return FRAME_CORRUPT;

        out.data.assign(buffer.begin() + 9, buffer.begin() + 9 + byteCount);
        return totalLen;
    }

    /**
     * @brief Plausible MBAP header: ProtocolID 0, Length 2-254, known FC (or its exception)
     */
    static bool couldBeMbapHeader(const uint8_t* data) {
        uint16_t protoId = getU16(data + 2);
        uint16_t length  = getU16(data + 4);
        uint8_t rawFc = data[7] & 0x7F;
        return protoId == 0 && length >= 2 && length <= 254 &&
               ((rawFc >= 1 && rawFc <= 6) || rawFc == 0x10);
    }

    /**
     * @brief Bytes to skip before something that looks like an MBAP header
     * @return 0 when the buffer head is plausible
     */
    static size_t skipInvalidMbapData(const std::vector<uint8_t>& buffer) {
        if (buffer.size() < 8) return 0;
        if (couldBeMbapHeader(buffer.data())) return 0;

        for (size_t i = 1; i + 7 < buffer.size(); ++i) {
            if (couldBeMbapHeader(buffer.data() + i)) return i;
        }
        return buffer.size();
    }

    // ==================== Value extraction ====================

    /** Bit from a coil/discrete input payload (LSB first within each byte) */
    static bool extractBit(const uint8_t* data, uint16_t bitOffset, size_t dataSize) {
        uint16_t byteIdx = bitOffset / 8;
        if (byteIdx >= dataSize) return false;
        uint8_t bitIdx = bitOffset % 8;
        return (data[byteIdx] >> bitIdx) & 0x01;
    }

    /**
     * @brief Compose `wordCount` big-endian registers starting at `wordOffset`, high word first
     * @return nullopt when the payload is too short
     */
    static std::optional<uint64_t> extractWords(const std::vector<uint8_t>& data,
                                                uint16_t wordOffset, uint16_t wordCount) {
        size_t begin = static_cast<size_t>(wordOffset) * 2;
        size_t end = begin + static_cast<size_t>(wordCount) * 2;
        if (wordCount == 0 || wordCount > 4 || end > data.size()) return std::nullopt;

        uint64_t value = 0;
        for (size_t i = begin; i < end; ++i) {
            value = (value << 8) | data[i];
        }
        return value;
    }

    /** Inverse of extractWords: `wordCount` registers, big-endian, high word first */
    static std::vector<uint8_t> encodeWords(uint64_t value, uint16_t wordCount) {
        std::vector<uint8_t> buf(static_cast<size_t>(wordCount) * 2);
        for (size_t i = buf.size(); i-- > 0;) {
            buf[i] = static_cast<uint8_t>(value & 0xFF);
            value >>= 8;
        }
        return buf;
    }

    // ==================== Read batching ====================

    /**
     * @brief Merge points into read requests
     *
     * 1. group by groupKey (registerType follows the key)
     * 2. sort each group by address
     * 3. merge while the gap is <= maxGap and the merged span stays within the
     *    per-request limit (2000 bits, or maxRegsPerRead registers)
     */
    static std::vector<ReadGroup> mergeRegisters(
        const std::vector<RegisterDef>& registers,
        int maxGap = 0,
        int maxRegsPerRead = 125
    ) {
        std::map<int, std::vector<const RegisterDef*>> groups;
        for (const auto& reg : registers) {
            groups[reg.groupKey].push_back(&reg);
        }

        std::vector<ReadGroup> result;

        for (auto& [key, regs] : groups) {
            std::stable_sort(regs.begin(), regs.end(), [](const RegisterDef* a, const RegisterDef* b) {
                return a->address < b->address;
            });

            RegisterType regType = regs[0]->registerType;
            int maxQty = isBitRegister(regType) ? 2000 : maxRegsPerRead;

            auto startGroup = [&](const RegisterDef* reg) {
                ReadGroup group;
                group.groupKey = key;
                group.registerType = regType;
                group.functionCode = registerTypeToFuncCode(regType);
                group.startAddress = reg->address;
                group.totalQuantity = reg->quantity;
                group.registers.push_back(*reg);
                return group;
            };

            ReadGroup current = startGroup(regs[0]);

            for (size_t i = 1; i < regs.size(); ++i) {
                int nextEnd = static_cast<int>(regs[i]->address) + regs[i]->quantity;
                int currentEnd = static_cast<int>(current.startAddress) + current.totalQuantity;
                int gap = static_cast<int>(regs[i]->address) - currentEnd;
                int mergedQuantity = (std::max)(nextEnd, currentEnd) - current.startAddress;

                if (gap <= maxGap && mergedQuantity <= maxQty) {
                    current.totalQuantity = static_cast<uint16_t>(mergedQuantity);
                    current.registers.push_back(*regs[i]);
                } else {
                    result.push_back(std::move(current));
                    current = startGroup(regs[i]);
                }
            }

            result.push_back(std::move(current));
        }

        return result;
    }

    // ==================== Misc ====================

    static std::string toHexString(const std::vector<uint8_t>& data) {
        std::ostringstream oss;
        for (size_t i = 0; i < data.size(); ++i) {
            if (i > 0) oss << " ";
            oss << std::hex << std::uppercase << std::setw(2)
                << std::setfill('0') << static_cast<int>(data[i]);
        }
        return oss.str();
    }

private:
    static void putU16(std::vector<uint8_t>& out, uint16_t value) {
        out.push_back(static_cast<uint8_t>(value >> 8));
        out.push_back(static_cast<uint8_t>(value & 0xFF));
    }

    static uint16_t getU16(const uint8_t* p) {
        return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
    }

    /** MBAP header plus function code; length counts UnitID and PDU */
    static void putMbap(std::vector<uint8_t>& out, uint16_t transactionId, uint16_t length,
                        uint8_t unitId, uint8_t functionCode) {
        putU16(out, transactionId);
        putU16(out, 0);
        putU16(out, length);
        out.push_back(unitId);
        out.push_back(functionCode);
    }
};

}  // namespace modbus
