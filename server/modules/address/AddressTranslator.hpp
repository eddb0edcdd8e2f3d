#pragma once

#include "SignalKind.hpp"
#include "common/utils/AppException.hpp"
#include "common/utils/Constants.hpp"

/**
 * @brief Parsed hierarchical address, e.g. %QX12.3
 */
struct HierarchicalAddress {
    std::string prefix;   // "%QX"
    uint32_t major = 0;
    uint32_t minor = 0;   // 0..7

    uint32_t linear() const {
        return major * Constants::ADDRESS_BITS_PER_MAJOR + minor;
    }

    std::string toString() const {
        return prefix + std::to_string(major) + "." + std::to_string(minor);
    }
};

/**
 * @brief Conversion between hierarchical PLC addresses and linear Modbus indices
 *
 * linear = major * 8 + minor; major = linear / 8, minor = linear % 8.
 * Coils and contacts share one contiguous space split at linear 799: the primary
 * kind owns 0..799, the slave kind 800 and up. Both directions enforce the split.
 *
 * Stateless; every method is a pure function.
 */
class AddressTranslator {
public:
    using Range = std::pair<uint32_t, uint32_t>;

    /**
     * @brief Kind metadata
     * @throws UnknownSignalKindError kind missing from the prefix table
     */
    static const SignalKindInfo& info(SignalKind kind) {
        const auto* entry = findSignalKindInfo(kind);
        if (!entry) {
            throw UnknownSignalKindError("Signal kind " + std::to_string(static_cast<int>(kind)) +
                                         " has no address prefix");
        }
        return *entry;
    }

    static std::string prefixFor(SignalKind kind) {
        return info(kind).prefix;
    }

    /**
     * @brief Kind from its business-system label ("Digital Output Coil") or slug
     * @throws UnknownSignalKindError
     */
    static SignalKind parseKind(std::string_view label) {
        std::string text = trim(label);
        for (const auto& entry : SIGNAL_KINDS) {
            if (equalsIgnoreCase(text, entry.label) || equalsIgnoreCase(text, entry.slug)) {
                return entry.kind;
            }
        }
        throw UnknownSignalKindError("Unknown signal kind: '" + text + "'");
    }

    /**
     * @brief Valid linear range of a kind, inclusive
     */
    static Range linearRange(SignalKind kind) {
        const auto& entry = info(kind);
        uint32_t top = Constants::MAX_LINEAR_ADDRESS + 1 - entry.quantity;
        switch (kind) {
            case SignalKind::DigitalOutputCoil:
            case SignalKind::DigitalInputContact:
                return {0, Constants::SLAVE_ADDRESS_THRESHOLD};
            case SignalKind::DigitalOutputSlaveCoil:
            case SignalKind::DigitalInputSlaveContact:
                return {Constants::SLAVE_ADDRESS_THRESHOLD + 1, top};
            default:
                return {0, top};
        }
    }

    /**
     * @brief Pick the primary or slave variant for a linear address
     *
     * Only coils and contacts have a slave variant; other kinds are returned as is.
     */
    static SignalKind classify(SignalKind kind, uint32_t linear) {
        bool slave = linear > Constants::SLAVE_ADDRESS_THRESHOLD;
        switch (kind) {
            case SignalKind::DigitalOutputCoil:
            case SignalKind::DigitalOutputSlaveCoil:
                return slave ? SignalKind::DigitalOutputSlaveCoil : SignalKind::DigitalOutputCoil;
            case SignalKind::DigitalInputContact:
            case SignalKind::DigitalInputSlaveContact:
                return slave ? SignalKind::DigitalInputSlaveContact : SignalKind::DigitalInputContact;
            default:
                info(kind);  // throws for kinds outside the table
                return kind;
        }
    }

    /**
     * @brief linear -> "%QX12.3"
     * @throws AddressFormatError linear outside the kind's range
     * @throws UnknownSignalKindError
     */
    static std::string toHierarchical(SignalKind kind, uint32_t linear) {
        requireInRange(kind, linear);
        HierarchicalAddress addr;
        addr.prefix = info(kind).prefix;
        addr.major = linear / Constants::ADDRESS_BITS_PER_MAJOR;
        addr.minor = linear % Constants::ADDRESS_BITS_PER_MAJOR;
        return addr.toString();
    }

    /**
     * @brief "%QX12.3" -> linear
     * @throws AddressFormatError malformed text, foreign prefix, or outside the kind's range
     * @throws UnknownSignalKindError
     */
    static uint32_t toLinear(SignalKind kind, std::string_view address) {
        auto parsed = parse(address);
        const auto& entry = info(kind);
        if (parsed.prefix != entry.prefix) {
            throw AddressFormatError("Address " + parsed.toString() + " does not use prefix " +
                                     entry.prefix + " of " + entry.label);
        }
        uint32_t linear = parsed.linear();
        requireInRange(kind, linear);
        return linear;
    }

    /**
     * @brief Split "<%XX><major>.<minor>"
     * @throws AddressFormatError
     */
    static HierarchicalAddress parse(std::string_view address) {
        static const std::regex pattern(R"(^(%[A-Z]{2})([0-9]{1,5})\.([0-9])$)");

        std::string text(address);
        std::smatch match;
        if (!std::regex_match(text, match, pattern)) {
            throw AddressFormatError("Malformed address '" + text +
                                     "', expected <prefix><major>.<minor> such as %QX12.3");
        }

        HierarchicalAddress addr;
        addr.prefix = match[1].str();
        addr.major = static_cast<uint32_t>(std::stoul(match[2].str()));
        addr.minor = static_cast<uint32_t>(std::stoul(match[3].str()));
        if (addr.minor >= Constants::ADDRESS_BITS_PER_MAJOR) {
            throw AddressFormatError("Minor component of '" + text + "' must be 0-7");
        }
        if (addr.linear() > Constants::MAX_LINEAR_ADDRESS) {
            throw AddressFormatError("Address '" + text + "' is beyond linear " +
                                     std::to_string(Constants::MAX_LINEAR_ADDRESS));
        }
        return addr;
    }

    /**
     * @brief Next bit: minor rolls 7 -> 0 and carries into major
     * @throws AddressFormatError
     */
    static std::string increment(std::string_view address) {
        auto addr = parse(address);
        if (addr.minor + 1 == Constants::ADDRESS_BITS_PER_MAJOR) {
            addr.minor = 0;
            addr.major += 1;
        } else {
            addr.minor += 1;
        }
        if (addr.linear() > Constants::MAX_LINEAR_ADDRESS) {
            throw AddressFormatError("Cannot increment past " + std::string(address));
        }
        return addr.toString();
    }

    /**
     * @brief Previous bit: minor rolls 0 -> 7 and borrows from major
     * @throws AddressFormatError when decrementing x0.0
     */
    static std::string decrement(std::string_view address) {
        auto addr = parse(address);
        if (addr.minor == 0) {
            if (addr.major == 0) {
                throw AddressFormatError("Cannot decrement " + std::string(address) + " below zero");
            }
            addr.minor = Constants::ADDRESS_BITS_PER_MAJOR - 1;
            addr.major -= 1;
        } else {
            addr.minor -= 1;
        }
        return addr.toString();
    }

private:
    static void requireInRange(SignalKind kind, uint32_t linear) {
        auto [low, high] = linearRange(kind);
        if (linear < low || linear > high) {
            throw AddressFormatError("Linear address " + std::to_string(linear) + " is outside " +
                                     info(kind).label + " (" + std::to_string(low) + "-" +
                                     std::to_string(high) + ")");
        }
    }

    static std::string trim(std::string_view s) {
        size_t b = 0;
        size_t e = s.size();
        while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
        return std::string(s.substr(b, e - b));
    }

    static bool equalsIgnoreCase(std::string_view a, std::string_view b) {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                   return std::tolower(static_cast<unsigned char>(x)) ==
                          std::tolower(static_cast<unsigned char>(y));
               });
    }
};
