#pragma once

#include "datatypes.hpp"
#include <string>
#include <optional>

namespace core {
namespace utils {

    // Unix seconds -> "YYYY-MM-DDTHH:MM:SSZ"
    std::string timestampToString(Timestamp ts);

    // Parses "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM]" or the same with a
    // space instead of 'T'. Text without an offset is read as UTC. Throws std::runtime_error.
    Timestamp stringToTimestamp(const std::string& iso_string);

    // Non-throwing variant for sanitizing upstream data
    std::optional<Timestamp> tryParseTimestamp(const std::string& iso_string);

    // --- Timeframes ---
    long long timeframeSeconds(Timeframe tf);
    std::string timeframeToString(Timeframe tf);
    Timeframe timeframeFromString(const std::string& label); // Throws std::invalid_argument
    Timestamp alignToTimeframe(Timestamp ts, Timeframe tf);

    bool startsWith(const std::string& value, const std::string& prefix);
    bool endsWith(const std::string& value, const std::string& suffix);

    // Enum <-> string helpers used by logging and serialization
    std::string toString(OrderSide side);
    std::string toString(OrderType type);
    std::string toString(OrderStatus status);
    std::string toString(CloseReason reason);
    OrderSide orderSideFromString(const std::string& value);
    OrderType orderTypeFromString(const std::string& value);
    OrderStatus orderStatusFromString(const std::string& value);
    CloseReason closeReasonFromString(const std::string& value);

} // namespace utils
} // namespace core
