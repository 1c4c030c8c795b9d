#include "utils.hpp"
#include <iomanip> // For std::put_time, std::get_time
#include <sstream> // For string streams
#include <string>
#include <stdexcept>  // For std::runtime_error
#include <cctype>
#include <ctime>
#include <chrono>

namespace core {
namespace utils {

    namespace {

        std::time_t toUtcEpoch(std::tm* tm) {
        #ifdef _WIN32
            return _mkgmtime(tm);
        #else
            return timegm(tm);
        #endif
        }

    } // namespace

    Timestamp stringToTimestamp(const std::string& input) {
        std::string iso_string = input;
        // Upstream rows often use "YYYY-MM-DD HH:MM:SS"
        auto space_pos = iso_string.find(' ');
        if (space_pos == 10) {
            iso_string[space_pos] = 'T';
        }

        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Date-only form
        if (iso_string.size() == 10) {
            ss >> std::get_time(&tm, "%Y-%m-%d");
            if (ss.fail()) {
                throw std::runtime_error("Failed to parse date: " + input);
            }
            std::time_t tt = toUtcEpoch(&tm);
            if (tt == static_cast<std::time_t>(-1)) {
                throw std::runtime_error("Failed to convert parsed date to UTC epoch seconds: " + input);
            }
            return static_cast<Timestamp>(tt);
        }

        // 2. Date and time up to seconds
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse timestamp (date/time part): " + input);
        }

        // 3. Optional fractional seconds are truncated, bars are whole seconds
        if (ss.peek() == '.') {
            ss.ignore();
            while (std::isdigit(ss.peek())) {
                ss.ignore();
            }
        }

        // 4. Optional timezone offset (+HH:MM, -HH:MM, +HHMM or Z). Missing means UTC.
        long long offset_seconds = 0;
        char sign_or_z = 0;
        if (ss >> sign_or_z) {
            if (sign_or_z == 'Z' || sign_or_z == 'z') {
                offset_seconds = 0;
            } else if (sign_or_z == '+' || sign_or_z == '-') {
                std::string rest;
                ss >> rest;
                std::string digits;
                for (char c : rest) {
                    if (std::isdigit(static_cast<unsigned char>(c))) digits += c;
                }
                if (digits.size() != 4 && digits.size() != 2) {
                    throw std::runtime_error("Failed to parse timestamp (timezone offset): " + input);
                }
                int offset_h = std::stoi(digits.substr(0, 2));
                int offset_m = digits.size() == 4 ? std::stoi(digits.substr(2, 2)) : 0;
                offset_seconds = offset_h * 3600LL + offset_m * 60LL;
                if (sign_or_z == '-') {
                    offset_seconds = -offset_seconds;
                }
            } else {
                throw std::runtime_error("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + input);
            }
        }

        std::time_t tt = toUtcEpoch(&tm);
        if (tt == static_cast<std::time_t>(-1)) {
            throw std::runtime_error("Failed to convert parsed date/time to UTC epoch seconds: " + input);
        }

        // 2015-04-20T00:00:00+05:30 is 2015-04-19T18:30:00Z
        return static_cast<Timestamp>(tt) - offset_seconds;
    }

    std::optional<Timestamp> tryParseTimestamp(const std::string& iso_string) {
        try {
            return stringToTimestamp(iso_string);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    std::string timestampToString(Timestamp ts) {
        std::time_t tt = static_cast<std::time_t>(ts);
        std::tm time_tm;
        #ifdef _WIN32
            gmtime_s(&time_tm, &tt);
        #else
            gmtime_r(&tt, &time_tm);
        #endif

        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S") << 'Z';
        return oss.str();
    }

    long long timeframeSeconds(Timeframe tf) {
        switch (tf) {
            case Timeframe::M2:  return 120;
            case Timeframe::M5:  return 300;
            case Timeframe::M15: return 900;
            case Timeframe::M30: return 1800;
            case Timeframe::H1:  return 3600;
            case Timeframe::H2:  return 7200;
            case Timeframe::H4:  return 14400;
            case Timeframe::D1:  return 86400;
        }
        return 3600;
    }

    std::string timeframeToString(Timeframe tf) {
        switch (tf) {
            case Timeframe::M2:  return "M2";
            case Timeframe::M5:  return "M5";
            case Timeframe::M15: return "M15";
            case Timeframe::M30: return "M30";
            case Timeframe::H1:  return "H1";
            case Timeframe::H2:  return "H2";
            case Timeframe::H4:  return "H4";
            case Timeframe::D1:  return "D1";
        }
        return "H1";
    }

    Timeframe timeframeFromString(const std::string& label) {
        if (label == "M2") return Timeframe::M2;
        if (label == "M5") return Timeframe::M5;
        if (label == "M15") return Timeframe::M15;
        if (label == "M30") return Timeframe::M30;
        if (label == "H1") return Timeframe::H1;
        if (label == "H2") return Timeframe::H2;
        if (label == "H4") return Timeframe::H4;
        if (label == "D1") return Timeframe::D1;
        throw std::invalid_argument("Unknown timeframe: " + label);
    }

    Timestamp alignToTimeframe(Timestamp ts, Timeframe tf) {
        const long long period = timeframeSeconds(tf);
        Timestamp bucket = ts / period;
        if (ts % period != 0 && ts < 0) {
            --bucket; // floor for pre-epoch times
        }
        return bucket * period;
    }

    bool startsWith(const std::string& value, const std::string& prefix) {
        return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
    }

    bool endsWith(const std::string& value, const std::string& suffix) {
        return value.size() >= suffix.size() &&
               value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    std::string toString(OrderSide side) {
        return side == OrderSide::Long ? "LONG" : "SHORT";
    }

    std::string toString(OrderType type) {
        switch (type) {
            case OrderType::Market: return "MARKET";
            case OrderType::Limit:  return "LIMIT";
            case OrderType::Stop:   return "STOP";
        }
        return "MARKET";
    }

    std::string toString(OrderStatus status) {
        switch (status) {
            case OrderStatus::Pending: return "PENDING";
            case OrderStatus::Open:    return "OPEN";
            case OrderStatus::Closed:  return "CLOSED";
        }
        return "PENDING";
    }

    std::string toString(CloseReason reason) {
        switch (reason) {
            case CloseReason::Manual:     return "MANUAL";
            case CloseReason::StopLoss:   return "STOP_LOSS";
            case CloseReason::TakeProfit: return "TAKE_PROFIT";
            case CloseReason::StopOut:    return "STOP_OUT";
            case CloseReason::Cancelled:  return "CANCELLED";
        }
        return "MANUAL";
    }

    OrderSide orderSideFromString(const std::string& value) {
        if (value == "LONG") return OrderSide::Long;
        if (value == "SHORT") return OrderSide::Short;
        throw std::invalid_argument("Unknown order side: " + value);
    }

    OrderType orderTypeFromString(const std::string& value) {
        if (value == "MARKET") return OrderType::Market;
        if (value == "LIMIT") return OrderType::Limit;
        if (value == "STOP") return OrderType::Stop;
        throw std::invalid_argument("Unknown order type: " + value);
    }

    OrderStatus orderStatusFromString(const std::string& value) {
        if (value == "PENDING") return OrderStatus::Pending;
        if (value == "OPEN") return OrderStatus::Open;
        if (value == "CLOSED") return OrderStatus::Closed;
        throw std::invalid_argument("Unknown order status: " + value);
    }

    CloseReason closeReasonFromString(const std::string& value) {
        if (value == "MANUAL") return CloseReason::Manual;
        if (value == "STOP_LOSS") return CloseReason::StopLoss;
        if (value == "TAKE_PROFIT") return CloseReason::TakeProfit;
        if (value == "STOP_OUT") return CloseReason::StopOut;
        if (value == "CANCELLED") return CloseReason::Cancelled;
        throw std::invalid_argument("Unknown close reason: " + value);
    }

} // namespace utils
} // namespace core
