/// @file json_log_formatter.cpp
/// @brief Structured JSON log formatter implementation.

#include "oas/foundation/json_log_formatter.hpp"

#include <cstdint>
#include <map>
#include <random>
#include <string>
#include <string_view>
#include <utility>

namespace oas::foundation {

namespace {

constexpr std::string_view kHexDigits = "0123456789abcdef";

thread_local std::string tl_correlationId;

void appendHex(std::string& out, uint64_t value, int digits) {
    for (int shift = (digits - 1) * 4; shift >= 0; shift -= 4) {
        out += kHexDigits[(value >> shift) & 0xF];
    }
}

void appendPadded(std::string& out, unsigned value, int width) {
    auto text = std::to_string(value);
    if (static_cast<int>(text.size()) < width) {
        out.append(static_cast<std::size_t>(width) - text.size(), '0');
    }
    out += text;
}

void appendJsonString(std::string& out, std::string_view value) {
    out += '"';
    for (char c : value) {
        auto uc = static_cast<unsigned char>(c);
        switch (c) {
            case '"':  out += "\\\""; continue;
            case '\\': out += "\\\\"; continue;
            case '\n': out += "\\n"; continue;
            case '\r': out += "\\r"; continue;
            case '\t': out += "\\t"; continue;
            case '\b': out += "\\b"; continue;
            case '\f': out += "\\f"; continue;
            default: break;
        }
        if (uc < 0x20) {
            out += "\\u00";
            appendHex(out, uc, 2);
        } else {
            out += c;
        }
    }
    out += '"';
}

void appendField(std::string& out, std::string_view key, std::string_view value) {
    out += ",\"";
    out += key;
    out += "\":";
    appendJsonString(out, value);
}

}  // namespace

std::string formatIsoTimestamp(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    auto ms = floor<milliseconds>(tp);
    auto day = floor<days>(ms);
    year_month_day date{day};
    hh_mm_ss<milliseconds> time{ms - day};

    std::string out;
    out.reserve(24);
    appendPadded(out, static_cast<unsigned>(static_cast<int>(date.year())), 4);
    out += '-';
    appendPadded(out, static_cast<unsigned>(date.month()), 2);
    out += '-';
    appendPadded(out, static_cast<unsigned>(date.day()), 2);
    out += 'T';
    appendPadded(out, static_cast<unsigned>(time.hours().count()), 2);
    out += ':';
    appendPadded(out, static_cast<unsigned>(time.minutes().count()), 2);
    out += ':';
    appendPadded(out, static_cast<unsigned>(time.seconds().count()), 2);
    out += '.';
    appendPadded(out, static_cast<unsigned>(time.subseconds().count()), 3);
    out += 'Z';
    return out;
}

std::string generateCorrelationId() {
    thread_local std::mt19937_64 gen(std::random_device{}());

    // Version 4, variant 1.
    uint64_t hi = (gen() & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    uint64_t lo = (gen() & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::string out;
    out.reserve(36);
    appendHex(out, hi >> 32, 8);
    out += '-';
    appendHex(out, hi >> 16, 4);
    out += '-';
    appendHex(out, hi, 4);
    out += '-';
    appendHex(out, lo >> 48, 4);
    out += '-';
    appendHex(out, lo, 12);
    return out;
}

CorrelationScope::CorrelationScope(std::string correlationId)
    : previous_(std::exchange(tl_correlationId, std::move(correlationId))) {}

CorrelationScope::~CorrelationScope() {
    tl_correlationId = std::move(previous_);
}

const std::string& CorrelationScope::current() {
    return tl_correlationId;
}

std::string JsonLogFormatter::format(LogLevel level,
                                     LogCategory category,
                                     std::string_view message,
                                     const LogContext& ctx) {
    return format(std::chrono::system_clock::now(), level, category, message, ctx);
}

std::string JsonLogFormatter::format(std::chrono::system_clock::time_point timestamp,
                                     LogLevel level,
                                     LogCategory category,
                                     std::string_view message,
                                     const LogContext& ctx) {
    std::string out = "{\"timestamp\":";
    out.reserve(256);
    appendJsonString(out, formatIsoTimestamp(timestamp));
    appendField(out, "level", logLevelName(level));
    appendField(out, "category", logCategoryName(category));

    // An explicit trace id overrides the thread's correlation scope.
    std::string_view correlation = tl_correlationId;
    if (ctx.traceId && !ctx.traceId->empty()) {
        correlation = *ctx.traceId;
    }
    if (!correlation.empty()) {
        appendField(out, "correlation_id", correlation);
    }

    appendField(out, "message", message);

    if (ctx.identityId && ctx.identityId->isValid()) {
        out += ",\"identity_id\":";
        out += ctx.identityId->toString();
    }

    if (!ctx.extra.empty()) {
        std::map<std::string_view, std::string_view> sorted(ctx.extra.begin(), ctx.extra.end());
        out += ",\"extra\":{";
        const char* separator = "";
        for (const auto& [key, val] : sorted) {
            out += separator;
            appendJsonString(out, key);
            out += ':';
            appendJsonString(out, val);
            separator = ",";
        }
        out += '}';
    }

    out += '}';
    return out;
}

}  // namespace oas::foundation
