/// @file auth_events.cpp
/// @brief Audit event sinks.

#include "oas/service/auth_events.hpp"

#include "oas/foundation/json_log_formatter.hpp"
#include "oas/foundation/service_logger.hpp"

namespace oas::service {

using foundation::JsonLogFormatter;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

LogLevel severityOf(AuthEventType type) {
    return type == AuthEventType::AccountLocked ? LogLevel::Warning : LogLevel::Info;
}

}  // namespace

std::string LoggingEventSink::render(const AuthEvent& event) {
    LogContext ctx;
    ctx.identityId = event.identityId;
    ctx.extra = event.attributes;
    ctx.extra["event"] = std::string(authEventTypeName(event.type));
    ctx.extra["outcome"] = event.outcome;

    return JsonLogFormatter::format(event.timestamp, severityOf(event.type), LogCategory::Audit,
                                    authEventTypeName(event.type), ctx);
}

void LoggingEventSink::publish(const AuthEvent& event) {
    OAS_LOG(severityOf(event.type), LogCategory::Audit, render(event));
}

void FanOutEventSink::addSink(std::shared_ptr<IAuthEventSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void FanOutEventSink::publish(const AuthEvent& event) {
    std::vector<std::shared_ptr<IAuthEventSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks = sinks_;
    }
    for (const auto& sink : sinks) {
        sink->publish(event);
    }
}

std::size_t FanOutEventSink::sinkCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_.size();
}

}  // namespace oas::service
