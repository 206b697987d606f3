#include <gtest/gtest.h>

#include <string>
#include <unordered_map>

#include "oas/foundation/clock.hpp"
#include "oas/foundation/service_result.hpp"
#include "oas/foundation/types.hpp"

using namespace oas::foundation;

// --- ErrorCode tests ---

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::StoreUnavailable), "Store");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidCredentials), "Auth");
    EXPECT_EQ(errorSubsystem(ErrorCode::CryptoFailure), "Auth");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigKeyNotFound), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

TEST(ErrorCodeTest, OnlyStoreCodesAreStoreFailures) {
    EXPECT_TRUE(isStoreFailure(ErrorCode::StoreError));
    EXPECT_TRUE(isStoreFailure(ErrorCode::StoreTimeout));
    EXPECT_TRUE(isStoreFailure(ErrorCode::StoreCorruptRecord));
    EXPECT_FALSE(isStoreFailure(ErrorCode::InvalidCredentials));
    EXPECT_FALSE(isStoreFailure(ErrorCode::AccountLocked));
    EXPECT_FALSE(isStoreFailure(ErrorCode::Unknown));
}

// --- ServiceError tests ---

TEST(ServiceErrorTest, DefaultConstruction) {
    ServiceError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
    EXPECT_FALSE(err.hasContext());
}

TEST(ServiceErrorTest, CodeAndMessage) {
    ServiceError err(ErrorCode::NotFound, "identity missing");
    EXPECT_EQ(err.code(), ErrorCode::NotFound);
    EXPECT_EQ(err.message(), "identity missing");
    EXPECT_EQ(err.subsystem(), "General");
    EXPECT_FALSE(err.isRetriable());
}

TEST(ServiceErrorTest, WithContext) {
    struct RetryInfo {
        int seconds = 0;
    };
    ServiceError err(ErrorCode::AccountLocked, "locked", RetryInfo{1800});
    EXPECT_TRUE(err.hasContext());
    auto* info = err.context<RetryInfo>();
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->seconds, 1800);

    // Wrong type returns nullptr
    EXPECT_EQ(err.context<int>(), nullptr);
}

TEST(ServiceErrorTest, StoreErrorsAreRetriable) {
    ServiceError err(ErrorCode::StoreTimeout, "timed out");
    EXPECT_TRUE(err.isRetriable());
}

// --- ServiceResult tests ---

TEST(ServiceResultTest, OkValue) {
    auto result = ServiceResult<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.value(), 42);
}

TEST(ServiceResultTest, ErrorValue) {
    auto result = ServiceResult<int>::err(
        ServiceError(ErrorCode::InvalidArgument, "bad input"));
    EXPECT_TRUE(result.hasError());
    EXPECT_FALSE(static_cast<bool>(result));
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(result.error().message(), "bad input");
    EXPECT_EQ(result.valueOr(7), 7);
}

TEST(ServiceResultTest, MoveOutValue) {
    auto result = ServiceResult<std::string>::ok("token");
    std::string moved = std::move(result).value();
    EXPECT_EQ(moved, "token");
}

TEST(ServiceResultTest, VoidOk) {
    auto result = ServiceResult<void>::ok();
    EXPECT_TRUE(result.hasValue());
}

TEST(ServiceResultTest, VoidError) {
    auto result = ServiceResult<void>::err(ServiceError(ErrorCode::StoreTimeout, "timed out"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::StoreTimeout);
}

// --- StrongId tests ---

TEST(StrongIdTest, DefaultInvalid) {
    IdentityId id;
    EXPECT_FALSE(id.isValid());
    EXPECT_EQ(id.value(), 0u);
}

TEST(StrongIdTest, EqualityAndOrdering) {
    IdentityId a(1), b(1), c(2);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_LT(a, c);
}

TEST(StrongIdTest, HashWorks) {
    std::unordered_map<IdentityId, std::string> map;
    map[IdentityId(1)] = "alice";
    EXPECT_EQ(map[IdentityId(1)], "alice");
    EXPECT_EQ(map.count(IdentityId(2)), 0u);
}

TEST(StrongIdTest, ParseRoundTripsToString) {
    auto parsed = IdentityId::parse(IdentityId(12345).toString());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->value(), 12345u);
}

TEST(StrongIdTest, ParseRejectsMalformedInput) {
    EXPECT_FALSE(IdentityId::parse("").has_value());
    EXPECT_FALSE(IdentityId::parse("0").has_value());
    EXPECT_FALSE(IdentityId::parse("12abc").has_value());
    EXPECT_FALSE(IdentityId::parse("-5").has_value());
    EXPECT_FALSE(IdentityId::parse("99999999999999999999999").has_value());
}

// --- Clock tests ---

TEST(ManualClockTest, AdvanceAndSet) {
    auto start = std::chrono::system_clock::time_point(std::chrono::seconds(1'000'000));
    ManualClock clock(start);
    EXPECT_EQ(clock.now(), start);

    clock.advance(std::chrono::minutes(31));
    EXPECT_EQ(clock.now(), start + std::chrono::minutes(31));

    clock.set(start);
    EXPECT_EQ(clock.now(), start);
}

TEST(SystemClockTest, SharedInstanceIsStable) {
    EXPECT_EQ(SystemClock::shared().get(), SystemClock::shared().get());
}
