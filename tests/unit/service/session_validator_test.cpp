#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "oas/foundation/clock.hpp"
#include "oas/foundation/service_metrics.hpp"
#include "oas/service/auth_metrics.hpp"
#include "oas/service/credential_verifier.hpp"
#include "oas/service/identity_repository.hpp"
#include "oas/service/session_validator.hpp"
#include "oas/service/token_issuer.hpp"
#include "oas/service/token_store.hpp"
#include "support/test_doubles.hpp"

using namespace oas::service;
using oas::foundation::ErrorCode;
using oas::foundation::IdentityId;
using oas::foundation::ManualClock;
using oas::foundation::ServiceMetrics;
using oas::testing::FailingTokenStore;
using oas::testing::addIdentity;

class SessionValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<FailingTokenStore>();
        identities_ = std::make_shared<InMemoryIdentityRepository>();
        clock_ = std::make_shared<ManualClock>();
        issuer_ = std::make_unique<TokenIssuer>(store_, clock_, config_);
        validator_ = std::make_unique<SessionValidator>(store_, identities_, clock_, config_,
                                                        metrics_);

        CredentialVerifier verifier(CredentialVerifier::kMinIterations);
        alice_ = addIdentity(*identities_, verifier, "alice@example.com", "secret",
                             IdentityStatus::Active, {"user"});
    }

    std::string issueSession(IdentityId owner) {
        return issuer_->issue(owner, IssueRequest{}).value().rawToken;
    }

    /// Record written before the lookup index existed: arbitrary key, no
    /// lookup hash.
    std::string insertLegacy(IdentityId owner) {
        auto raw = issuer_->generateRawToken().value();
        TokenRecord record;
        record.key = "legacy-" + std::to_string(++legacyCount_);
        record.salt = "c2FsdHNhbHRzYWx0";
        record.tokenHash = TokenIssuer::saltedHashOf(record.salt, raw);
        record.ownerRef = owner.toString();
        record.issuedAt = clock_->now();
        record.lastUsed = clock_->now();
        record.expiresAt = clock_->now() + std::chrono::hours(2);
        EXPECT_TRUE(store_->insert(record).hasValue());
        return raw;
    }

    AuthConfig config_;
    ServiceMetrics metrics_;
    std::shared_ptr<FailingTokenStore> store_;
    std::shared_ptr<InMemoryIdentityRepository> identities_;
    std::shared_ptr<ManualClock> clock_;
    std::unique_ptr<TokenIssuer> issuer_;
    std::unique_ptr<SessionValidator> validator_;
    IdentityId alice_;
    int legacyCount_ = 0;
};

TEST_F(SessionValidatorTest, ValidTokenResolvesPrincipal) {
    auto raw = issueSession(alice_);
    auto principal = validator_->validate(raw);
    ASSERT_TRUE(principal.hasValue());
    ASSERT_TRUE(principal.value().has_value());
    EXPECT_EQ(principal.value()->identityId, alice_);
    EXPECT_EQ(principal.value()->email, "alice@example.com");
    EXPECT_TRUE(principal.value()->hasRole("user"));
    EXPECT_EQ(principal.value()->tokenKind, TokenKind::Session);
    EXPECT_EQ(metrics_.counterValue(metrics::kTokenFastPath), 1u);
}

TEST_F(SessionValidatorTest, ValidationSlidesExpiry) {
    auto raw = issueSession(alice_);
    clock_->advance(std::chrono::hours(23));

    auto principal = validator_->validate(raw);
    ASSERT_TRUE(principal.value().has_value());
    EXPECT_EQ(principal.value()->expiresAt, clock_->now() + std::chrono::hours(24));

    // The original 24h window has passed, the refreshed one has not.
    clock_->advance(std::chrono::hours(2));
    EXPECT_TRUE(validator_->validate(raw).value().has_value());
}

TEST_F(SessionValidatorTest, IdleSessionExpires) {
    auto raw = issueSession(alice_);
    clock_->advance(std::chrono::hours(24));
    auto principal = validator_->validate(raw);
    ASSERT_TRUE(principal.hasValue());
    EXPECT_FALSE(principal.value().has_value());
}

TEST_F(SessionValidatorTest, ApiKeyDoesNotSlide) {
    IssueRequest request;
    request.kind = TokenKind::ApiKey;
    request.apiKeyName = "deploy";
    request.expiresAt = clock_->now() + std::chrono::hours(48);
    auto issued = issuer_->issue(alice_, request).value();

    clock_->advance(std::chrono::hours(47));
    auto principal = validator_->validate(issued.rawToken);
    ASSERT_TRUE(principal.value().has_value());
    EXPECT_EQ(principal.value()->expiresAt, issued.expiresAt);

    clock_->advance(std::chrono::hours(2));
    EXPECT_FALSE(validator_->validate(issued.rawToken).value().has_value());
}

TEST_F(SessionValidatorTest, MalformedTokenSkipsStore) {
    store_->setFailing(true);
    auto principal = validator_->validate("not a token");
    ASSERT_TRUE(principal.hasValue());
    EXPECT_FALSE(principal.value().has_value());
}

TEST_F(SessionValidatorTest, UnknownTokenIsAbsent) {
    auto raw = issuer_->generateRawToken().value();
    auto principal = validator_->validate(raw);
    ASSERT_TRUE(principal.hasValue());
    EXPECT_FALSE(principal.value().has_value());
}

TEST_F(SessionValidatorTest, StoreFailureIsNotAbsent) {
    auto raw = issueSession(alice_);
    store_->setFailing(true);

    auto principal = validator_->validate(raw);
    ASSERT_TRUE(principal.hasError());
    EXPECT_EQ(principal.error().code(), ErrorCode::StoreUnavailable);
    EXPECT_TRUE(principal.error().isRetriable());

    store_->setFailing(false);
    EXPECT_TRUE(validator_->validate(raw).value().has_value());
}

TEST_F(SessionValidatorTest, DisabledOwnerIsAbsent) {
    auto raw = issueSession(alice_);
    auto identity = identities_->findById(alice_).value();
    identity.status = IdentityStatus::Disabled;
    ASSERT_TRUE(identities_->update(identity));

    EXPECT_FALSE(validator_->validate(raw).value().has_value());
}

TEST_F(SessionValidatorTest, DeletedOwnerIsAbsent) {
    auto raw = issueSession(alice_);
    ASSERT_TRUE(identities_->markDeleted(alice_, clock_->now()));
    EXPECT_FALSE(validator_->validate(raw).value().has_value());
}

TEST_F(SessionValidatorTest, CorruptOwnerReferenceDeletesRecord) {
    auto raw = issuer_->generateRawToken().value();
    TokenRecord record;
    record.lookupHash = TokenIssuer::lookupHashOf(raw);
    record.key = record.lookupHash;
    record.salt = "c2FsdA";
    record.tokenHash = TokenIssuer::saltedHashOf(record.salt, raw);
    record.ownerRef = "not-a-number";
    record.issuedAt = clock_->now();
    record.expiresAt = clock_->now() + std::chrono::hours(1);
    ASSERT_TRUE(store_->insert(record).hasValue());

    EXPECT_FALSE(validator_->validate(raw).value().has_value());
    EXPECT_EQ(store_->inner().size(), 0u);
}

TEST_F(SessionValidatorTest, LegacyRecordIsFoundAndBackfilled) {
    auto raw = insertLegacy(alice_);

    auto first = validator_->validate(raw);
    ASSERT_TRUE(first.value().has_value());
    EXPECT_EQ(first.value()->identityId, alice_);
    EXPECT_EQ(metrics_.counterValue(metrics::kTokenSlowPath), 1u);
    EXPECT_EQ(metrics_.counterValue(metrics::kTokenBackfill), 1u);
    EXPECT_EQ(metrics_.counterValue(metrics::kTokenFastPath), 0u);

    auto indexed = store_->findByKey("legacy-1", clock_->now());
    ASSERT_TRUE(indexed.value().has_value());
    EXPECT_EQ(indexed.value()->lookupHash, TokenIssuer::lookupHashOf(raw));

    auto second = validator_->validate(raw);
    ASSERT_TRUE(second.value().has_value());
    EXPECT_EQ(metrics_.counterValue(metrics::kTokenFastPath), 1u);
    EXPECT_EQ(metrics_.counterValue(metrics::kTokenSlowPath), 1u);
}

TEST_F(SessionValidatorTest, LegacyScanReachesRecordsBeyondFirstBatch) {
    config_.legacyScanLimit = 10;
    SessionValidator batched(store_, identities_, clock_, config_, metrics_);

    std::vector<std::string> raws;
    for (int i = 0; i < 35; ++i) {
        raws.push_back(insertLegacy(alice_));
    }

    for (std::size_t i = 0; i < raws.size(); i += 5) {
        auto principal = batched.validate(raws[i]);
        ASSERT_TRUE(principal.hasValue());
        ASSERT_TRUE(principal.value().has_value()) << "legacy token " << i;
        EXPECT_EQ(principal.value()->identityId, alice_);
    }
    EXPECT_EQ(metrics_.counterValue(metrics::kTokenSlowPath), 7u);
    EXPECT_EQ(metrics_.counterValue(metrics::kTokenBackfill), 7u);
    EXPECT_GT(metrics_.counterValue(metrics::kLegacyScanBatches), 7u);
}

TEST_F(SessionValidatorTest, UnknownTokenWalksEveryLegacyBatch) {
    config_.legacyScanLimit = 10;
    SessionValidator batched(store_, identities_, clock_, config_, metrics_);
    for (int i = 0; i < 35; ++i) {
        insertLegacy(alice_);
    }

    auto unknown = issuer_->generateRawToken().value();
    EXPECT_FALSE(batched.validate(unknown).value().has_value());
    EXPECT_EQ(metrics_.counterValue(metrics::kLegacyScanBatches), 4u);
    EXPECT_EQ(metrics_.counterValue(metrics::kTokenSlowPath), 0u);
}

TEST_F(SessionValidatorTest, LegacyLookupCanBeDisabled) {
    config_.legacyLookupEnabled = false;
    SessionValidator strict(store_, identities_, clock_, config_, metrics_);

    auto raw = insertLegacy(alice_);
    EXPECT_FALSE(strict.validate(raw).value().has_value());
    EXPECT_EQ(metrics_.counterValue(metrics::kTokenSlowPath), 0u);
}
