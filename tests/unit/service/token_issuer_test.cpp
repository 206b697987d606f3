#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <unordered_set>

#include "oas/foundation/clock.hpp"
#include "oas/service/input_validator.hpp"
#include "oas/service/token_issuer.hpp"
#include "oas/service/token_store.hpp"
#include "support/test_doubles.hpp"

using namespace oas::service;
using oas::foundation::ErrorCode;
using oas::foundation::IdentityId;
using oas::foundation::ManualClock;
using oas::testing::FailingTokenStore;

class TokenIssuerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryTokenStore>();
        clock_ = std::make_shared<ManualClock>();
        issuer_ = std::make_unique<TokenIssuer>(store_, clock_, config_);
    }

    IssueRequest apiKeyRequest(std::chrono::seconds lifetime) {
        IssueRequest request;
        request.kind = TokenKind::ApiKey;
        request.apiKeyName = "ci";
        request.expiresAt = clock_->now() + lifetime;
        return request;
    }

    AuthConfig config_;
    std::shared_ptr<InMemoryTokenStore> store_;
    std::shared_ptr<ManualClock> clock_;
    std::unique_ptr<TokenIssuer> issuer_;
};

TEST_F(TokenIssuerTest, RawTokenIsUnpaddedBase64Url) {
    auto raw = issuer_->generateRawToken();
    ASSERT_TRUE(raw.hasValue());
    EXPECT_EQ(raw.value().size(), 43u);
    EXPECT_TRUE(InputValidator::validateTokenFormat(raw.value()));
}

TEST_F(TokenIssuerTest, TenThousandTokensAreDistinct) {
    std::unordered_set<std::string> seen;
    for (int i = 0; i < 10000; ++i) {
        auto raw = issuer_->generateRawToken();
        ASSERT_TRUE(raw.hasValue());
        ASSERT_EQ(raw.value().size(), 43u);
        seen.insert(raw.value());
    }
    EXPECT_EQ(seen.size(), 10000u);
}

TEST_F(TokenIssuerTest, IssuedRecordNeverHoldsRawToken) {
    RequestContext ctx{"10.0.0.1", "curl/8"};
    IssueRequest request;
    request.context = ctx;

    auto issued = issuer_->issue(IdentityId(7), request);
    ASSERT_TRUE(issued.hasValue());
    const auto& raw = issued.value().rawToken;

    auto lookup = TokenIssuer::lookupHashOf(raw);
    EXPECT_EQ(lookup.size(), 64u);

    auto record = store_->findByLookupHash(lookup, clock_->now());
    ASSERT_TRUE(record.value().has_value());
    EXPECT_EQ(record.value()->key, lookup);
    EXPECT_EQ(record.value()->ownerRef, "7");
    EXPECT_EQ(record.value()->sourceIp, "10.0.0.1");
    EXPECT_EQ(record.value()->userAgent, "curl/8");
    EXPECT_EQ(record.value()->kind, TokenKind::Session);
    EXPECT_EQ(record.value()->expiresAt, clock_->now() + std::chrono::hours(24));
    EXPECT_NE(record.value()->tokenHash, raw);
    EXPECT_NE(record.value()->tokenHash, lookup);
    EXPECT_EQ(record.value()->tokenHash, TokenIssuer::saltedHashOf(record.value()->salt, raw));
    EXPECT_TRUE(TokenIssuer::matches(raw, *record.value()));
    EXPECT_FALSE(record.value()->provider.has_value());
}

TEST_F(TokenIssuerTest, LookupHashIsDeterministicHex) {
    auto a = TokenIssuer::lookupHashOf("abc");
    EXPECT_EQ(a, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(a, TokenIssuer::lookupHashOf("abc"));
}

TEST_F(TokenIssuerTest, MatchesRejectsOtherToken) {
    auto issued = issuer_->issue(IdentityId(1), IssueRequest{}).value();
    auto record =
        store_->findByLookupHash(TokenIssuer::lookupHashOf(issued.rawToken), clock_->now());
    auto other = issuer_->generateRawToken().value();
    EXPECT_FALSE(TokenIssuer::matches(other, *record.value()));
}

TEST_F(TokenIssuerTest, ProviderSessionCarriesProvider) {
    IssueRequest request;
    request.kind = TokenKind::OAuthSession;
    request.provider = "github";
    auto issued = issuer_->issue(IdentityId(3), request);
    ASSERT_TRUE(issued.hasValue());

    auto record = store_->findByLookupHash(TokenIssuer::lookupHashOf(issued.value().rawToken),
                                           clock_->now());
    EXPECT_EQ(record.value()->provider, std::optional<std::string>("github"));
}

TEST_F(TokenIssuerTest, ApiKeyKeepsRequestedExpiry) {
    auto issued = issuer_->issue(IdentityId(3), apiKeyRequest(std::chrono::hours(24 * 30)));
    ASSERT_TRUE(issued.hasValue());
    EXPECT_EQ(issued.value().kind, TokenKind::ApiKey);
    EXPECT_EQ(issued.value().expiresAt, clock_->now() + std::chrono::hours(24 * 30));
}

TEST_F(TokenIssuerTest, ApiKeyExpiryRules) {
    IssueRequest missing;
    missing.kind = TokenKind::ApiKey;
    EXPECT_EQ(issuer_->issue(IdentityId(3), missing).error().code(), ErrorCode::InvalidExpiry);

    EXPECT_EQ(issuer_->issue(IdentityId(3), apiKeyRequest(std::chrono::seconds(0)))
                  .error()
                  .code(),
              ErrorCode::InvalidExpiry);
    EXPECT_EQ(issuer_->issue(IdentityId(3), apiKeyRequest(std::chrono::hours(24 * 366)))
                  .error()
                  .code(),
              ErrorCode::InvalidExpiry);
    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(TokenIssuerTest, InvalidOwnerRejected) {
    EXPECT_EQ(issuer_->issue(IdentityId(), IssueRequest{}).error().code(),
              ErrorCode::InvalidArgument);
}

TEST_F(TokenIssuerTest, StoreFailureSurfaces) {
    auto failing = std::make_shared<FailingTokenStore>(ErrorCode::StoreTimeout);
    failing->setFailing(true);
    TokenIssuer issuer(failing, clock_, config_);

    auto issued = issuer.issue(IdentityId(1), IssueRequest{});
    ASSERT_TRUE(issued.hasError());
    EXPECT_EQ(issued.error().code(), ErrorCode::StoreTimeout);
}
