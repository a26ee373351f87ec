#include "bulkfetch/model/DownloadTask.hpp"
#include "bulkfetch/model/Resolution.hpp"

#include <gtest/gtest.h>

using namespace bulkfetch;

TEST(ResolutionTest, NamesAndHeights) {
    EXPECT_EQ(model::heightOf(model::Resolution::r4k), 2160);
    EXPECT_EQ(model::heightOf(model::Resolution::r360p), 360);
    EXPECT_EQ(model::toString(model::Resolution::r720p), "720p");
    EXPECT_EQ(model::parseResolution(" 1080P "), model::Resolution::r1080p);
    EXPECT_EQ(model::parseResolution("4k"), model::Resolution::r4k);
    EXPECT_EQ(model::parseResolution("2160p"), model::Resolution::r4k);
    EXPECT_FALSE(model::parseResolution("240p").has_value());
}

TEST(ResolutionTest, HeightMapsToLargestTierNotAbove) {
    EXPECT_EQ(model::resolutionFromHeight(4320), model::Resolution::r4k);
    EXPECT_EQ(model::resolutionFromHeight(1079), model::Resolution::r720p);
    EXPECT_EQ(model::resolutionFromHeight(480), model::Resolution::r480p);
    EXPECT_EQ(model::resolutionFromHeight(144), model::Resolution::r360p);
}

TEST(FailureKindTest, RetryAndPenaltyRules) {
    using model::FailureKind;
    for (auto kind : {FailureKind::item_not_found, FailureKind::item_restricted, FailureKind::malformed_id}) {
        EXPECT_FALSE(model::isRetryable(kind)) << model::toString(kind);
        EXPECT_FALSE(model::penalizesProxy(kind)) << model::toString(kind);
    }
    for (auto kind : {FailureKind::network_timeout, FailureKind::proxy_transfer}) {
        EXPECT_TRUE(model::isRetryable(kind));
        EXPECT_TRUE(model::penalizesProxy(kind));
    }
    for (auto kind : {FailureKind::no_healthy_proxy, FailureKind::storage_transient, FailureKind::internal}) {
        EXPECT_TRUE(model::isRetryable(kind));
        EXPECT_FALSE(model::penalizesProxy(kind));
    }

    auto fatal = model::FetchResult::failed(FailureKind::item_restricted, "Private video");
    EXPECT_EQ(fatal.status, model::FetchStatus::fatal);
    EXPECT_EQ(model::describe(fatal.failure), "item_restricted: Private video");
    EXPECT_EQ(model::describe(model::Failure{FailureKind::internal, {}}), "internal");
}

TEST(FailureKindTest, AttemptOutcomeFollowsFetchStatus) {
    auto retryable = model::FetchResult::failed(model::FailureKind::network_timeout, "slow");
    auto attempt = model::makeAttempt(2, "http://p:1", retryable);
    EXPECT_EQ(attempt.number, 2);
    EXPECT_EQ(attempt.proxyKey, "http://p:1");
    EXPECT_EQ(attempt.outcome, model::AttemptOutcome::retryable_error);
    EXPECT_EQ(attempt.failure.kind, model::FailureKind::network_timeout);

    auto ok = model::makeAttempt(1, "http://p:1", model::FetchResult::ok(model::Artifact{}));
    EXPECT_EQ(ok.outcome, model::AttemptOutcome::success);
    EXPECT_STREQ(model::toString(model::AttemptOutcome::fatal_error), "fatal_error");
}
