#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "src/http/dispatch/request_registry.hpp"

using tether::http::dispatch::InFlightRequest;
using tether::http::dispatch::RequestRegistry;
using tether::http::model::RequestType;

TEST(RequestRegistryTest, IdentifierIncludesVerbAndUrl) {
    EXPECT_EQ(RequestRegistry::identifier_for(RequestType::GET, "https://x.io/a"), "GET https://x.io/a");
    EXPECT_NE(RequestRegistry::identifier_for(RequestType::GET, "https://x.io/a"), RequestRegistry::identifier_for(RequestType::POST, "https://x.io/a"));
}

TEST(RequestRegistryTest, CancelSetsFlagAndDeregisters) {
    RequestRegistry registry;
    auto request = std::make_shared<InFlightRequest>("GET https://x.io/a");

    EXPECT_FALSE(registry.insert(request));
    EXPECT_TRUE(registry.contains("GET https://x.io/a"));

    EXPECT_TRUE(registry.cancel("GET https://x.io/a"));
    EXPECT_TRUE(request->is_cancelled());
    EXPECT_TRUE(request->cancel_flag().load());
    EXPECT_FALSE(registry.contains("GET https://x.io/a"));

    EXPECT_FALSE(registry.cancel("GET https://x.io/a"));
    EXPECT_FALSE(registry.complete(request));
}

TEST(RequestRegistryTest, CancelUnknownIsNoOp) {
    RequestRegistry registry;
    EXPECT_FALSE(registry.cancel("GET https://x.io/missing"));
    EXPECT_EQ(registry.size(), 0U);
}

TEST(RequestRegistryTest, CompleteDeregisters) {
    RequestRegistry registry;
    auto request = std::make_shared<InFlightRequest>("GET https://x.io/a");
    (void)registry.insert(request);

    EXPECT_TRUE(registry.complete(request));
    EXPECT_FALSE(registry.contains("GET https://x.io/a"));
    EXPECT_FALSE(registry.cancel("GET https://x.io/a"));
    EXPECT_FALSE(request->is_cancelled());
}

TEST(RequestRegistryTest, DuplicateIdentifierReplacesEntry) {
    RequestRegistry registry;
    auto first = std::make_shared<InFlightRequest>("GET https://x.io/a");
    auto second = std::make_shared<InFlightRequest>("GET https://x.io/a");

    EXPECT_FALSE(registry.insert(first));
    EXPECT_TRUE(registry.insert(second));
    EXPECT_EQ(registry.size(), 1U);

    // completing the superseded request must not remove its replacement
    EXPECT_TRUE(registry.complete(first));
    EXPECT_TRUE(registry.contains("GET https://x.io/a"));

    EXPECT_TRUE(registry.cancel("GET https://x.io/a"));
    EXPECT_TRUE(second->is_cancelled());
    EXPECT_FALSE(first->is_cancelled());
}

TEST(RequestRegistryTest, CancelAllCancelsEveryEntry) {
    RequestRegistry registry;
    auto a = std::make_shared<InFlightRequest>("GET https://x.io/a");
    auto b = std::make_shared<InFlightRequest>("POST https://x.io/b");
    (void)registry.insert(a);
    (void)registry.insert(b);

    EXPECT_EQ(registry.cancel_all(), 2U);
    EXPECT_TRUE(a->is_cancelled());
    EXPECT_TRUE(b->is_cancelled());
    EXPECT_EQ(registry.size(), 0U);
    EXPECT_EQ(registry.cancel_all(), 0U);
}

TEST(InFlightRequestTest, DeliveryIsClaimedOnce) {
    InFlightRequest request("GET https://x.io/a");
    EXPECT_TRUE(request.claim_delivery());
    EXPECT_FALSE(request.claim_delivery());
}
