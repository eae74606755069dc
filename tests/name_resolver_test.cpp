#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "src/cache/cache_set.hpp"
#include "src/config/gateway_config.hpp"
#include "src/endpoint/endpoint_registry.hpp"
#include "src/error/gateway_error.hpp"
#include "src/names/name_resolver.hpp"
#include "src/names/namehash.hpp"
#include "support/fake_backend.hpp"

using namespace wttp;

namespace {
    const Address SITE = test_support::address_of_byte(0x5e);

    struct NameResolverFixture : public ::testing::Test {
        NameResolverFixture() {
            polygon_->chain_id_ = 137;
            ethereum_->chain_id_ = 1;
        }

        std::shared_ptr<test_support::FakeBackend> polygon_ = std::make_shared<test_support::FakeBackend>();
        std::shared_ptr<test_support::FakeBackend> ethereum_ = std::make_shared<test_support::FakeBackend>();
        int ethereum_created_ = 0;
        cache::CacheSet caches_;
        std::shared_ptr<const config::GatewayConfig> config_ = std::make_shared<const config::GatewayConfig>();
        endpoint::EndpointRegistry registry_{config_, caches_, [this](const std::string& rpc_url) -> std::shared_ptr<backend::IContractBackend> {
                                                 if (rpc_url == config_->find_network("ethereum")->rpc_url_) {
                                                     ++ethereum_created_;
                                                     return ethereum_;
                                                 }
                                                 return polygon_;
                                             }};
        names::NameResolver resolver_{registry_, caches_.names_};
    };
}  // namespace

TEST_F(NameResolverFixture, ResolvesThroughRegistryAndResolver) {
    ethereum_->register_name(names::namehash("site.eth"), SITE);
    auto endpoint = registry_.get_endpoint("ethereum");

    EXPECT_EQ(resolver_.resolve(*endpoint, "site.eth"), SITE);
    EXPECT_EQ(ethereum_->resolver_calls_, 1);
    EXPECT_EQ(ethereum_->addr_calls_, 1);
}

TEST_F(NameResolverFixture, CacheHitSkipsTheBackend) {
    ethereum_->register_name(names::namehash("site.eth"), SITE);
    auto endpoint = registry_.get_endpoint("ethereum");

    resolver_.resolve(*endpoint, "site.eth");
    EXPECT_EQ(resolver_.resolve(*endpoint, "  SITE.eth "), SITE);

    EXPECT_EQ(ethereum_->resolver_calls_, 1);
    EXPECT_TRUE(caches_.names_->contains("site.eth"));
}

TEST_F(NameResolverFixture, BypassingTheCacheQueriesAgainAndStoresNothing) {
    ethereum_->register_name(names::namehash("site.eth"), SITE);
    auto endpoint = registry_.get_endpoint("ethereum");
    const names::ResolveOptions no_cache{.fallback_to_root_ = true, .use_cache_ = false};

    resolver_.resolve(*endpoint, "site.eth", no_cache);
    resolver_.resolve(*endpoint, "site.eth", no_cache);

    EXPECT_EQ(ethereum_->resolver_calls_, 2);
    EXPECT_FALSE(caches_.names_->contains("site.eth"));
}

TEST_F(NameResolverFixture, FallsBackToTheRootNetwork) {
    ethereum_->register_name(names::namehash("site.eth"), SITE);
    auto polygon = registry_.get_endpoint("polygon");

    EXPECT_EQ(resolver_.resolve(*polygon, "site.eth"), SITE);
    EXPECT_EQ(ethereum_created_, 1);
    EXPECT_EQ(polygon_->resolver_calls_, 0);
    EXPECT_TRUE(caches_.names_->contains("site.eth"));
}

TEST_F(NameResolverFixture, WithoutFallbackTheNetworkErrorSurfaces) {
    ethereum_->register_name(names::namehash("site.eth"), SITE);
    auto polygon = registry_.get_endpoint("polygon");

    EXPECT_THROW(resolver_.resolve(*polygon, "site.eth", {.fallback_to_root_ = false, .use_cache_ = true}), error::NameNotRegisteredError);
    EXPECT_EQ(ethereum_created_, 0);
}

TEST_F(NameResolverFixture, BothNetworksFailingCarriesBothMessages) {
    auto polygon = registry_.get_endpoint("polygon");

    try {
        resolver_.resolve(*polygon, "missing.eth");
        FAIL() << "expected NameResolutionError";
    } catch (const error::NameResolutionError& e) {
        EXPECT_EQ(e.name_, "missing.eth");
        EXPECT_NE(e.primary_error_.find("no naming registry"), std::string::npos);
        EXPECT_NE(e.fallback_error_.find("no resolver set"), std::string::npos);
    }
    EXPECT_FALSE(caches_.names_->contains("missing.eth"));
}

TEST_F(NameResolverFixture, RootNetworkFailureDoesNotFallBack) {
    auto ethereum = registry_.get_endpoint("ethereum");
    EXPECT_THROW(resolver_.resolve(*ethereum, "missing.eth"), error::NameNotRegisteredError);
    EXPECT_EQ(ethereum_created_, 1);
}

TEST_F(NameResolverFixture, ZeroAddressIsNotRegistered) {
    ethereum_->register_name(names::namehash("empty.eth"), ZERO_ADDRESS);
    auto ethereum = registry_.get_endpoint("ethereum");
    EXPECT_THROW(resolver_.resolve(*ethereum, "empty.eth"), error::NameNotRegisteredError);
}

TEST_F(NameResolverFixture, ExistsChecksOwnerAndNeverThrows) {
    ethereum_->register_name(names::namehash("site.eth"), SITE);
    auto ethereum = registry_.get_endpoint("ethereum");
    auto polygon = registry_.get_endpoint("polygon");

    EXPECT_TRUE(resolver_.exists(*ethereum, "site.eth"));
    EXPECT_FALSE(resolver_.exists(*ethereum, "missing.eth"));
    EXPECT_FALSE(resolver_.exists(*polygon, "site.eth"));

    ethereum_->naming_fails_ = true;
    EXPECT_FALSE(resolver_.exists(*ethereum, "site.eth"));
}

TEST_F(NameResolverFixture, EmptyNameIsInvalid) {
    auto ethereum = registry_.get_endpoint("ethereum");
    EXPECT_THROW(resolver_.resolve(*ethereum, "   "), error::InvalidArgumentError);
}
