#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "src/abi/abi_codec.hpp"
#include "src/backend/contract_backend.hpp"
#include "src/error/gateway_error.hpp"
#include "src/utils/hex_utils.hpp"
#include "support/fake_backend.hpp"
#include "support/fake_transport.hpp"

using namespace wttp;

namespace {
    Hash32 left_aligned(const char* code) {
        Hash32 word{};
        word[0] = static_cast<std::uint8_t>(code[0]);
        word[1] = static_cast<std::uint8_t>(code[1]);
        return word;
    }

    // HEADResponse as the site contract encodes it.
    wttp::abi::Encoder head_response(std::uint64_t status, const std::string& location, std::uint64_t size) {
        wttp::abi::Encoder cache;
        cache.add_bool(true).add_uint(2).add_string("");
        wttp::abi::Encoder cors;
        cors.add_uint(1).add_bytes32_array({test_support::chunk_id(0x0c)}).add_uint(0).add_string("");
        wttp::abi::Encoder redirect;
        redirect.add_uint(location.empty() ? 0 : status).add_string(location);

        wttp::abi::Encoder header_info;
        header_info.add_tuple(cache).add_tuple(cors).add_tuple(redirect);

        wttp::abi::Encoder metadata;
        metadata.add_bytes32(left_aligned("th"))
            .add_bytes32(left_aligned("u8"))
            .add_bytes32(ZERO_HASH)
            .add_bytes32(left_aligned("en"))
            .add_uint(size)
            .add_uint(3)
            .add_uint(1700000000)
            .add_bytes32(test_support::chunk_id(0x0d));

        wttp::abi::Encoder head;
        head.add_uint(status).add_tuple(header_info).add_tuple(metadata).add_bytes32(test_support::chunk_id(0xee));
        return head;
    }

    std::string returned(const wttp::abi::Encoder& value) {
        wttp::abi::Encoder wrapper;
        wrapper.add_tuple(value);
        return hex_utils::to_hex(wrapper.encode());
    }

    struct ContractBackendFixture : public ::testing::Test {
        std::shared_ptr<test_support::TransportLog> log_ = std::make_shared<test_support::TransportLog>();
        backend::ContractBackend backend_{
            std::make_unique<rpc::JsonRpcClient>("http://node.test", std::make_unique<test_support::FakeTransport>(log_))};
        Address site_ = test_support::address_of_byte(0x51);
    };
}  // namespace

TEST_F(ContractBackendFixture, HeadDecodesEveryField) {
    log_->replies_.push_back(test_support::result_reply(returned(head_response(301, "/new/", 1234))));

    const protocol::ResponseHead head = backend_.head(site_, protocol::HeadRequest{.path_ = "/old"});

    EXPECT_EQ(head.status_, 301U);
    EXPECT_TRUE(head.header_info_.cache_.immutable_);
    EXPECT_EQ(head.header_info_.cache_.preset_, 2U);
    EXPECT_EQ(head.header_info_.cors_.methods_, 1U);
    ASSERT_EQ(head.header_info_.cors_.origins_.size(), 1U);
    EXPECT_EQ(head.header_info_.cors_.origins_[0], test_support::chunk_id(0x0c));
    EXPECT_EQ(head.header_info_.redirect_.code_, 301U);
    EXPECT_EQ(head.header_info_.redirect_.location_, "/new/");
    EXPECT_EQ(head.metadata_.properties_.mime_type_, test_support::mime("th"));
    EXPECT_EQ(head.metadata_.properties_.charset_, test_support::mime("u8"));
    EXPECT_EQ(head.metadata_.properties_.language_, test_support::mime("en"));
    EXPECT_EQ(head.metadata_.size_, 1234U);
    EXPECT_EQ(head.metadata_.version_, 3U);
    EXPECT_EQ(head.metadata_.last_modified_, 1700000000U);
    EXPECT_EQ(head.metadata_.header_, test_support::chunk_id(0x0d));
    EXPECT_EQ(head.etag_, test_support::chunk_id(0xee));

    const std::string& body = log_->requests_.at(0).body_;
    EXPECT_NE(body.find(R"("data":"0x28699f17)"), std::string::npos);
    EXPECT_NE(body.find(R"("to":"0x5151515151515151515151515151515151515151")"), std::string::npos);
}

TEST_F(ContractBackendFixture, LocateDecodesChunkIds) {
    wttp::abi::Encoder resource;
    resource.add_bytes32_array({test_support::chunk_id(1), test_support::chunk_id(2)}).add_uint(3);
    wttp::abi::Encoder location;
    location.add_tuple(head_response(200, "", 99)).add_tuple(resource);
    log_->replies_.push_back(test_support::result_reply(returned(location)));

    const auto result = backend_.locate(site_, protocol::LocateRequest{.head_ = {.path_ = "/a.txt"}, .range_ = {}});

    EXPECT_EQ(result.head_.status_, 200U);
    EXPECT_EQ(result.head_.metadata_.size_, 99U);
    EXPECT_EQ(result.resource_.chunk_ids_, (std::vector<Hash32>{test_support::chunk_id(1), test_support::chunk_id(2)}));
    EXPECT_EQ(result.resource_.total_chunks_, 3U);
    EXPECT_NE(log_->requests_.at(0).body_.find(R"("data":"0x0f9004b8)"), std::string::npos);
}

TEST_F(ContractBackendFixture, StorageAndChunkReads) {
    wttp::abi::Encoder storage;
    storage.add_address(test_support::address_of_byte(0xAB));
    log_->replies_.push_back(test_support::result_reply(hex_utils::to_hex(storage.encode())));

    wttp::abi::Encoder chunk;
    chunk.add_string("hello");
    log_->replies_.push_back(test_support::result_reply(hex_utils::to_hex(chunk.encode())));

    const Address storage_address = backend_.storage_of(site_);
    EXPECT_EQ(storage_address, test_support::address_of_byte(0xAB));
    EXPECT_EQ(backend_.read_chunk(storage_address, test_support::chunk_id(9)), (Bytes{'h', 'e', 'l', 'l', 'o'}));
    EXPECT_NE(log_->requests_.at(0).body_.find(R"("data":"0xef4e06ec")"), std::string::npos);
    EXPECT_NE(log_->requests_.at(1).body_.find(R"("data":"0x80435b64)"), std::string::npos);
}

TEST_F(ContractBackendFixture, EmptyReturnDataIsAnAbiError) {
    log_->replies_.push_back(test_support::result_reply("0x"));
    EXPECT_THROW(backend_.head(site_, protocol::HeadRequest{.path_ = "/"}), error::AbiError);
}

TEST_F(ContractBackendFixture, NamingCallsUseTheirSelectors) {
    wttp::abi::Encoder resolver;
    resolver.add_address(test_support::address_of_byte(0x77));
    log_->replies_.push_back(test_support::result_reply(hex_utils::to_hex(resolver.encode())));
    log_->replies_.push_back(test_support::result_reply(hex_utils::to_hex(resolver.encode())));
    log_->replies_.push_back(test_support::result_reply(hex_utils::to_hex(resolver.encode())));

    EXPECT_EQ(backend_.resolver_of(test_support::address_of_byte(1), ZERO_HASH), test_support::address_of_byte(0x77));
    EXPECT_EQ(backend_.address_of(test_support::address_of_byte(1), ZERO_HASH), test_support::address_of_byte(0x77));
    EXPECT_EQ(backend_.owner_of(test_support::address_of_byte(1), ZERO_HASH), test_support::address_of_byte(0x77));

    EXPECT_NE(log_->requests_.at(0).body_.find("0x0178b8bf"), std::string::npos);
    EXPECT_NE(log_->requests_.at(1).body_.find("0x3b3b57de"), std::string::npos);
    EXPECT_NE(log_->requests_.at(2).body_.find("0x02571be3"), std::string::npos);
}
