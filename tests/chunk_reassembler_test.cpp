#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "src/endpoint/endpoint.hpp"
#include "src/error/gateway_error.hpp"
#include "src/protocol/chunk_reassembler.hpp"
#include "support/fake_backend.hpp"

using namespace wttp;

namespace {
    const Address SITE = test_support::address_of_byte(0x5e);

    struct ChunkReassemblerFixture : public ::testing::Test {
        ChunkReassemblerFixture() {
            auto endpoint = std::make_shared<endpoint::Endpoint>();
            endpoint->key_ = "test";
            endpoint->backend_ = backend_;
            reassembler_ = std::make_unique<protocol::ChunkReassembler>(endpoint);

            backend_->chunks_[test_support::chunk_id(0xF0)] = Bytes{1, 2, 3};
            backend_->chunks_[test_support::chunk_id(0x01)] = Bytes{4};
            backend_->chunks_[test_support::chunk_id(0x80)] = Bytes{5, 6};
        }

        std::shared_ptr<test_support::FakeBackend> backend_ = std::make_shared<test_support::FakeBackend>();
        std::unique_ptr<protocol::ChunkReassembler> reassembler_;
    };
}  // namespace

TEST_F(ChunkReassemblerFixture, ConcatenatesInListOrderNotIdOrder) {
    const std::vector<Hash32> ids = {test_support::chunk_id(0xF0), test_support::chunk_id(0x01), test_support::chunk_id(0x80)};

    EXPECT_EQ(reassembler_->reassemble(SITE, ids), (Bytes{1, 2, 3, 4, 5, 6}));
    EXPECT_EQ(backend_->read_order_, ids);
    EXPECT_EQ(backend_->storage_calls_, 1);
}

TEST_F(ChunkReassemblerFixture, RepeatedIdsAreReadEachTime) {
    const std::vector<Hash32> ids = {test_support::chunk_id(0x01), test_support::chunk_id(0x01)};
    EXPECT_EQ(reassembler_->reassemble(SITE, ids), (Bytes{4, 4}));
}

TEST_F(ChunkReassemblerFixture, EmptyListIsInvalid) {
    EXPECT_THROW(reassembler_->reassemble(SITE, {}), error::InvalidArgumentError);
    EXPECT_EQ(backend_->storage_calls_, 0);
}

TEST_F(ChunkReassemblerFixture, FailedReadReportsPosition) {
    backend_->fail_chunk_read_at_ = 1;
    const std::vector<Hash32> ids = {test_support::chunk_id(0xF0), test_support::chunk_id(0x01), test_support::chunk_id(0x80)};

    try {
        reassembler_->reassemble(SITE, ids);
        FAIL() << "expected ChunkReadError";
    } catch (const error::ChunkReadError& e) {
        EXPECT_EQ(e.index_, 1U);
        EXPECT_EQ(e.total_, 3U);
        EXPECT_EQ(std::string(e.what()), "Failed to read chunk 2/3: readDataPoint reverted");
    }
    EXPECT_EQ(backend_->chunk_reads_, 2U);
}

TEST_F(ChunkReassemblerFixture, StorageLookupFailureIsAChunkReadError) {
    backend_->fail_storage_ = true;
    EXPECT_THROW(reassembler_->reassemble(SITE, {test_support::chunk_id(0x01)}), error::ChunkReadError);
    EXPECT_EQ(backend_->chunk_reads_, 0U);
}
