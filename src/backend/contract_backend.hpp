#ifndef WTTP_GATEWAY_CONTRACT_BACKEND_HPP
#define WTTP_GATEWAY_CONTRACT_BACKEND_HPP

#include <memory>
#include <string>

#include "../abi/abi_codec.hpp"
#include "../rpc/json_rpc.hpp"
#include "interface.hpp"

namespace wttp::backend {
    struct ContractSignatures {
        static constexpr const char* HEAD = "HEAD((string,uint256,bytes32))";
        static constexpr const char* GET = "GET(((string,uint256,bytes32),(int256,int256)))";
        static constexpr const char* DPS = "DPS()";
        static constexpr const char* READ_DATA_POINT = "readDataPoint(bytes32)";
        static constexpr const char* RESOLVER = "resolver(bytes32)";
        static constexpr const char* ADDR = "addr(bytes32)";
        static constexpr const char* OWNER = "owner(bytes32)";
    };

    // Backend speaking to WTTP site contracts through eth_call.
    class ContractBackend : public IContractBackend {
       public:
        explicit ContractBackend(std::unique_ptr<rpc::JsonRpcClient> rpc);

        std::uint64_t chain_id() override;

        protocol::ResponseHead head(const Address& site, const protocol::HeadRequest& req) override;
        protocol::ResourceLocation locate(const Address& site, const protocol::LocateRequest& req) override;
        Address storage_of(const Address& site) override;
        Bytes read_chunk(const Address& storage, const Hash32& chunk_id) override;

        Address resolver_of(const Address& registry, const Hash32& node) override;
        Address address_of(const Address& resolver, const Hash32& node) override;
        Address owner_of(const Address& registry, const Hash32& node) override;

        [[nodiscard]] std::string describe() const override;

        static abi::Encoder encode_head_request(const protocol::HeadRequest& req);
        static abi::Encoder encode_locate_request(const protocol::LocateRequest& req);
        static protocol::ResponseHead decode_head(const abi::Decoder& tuple);
        static protocol::ResourceLocation decode_location(const abi::Decoder& tuple);

       private:
        Address call_for_address(const Address& target, const char* signature, const Hash32& node);

        std::unique_ptr<rpc::JsonRpcClient> rpc_;
    };
}  // namespace wttp::backend

#endif
