#include "contract_backend.hpp"

#include <memory>
#include <string>
#include <utility>

namespace wttp::backend {
    namespace {
        // Slot layout of the HEADResponse tuple. metadata is fully static and therefore inlined.
        struct HeadSlots {
            static constexpr std::size_t STATUS = 0;
            static constexpr std::size_t HEADER_INFO = 1;
            static constexpr std::size_t METADATA = 2;
            static constexpr std::size_t ETAG = 10;
        };

        struct MetadataSlots {
            static constexpr std::size_t MIME_TYPE = 0;
            static constexpr std::size_t CHARSET = 1;
            static constexpr std::size_t ENCODING = 2;
            static constexpr std::size_t LANGUAGE = 3;
            static constexpr std::size_t SIZE = 4;
            static constexpr std::size_t VERSION = 5;
            static constexpr std::size_t LAST_MODIFIED = 6;
            static constexpr std::size_t HEADER = 7;
        };

        protocol::HeaderInfo decode_header_info(const abi::Decoder& info) {
            protocol::HeaderInfo out;

            const abi::Decoder cache = info.tuple_at(0);
            out.cache_.immutable_ = cache.bool_at(0);
            out.cache_.preset_ = cache.uint_at(1);
            out.cache_.custom_ = cache.string_at(2);

            const abi::Decoder cors = info.tuple_at(1);
            out.cors_.methods_ = cors.uint_at(0);
            out.cors_.origins_ = cors.bytes32_array_at(1);
            out.cors_.preset_ = cors.uint_at(2);
            out.cors_.custom_ = cors.string_at(3);

            const abi::Decoder redirect = info.tuple_at(2);
            out.redirect_.code_ = redirect.uint_at(0);
            out.redirect_.location_ = redirect.string_at(1);

            return out;
        }

        protocol::ResourceMetadata decode_metadata(const abi::Decoder& metadata) {
            protocol::ResourceMetadata out;
            out.properties_.mime_type_ = metadata.bytes2_at(MetadataSlots::MIME_TYPE);
            out.properties_.charset_ = metadata.bytes2_at(MetadataSlots::CHARSET);
            out.properties_.encoding_ = metadata.bytes2_at(MetadataSlots::ENCODING);
            out.properties_.language_ = metadata.bytes2_at(MetadataSlots::LANGUAGE);
            out.size_ = metadata.uint_at(MetadataSlots::SIZE);
            out.version_ = metadata.uint_at(MetadataSlots::VERSION);
            out.last_modified_ = metadata.uint_at(MetadataSlots::LAST_MODIFIED);
            out.header_ = metadata.bytes32_at(MetadataSlots::HEADER);
            return out;
        }
    }  // namespace

    ContractBackend::ContractBackend(std::unique_ptr<rpc::JsonRpcClient> rpc) : rpc_(std::move(rpc)) {}

    std::uint64_t ContractBackend::chain_id() { return rpc_->chain_id(); }

    std::string ContractBackend::describe() const { return rpc_->url(); }

    abi::Encoder ContractBackend::encode_head_request(const protocol::HeadRequest& req) {
        abi::Encoder head;
        head.add_string(req.path_).add_uint(req.if_modified_since_).add_bytes32(req.if_none_match_);
        return head;
    }

    abi::Encoder ContractBackend::encode_locate_request(const protocol::LocateRequest& req) {
        abi::Encoder range;
        range.add_int(req.range_.start_).add_int(req.range_.end_);

        abi::Encoder locate;
        locate.add_tuple(encode_head_request(req.head_)).add_tuple(range);
        return locate;
    }

    protocol::ResponseHead ContractBackend::decode_head(const abi::Decoder& tuple) {
        protocol::ResponseHead out;
        out.status_ = tuple.uint_at(HeadSlots::STATUS);
        out.header_info_ = decode_header_info(tuple.tuple_at(HeadSlots::HEADER_INFO));
        out.metadata_ = decode_metadata(tuple.inline_at(HeadSlots::METADATA));
        out.etag_ = tuple.bytes32_at(HeadSlots::ETAG);
        return out;
    }

    protocol::ResourceLocation ContractBackend::decode_location(const abi::Decoder& tuple) {
        protocol::ResourceLocation out;
        out.head_ = decode_head(tuple.tuple_at(0));

        const abi::Decoder resource = tuple.tuple_at(1);
        out.resource_.chunk_ids_ = resource.bytes32_array_at(0);
        out.resource_.total_chunks_ = resource.uint_at(1);
        return out;
    }

    protocol::ResponseHead ContractBackend::head(const Address& site, const protocol::HeadRequest& req) {
        abi::Encoder args;
        args.add_tuple(encode_head_request(req));

        const Bytes ret = rpc_->eth_call(site, args.encode_call(ContractSignatures::HEAD));
        return decode_head(abi::Decoder(ret).tuple_at(0));
    }

    protocol::ResourceLocation ContractBackend::locate(const Address& site, const protocol::LocateRequest& req) {
        abi::Encoder args;
        args.add_tuple(encode_locate_request(req));

        const Bytes ret = rpc_->eth_call(site, args.encode_call(ContractSignatures::GET));
        return decode_location(abi::Decoder(ret).tuple_at(0));
    }

    Address ContractBackend::storage_of(const Address& site) {
        const Bytes ret = rpc_->eth_call(site, abi::Encoder{}.encode_call(ContractSignatures::DPS));
        return abi::Decoder(ret).address_at(0);
    }

    Bytes ContractBackend::read_chunk(const Address& storage, const Hash32& chunk_id) {
        abi::Encoder args;
        args.add_bytes32(chunk_id);

        const Bytes ret = rpc_->eth_call(storage, args.encode_call(ContractSignatures::READ_DATA_POINT));
        return abi::Decoder(ret).bytes_at(0);
    }

    Address ContractBackend::call_for_address(const Address& target, const char* signature, const Hash32& node) {
        abi::Encoder args;
        args.add_bytes32(node);

        const Bytes ret = rpc_->eth_call(target, args.encode_call(signature));
        return abi::Decoder(ret).address_at(0);
    }

    Address ContractBackend::resolver_of(const Address& registry, const Hash32& node) {
        return call_for_address(registry, ContractSignatures::RESOLVER, node);
    }

    Address ContractBackend::address_of(const Address& resolver, const Hash32& node) {
        return call_for_address(resolver, ContractSignatures::ADDR, node);
    }

    Address ContractBackend::owner_of(const Address& registry, const Hash32& node) {
        return call_for_address(registry, ContractSignatures::OWNER, node);
    }
}  // namespace wttp::backend
