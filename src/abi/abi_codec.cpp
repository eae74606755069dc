#include "abi_codec.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "../error/gateway_error.hpp"
#include "keccak.hpp"

namespace wttp::abi {
    namespace {
        using constants::WORD_SIZE;

        Bytes word_from_uint(std::uint64_t value, std::uint8_t fill = 0) {
            Bytes word(WORD_SIZE, fill);
            for (std::size_t i = 0; i < sizeof(value); ++i) {
                word[WORD_SIZE - 1 - i] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFFU);
            }
            return word;
        }

        std::size_t padded_length(std::size_t length) { return ((length + WORD_SIZE - 1) / WORD_SIZE) * WORD_SIZE; }
    }  // namespace

    Selector selector(std::string_view signature) {
        const Hash32 hash = Keccak256::digest(signature);
        Selector out{};
        std::copy_n(hash.begin(), out.size(), out.begin());
        return out;
    }

    //
    // Encoder implementation
    //

    Encoder& Encoder::add_uint(std::uint64_t value) {
        slots_.push_back(Slot{.dynamic_ = false, .data_ = word_from_uint(value)});
        return *this;
    }

    Encoder& Encoder::add_int(std::int64_t value) {
        const std::uint8_t fill = value < 0 ? 0xFF : 0x00;
        slots_.push_back(Slot{.dynamic_ = false, .data_ = word_from_uint(static_cast<std::uint64_t>(value), fill)});
        return *this;
    }

    Encoder& Encoder::add_bool(bool value) { return add_uint(value ? 1 : 0); }

    Encoder& Encoder::add_bytes32(const Hash32& value) {
        slots_.push_back(Slot{.dynamic_ = false, .data_ = Bytes(value.begin(), value.end())});
        return *this;
    }

    Encoder& Encoder::add_address(const Address& value) {
        Bytes word(WORD_SIZE, 0);
        std::copy(value.begin(), value.end(), word.begin() + static_cast<std::ptrdiff_t>(WORD_SIZE - value.size()));
        slots_.push_back(Slot{.dynamic_ = false, .data_ = std::move(word)});
        return *this;
    }

    Encoder& Encoder::add_string(std::string_view value) {
        Bytes tail = word_from_uint(value.size());
        tail.insert(tail.end(), value.begin(), value.end());
        tail.resize(WORD_SIZE + padded_length(value.size()), 0);
        slots_.push_back(Slot{.dynamic_ = true, .data_ = std::move(tail)});
        return *this;
    }

    Encoder& Encoder::add_bytes32_array(const std::vector<Hash32>& values) {
        Bytes tail = word_from_uint(values.size());
        for (const auto& value : values) {
            tail.insert(tail.end(), value.begin(), value.end());
        }
        slots_.push_back(Slot{.dynamic_ = true, .data_ = std::move(tail)});
        return *this;
    }

    Encoder& Encoder::add_tuple(const Encoder& tuple) {
        slots_.push_back(Slot{.dynamic_ = tuple.is_dynamic(), .data_ = tuple.encode()});
        return *this;
    }

    bool Encoder::is_dynamic() const {
        return std::any_of(slots_.begin(), slots_.end(), [](const Slot& slot) { return slot.dynamic_; });
    }

    Bytes Encoder::encode() const {
        std::size_t head_size = 0;
        for (const auto& slot : slots_) {
            head_size += slot.dynamic_ ? WORD_SIZE : slot.data_.size();
        }

        Bytes head;
        Bytes tail;
        head.reserve(head_size);

        for (const auto& slot : slots_) {
            if (slot.dynamic_) {
                const Bytes offset = word_from_uint(head_size + tail.size());
                head.insert(head.end(), offset.begin(), offset.end());
                tail.insert(tail.end(), slot.data_.begin(), slot.data_.end());
            } else {
                head.insert(head.end(), slot.data_.begin(), slot.data_.end());
            }
        }

        head.insert(head.end(), tail.begin(), tail.end());
        return head;
    }

    Bytes Encoder::encode_call(std::string_view signature) const {
        const Selector sel = selector(signature);
        Bytes out(sel.begin(), sel.end());
        const Bytes args = encode();
        out.insert(out.end(), args.begin(), args.end());
        return out;
    }

    //
    // Decoder implementation
    //

    Decoder::Decoder(std::span<const std::uint8_t> data, std::size_t base) : data_(data), base_(base) {}

    std::span<const std::uint8_t> Decoder::slice(std::size_t position, std::size_t length) const {
        if (position > data_.size() || length > data_.size() - position) {
            throw error::AbiError("read of " + std::to_string(length) + " bytes at " + std::to_string(position) + " exceeds " +
                                  std::to_string(data_.size()) + " bytes of return data");
        }
        return data_.subspan(position, length);
    }

    std::span<const std::uint8_t> Decoder::word(std::size_t slot) const { return slice(base_ + slot * WORD_SIZE, WORD_SIZE); }

    std::uint64_t Decoder::uint_at(std::size_t slot) const {
        const auto w = word(slot);
        const auto high_end = w.begin() + static_cast<std::ptrdiff_t>(WORD_SIZE - sizeof(std::uint64_t));
        if (std::any_of(w.begin(), high_end, [](std::uint8_t b) { return b != 0; })) {
            throw error::AbiError("integer in slot " + std::to_string(slot) + " does not fit in 64 bits");
        }

        std::uint64_t value = 0;
        for (auto it = high_end; it != w.end(); ++it) {
            value = (value << 8) | *it;
        }
        return value;
    }

    bool Decoder::bool_at(std::size_t slot) const { return uint_at(slot) != 0; }

    Hash32 Decoder::bytes32_at(std::size_t slot) const {
        const auto w = word(slot);
        Hash32 out{};
        std::copy(w.begin(), w.end(), out.begin());
        return out;
    }

    MimeCode Decoder::bytes2_at(std::size_t slot) const {
        const auto w = word(slot);
        return MimeCode{w[0], w[1]};
    }

    Address Decoder::address_at(std::size_t slot) const {
        const auto w = word(slot);
        Address out{};
        std::copy(w.end() - static_cast<std::ptrdiff_t>(out.size()), w.end(), out.begin());
        return out;
    }

    std::size_t Decoder::offset_at(std::size_t slot) const {
        const std::uint64_t relative = uint_at(slot);
        if (relative > data_.size()) {
            throw error::AbiError("offset " + std::to_string(relative) + " in slot " + std::to_string(slot) + " is out of range");
        }
        return base_ + static_cast<std::size_t>(relative);
    }

    std::string Decoder::string_at(std::size_t slot) const {
        const Bytes raw = bytes_at(slot);
        return {raw.begin(), raw.end()};
    }

    Bytes Decoder::bytes_at(std::size_t slot) const {
        const std::size_t position = offset_at(slot);
        const std::uint64_t length = Decoder(data_, position).uint_at(0);
        const auto body = slice(position + WORD_SIZE, static_cast<std::size_t>(std::min<std::uint64_t>(length, data_.size())));
        if (body.size() != length) {
            throw error::AbiError("dynamic bytes length " + std::to_string(length) + " exceeds return data");
        }
        return {body.begin(), body.end()};
    }

    std::vector<Hash32> Decoder::bytes32_array_at(std::size_t slot) const {
        const std::size_t position = offset_at(slot);
        const Decoder array(data_, position);
        const std::uint64_t count = array.uint_at(0);
        if (count > data_.size() / WORD_SIZE) {
            throw error::AbiError("array length " + std::to_string(count) + " exceeds return data");
        }

        std::vector<Hash32> out;
        out.reserve(static_cast<std::size_t>(count));
        for (std::size_t i = 0; i < count; ++i) {
            out.push_back(array.bytes32_at(i + 1));
        }
        return out;
    }

    Decoder Decoder::tuple_at(std::size_t slot) const { return Decoder(data_, offset_at(slot)); }

    Decoder Decoder::inline_at(std::size_t slot) const { return Decoder(data_, base_ + slot * WORD_SIZE); }
}  // namespace wttp::abi
