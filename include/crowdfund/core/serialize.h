// CROWDFUND - Serialization Header
// Copyright (c) 2024 CROWDFUND Developers
// MIT License
//
// Binary encoding of persisted campaign records. Integers are fixed-width
// little-endian, amounts 16 bytes wide; strings carry a CompactSize length;
// addresses are raw bytes.
// Decoding failures throw std::ios_base::failure.

#ifndef CROWDFUND_CORE_SERIALIZE_H
#define CROWDFUND_CORE_SERIALIZE_H

#include "crowdfund/core/types.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace crowdfund {

/// Longest string a record may carry
static constexpr uint64_t MAX_SERIALIZED_SIZE = 0x02000000;

// ============================================================================
// DataStream
// ============================================================================

/// Growable byte buffer with a read cursor
class DataStream {
public:
    DataStream() = default;
    explicit DataStream(std::vector<uint8_t> bytes) : buf_(std::move(bytes)) {}
    DataStream(const uint8_t* bytes, size_t len) : buf_(bytes, bytes + len) {}

    /// Bytes not yet read
    size_t size() const noexcept { return buf_.size() - cursor_; }
    bool empty() const noexcept { return cursor_ == buf_.size(); }
    const uint8_t* data() const noexcept { return buf_.data() + cursor_; }

    void Write(const void* src, size_t len) {
        const auto* p = static_cast<const uint8_t*>(src);
        buf_.insert(buf_.end(), p, p + len);
    }

    void Read(void* dst, size_t len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream: read past end of record");
        }
        std::memcpy(dst, data(), len);
        cursor_ += len;
    }

    /// Unread bytes as a string, the form stored as a database value
    std::string str() const {
        return std::string(reinterpret_cast<const char*>(data()), size());
    }

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);

private:
    std::vector<uint8_t> buf_;
    size_t cursor_{0};
};

// ============================================================================
// Fixed-Width Integers
// ============================================================================

template<typename Stream, typename UInt>
void WriteLE(Stream& s, UInt value) {
    static_assert(std::is_unsigned<UInt>::value, "WriteLE takes unsigned values");
    uint8_t buf[sizeof(UInt)];
    for (size_t i = 0; i < sizeof(UInt); ++i) {
        buf[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    s.Write(buf, sizeof(UInt));
}

template<typename UInt, typename Stream>
UInt ReadLE(Stream& s) {
    static_assert(std::is_unsigned<UInt>::value, "ReadLE yields unsigned values");
    uint8_t buf[sizeof(UInt)];
    s.Read(buf, sizeof(UInt));
    UInt value = 0;
    for (size_t i = sizeof(UInt); i-- > 0;) {
        value = static_cast<UInt>((value << 8) | buf[i]);
    }
    return value;
}

template<typename Int>
using EnableIfFixedWidth =
    std::enable_if_t<std::is_integral<Int>::value && !std::is_same<Int, bool>::value &&
                     sizeof(Int) <= sizeof(uint64_t)>;

template<typename Stream, typename Int, typename = EnableIfFixedWidth<Int>>
void Serialize(Stream& s, Int value) {
    WriteLE(s, static_cast<std::make_unsigned_t<Int>>(value));
}

template<typename Stream, typename Int, typename = EnableIfFixedWidth<Int>>
void Unserialize(Stream& s, Int& value) {
    value = static_cast<Int>(ReadLE<std::make_unsigned_t<Int>>(s));
}

// Amounts: 16 bytes, low half first
template<typename Stream>
void Serialize(Stream& s, Amount value) {
    auto bits = static_cast<unsigned __int128>(value);
    WriteLE(s, static_cast<uint64_t>(bits));
    WriteLE(s, static_cast<uint64_t>(bits >> 64));
}

template<typename Stream>
void Unserialize(Stream& s, Amount& value) {
    unsigned __int128 low = ReadLE<uint64_t>(s);
    unsigned __int128 high = ReadLE<uint64_t>(s);
    value = static_cast<Amount>((high << 64) | low);
}

// ============================================================================
// CompactSize
// ============================================================================
//   < 253         one byte
//   <= 0xFFFFFFFF 0xFE then 4 bytes
//   otherwise     0xFF then 8 bytes
// Decoding rejects a longer form than the value needs.

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 253) {
        WriteLE(s, static_cast<uint8_t>(size));
    } else if (size <= 0xFFFFFFFFu) {
        WriteLE(s, static_cast<uint8_t>(0xFE));
        WriteLE(s, static_cast<uint32_t>(size));
    } else {
        WriteLE(s, static_cast<uint8_t>(0xFF));
        WriteLE(s, size);
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    uint8_t marker = ReadLE<uint8_t>(s);
    uint64_t size = marker;
    uint64_t smallest = 0;
    if (marker == 0xFE) {
        size = ReadLE<uint32_t>(s);
        smallest = 253;
    } else if (marker == 0xFF) {
        size = ReadLE<uint64_t>(s);
        smallest = 0x100000000ull;
    }
    if (size < smallest) {
        throw std::ios_base::failure("CompactSize: non-canonical encoding");
    }
    if (size > MAX_SERIALIZED_SIZE) {
        throw std::ios_base::failure("CompactSize: length exceeds limit");
    }
    return size;
}

// ============================================================================
// Strings and Fixed-Size Byte Strings
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    s.Write(str.data(), str.size());
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    str.assign(ReadCompactSize(s), '\0');
    s.Read(&str[0], str.size());
}

template<typename Stream, size_t BITS>
void Serialize(Stream& s, const BaseHash<BITS>& hash) {
    s.Write(hash.data(), BaseHash<BITS>::SIZE);
}

template<typename Stream, size_t BITS>
void Unserialize(Stream& s, BaseHash<BITS>& hash) {
    s.Read(hash.data(), BaseHash<BITS>::SIZE);
}

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace crowdfund

#endif // CROWDFUND_CORE_SERIALIZE_H
