// DAOSTAKE - Serialization Header
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License
//
// Byte-level serialization for persisted engine state.
// Integers are little-endian; amounts are fixed 32-byte big-endian words.

#ifndef DAOSTAKE_CORE_SERIALIZE_H
#define DAOSTAKE_CORE_SERIALIZE_H

#include "daostake/core/types.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <string>
#include <vector>

namespace daostake {

// ============================================================================
// Constants
// ============================================================================

/// Maximum size for serialized objects to prevent memory exhaustion
static constexpr uint64_t MAX_SIZE = 0x02000000;  // 32 MB

/// Serialized width of an Amount
static constexpr size_t AMOUNT_BYTES = 32;

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    using size_type = std::size_t;

    DataStream() = default;

    explicit DataStream(const std::vector<uint8_t>& data) : data_(data) {}

    DataStream(const uint8_t* data, size_type len) : data_(data, data + len) {}

    /// Returns unread bytes remaining
    size_type size() const noexcept { return data_.size() - read_pos_; }

    bool empty() const noexcept { return size() == 0; }

    /// Get pointer to unread data
    const uint8_t* data() const noexcept { return data_.data() + read_pos_; }

    void Write(const uint8_t* src, size_type len) {
        data_.insert(data_.end(), src, src + len);
    }

    void Read(uint8_t* dst, size_type len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        std::memcpy(dst, data_.data() + read_pos_, len);
        read_pos_ += len;
    }

    /// Unread bytes as a std::string (database value form)
    std::string str() const {
        return std::string(reinterpret_cast<const char*>(data()), size());
    }

    std::string ToHex() const;

private:
    std::vector<uint8_t> data_;
    size_type read_pos_ = 0;
};

// ============================================================================
// Low-Level Serialization Functions
// ============================================================================

template<typename Stream>
inline void ser_writedata8(Stream& s, uint8_t obj) {
    s.Write(&obj, 1);
}

template<typename Stream>
inline void ser_writedata32(Stream& s, uint32_t obj) {
    uint8_t buf[4];
    for (int i = 0; i < 4; ++i) {
        buf[i] = static_cast<uint8_t>(obj >> (8 * i));
    }
    s.Write(buf, 4);
}

template<typename Stream>
inline void ser_writedata64(Stream& s, uint64_t obj) {
    uint8_t buf[8];
    for (int i = 0; i < 8; ++i) {
        buf[i] = static_cast<uint8_t>(obj >> (8 * i));
    }
    s.Write(buf, 8);
}

template<typename Stream>
inline uint8_t ser_readdata8(Stream& s) {
    uint8_t obj;
    s.Read(&obj, 1);
    return obj;
}

template<typename Stream>
inline uint32_t ser_readdata32(Stream& s) {
    uint8_t buf[4];
    s.Read(buf, 4);
    uint32_t obj = 0;
    for (int i = 3; i >= 0; --i) {
        obj = (obj << 8) | buf[i];
    }
    return obj;
}

template<typename Stream>
inline uint64_t ser_readdata64(Stream& s) {
    uint8_t buf[8];
    s.Read(buf, 8);
    uint64_t obj = 0;
    for (int i = 7; i >= 0; --i) {
        obj = (obj << 8) | buf[i];
    }
    return obj;
}

// ============================================================================
// Domain Types
// ============================================================================

/// Write an amount as a 32-byte big-endian word
void SerializeAmount(DataStream& s, const Amount& amount);

/// Read a 32-byte big-endian word
Amount UnserializeAmount(DataStream& s);

template<size_t BITS>
inline void SerializeHash(DataStream& s, const BaseHash<BITS>& hash) {
    s.Write(hash.data(), hash.size());
}

inline Address UnserializeAddress(DataStream& s) {
    Byte buf[Address::SIZE];
    s.Read(buf, sizeof(buf));
    return Address(buf, sizeof(buf));
}

} // namespace daostake

#endif // DAOSTAKE_CORE_SERIALIZE_H
