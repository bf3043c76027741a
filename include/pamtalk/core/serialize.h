// PAMTALK - Serialization Header
// Copyright (c) 2024 PAMTALK Developers
// MIT License
//
// Serialization primitives used for component state snapshots.
// All integers are little-endian; strings and containers carry a
// CompactSize length prefix.

#ifndef PAMTALK_CORE_SERIALIZE_H
#define PAMTALK_CORE_SERIALIZE_H

#include "pamtalk/core/types.h"
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <vector>
#include <string>
#include <stdexcept>
#include <ios>

namespace pamtalk {

/// Maximum length accepted for any length-prefixed field (32 MB)
static constexpr uint64_t MAX_SERIALIZED_SIZE = 0x02000000;

namespace detail {

inline uint32_t htole32_(uint32_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap32(host);
#else
    return host;
#endif
}

inline uint64_t htole64_(uint64_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap64(host);
#else
    return host;
#endif
}

inline uint32_t le32toh_(uint32_t little) { return htole32_(little); }
inline uint64_t le64toh_(uint64_t little) { return htole64_(little); }

} // namespace detail

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
private:
    std::vector<uint8_t> data_;
    size_t read_pos_ = 0;

public:
    DataStream() = default;
    explicit DataStream(const std::vector<uint8_t>& data) : data_(data) {}
    DataStream(const uint8_t* data, size_t len) : data_(data, data + len) {}

    /// Unread bytes remaining
    size_t size() const noexcept { return data_.size() - read_pos_; }
    bool empty() const noexcept { return size() == 0; }

    /// Whole buffer, including bytes already read
    const std::vector<uint8_t>& Data() const noexcept { return data_; }

    void clear() {
        data_.clear();
        read_pos_ = 0;
    }

    void Write(const uint8_t* src, size_t len) {
        data_.insert(data_.end(), src, src + len);
    }

    void Write(const char* src, size_t len) {
        Write(reinterpret_cast<const uint8_t*>(src), len);
    }

    void Read(uint8_t* dst, size_t len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        std::memcpy(dst, data_.data() + read_pos_, len);
        read_pos_ += len;
    }

    void Read(char* dst, size_t len) {
        Read(reinterpret_cast<uint8_t*>(dst), len);
    }

    std::string ToHex() const;
    void FromHex(const std::string& hex);

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);
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
    obj = detail::htole32_(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 4);
}

template<typename Stream>
inline void ser_writedata64(Stream& s, uint64_t obj) {
    obj = detail::htole64_(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 8);
}

template<typename Stream>
inline uint8_t ser_readdata8(Stream& s) {
    uint8_t obj;
    s.Read(&obj, 1);
    return obj;
}

template<typename Stream>
inline uint32_t ser_readdata32(Stream& s) {
    uint32_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 4);
    return detail::le32toh_(obj);
}

template<typename Stream>
inline uint64_t ser_readdata64(Stream& s) {
    uint64_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 8);
    return detail::le64toh_(obj);
}

// ============================================================================
// CompactSize Encoding
// ============================================================================
// size <  253        -- 1 byte
// size <= 0xFFFFFFFF -- 5 bytes (0xFE + 4 bytes little-endian)
// otherwise          -- 9 bytes (0xFF + 8 bytes little-endian)

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 253) {
        ser_writedata8(s, static_cast<uint8_t>(size));
    } else if (size <= 0xFFFFFFFF) {
        ser_writedata8(s, 0xFE);
        ser_writedata32(s, static_cast<uint32_t>(size));
    } else {
        ser_writedata8(s, 0xFF);
        ser_writedata64(s, size);
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    uint8_t marker = ser_readdata8(s);
    uint64_t size = 0;

    if (marker < 253) {
        size = marker;
    } else if (marker == 0xFE) {
        size = ser_readdata32(s);
        if (size < 253) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else if (marker == 0xFF) {
        size = ser_readdata64(s);
        if (size <= 0xFFFFFFFFULL) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else {
        throw std::ios_base::failure("ReadCompactSize(): bad marker");
    }

    if (size > MAX_SERIALIZED_SIZE) {
        throw std::ios_base::failure("ReadCompactSize(): size too large");
    }
    return size;
}

// ============================================================================
// Serialize/Unserialize for Basic Types
// ============================================================================

template<typename Stream>
inline void Serialize(Stream& s, uint8_t a) { ser_writedata8(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& a) { a = ser_readdata8(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint32_t a) { ser_writedata32(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint32_t& a) { a = ser_readdata32(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { ser_writedata64(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ser_readdata64(s); }

template<typename Stream>
inline void Serialize(Stream& s, int64_t a) { ser_writedata64(s, static_cast<uint64_t>(a)); }

template<typename Stream>
inline void Unserialize(Stream& s, int64_t& a) { a = static_cast<int64_t>(ser_readdata64(s)); }

template<typename Stream>
inline void Serialize(Stream& s, bool a) { ser_writedata8(s, a ? 1 : 0); }

template<typename Stream>
inline void Unserialize(Stream& s, bool& a) { a = (ser_readdata8(s) != 0); }

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    if (!str.empty()) {
        s.Write(str.data(), str.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    uint64_t size = ReadCompactSize(s);
    str.resize(size);
    if (size > 0) {
        s.Read(&str[0], size);
    }
}

template<typename Stream>
void Serialize(Stream& s, const Hash256& hash) {
    s.Write(hash.data(), Hash256::SIZE);
}

template<typename Stream>
void Unserialize(Stream& s, Hash256& hash) {
    s.Read(hash.data(), Hash256::SIZE);
}

template<typename Stream, typename T>
void Serialize(Stream& s, const std::vector<T>& v) {
    WriteCompactSize(s, v.size());
    for (const auto& item : v) {
        Serialize(s, item);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::vector<T>& v) {
    uint64_t size = ReadCompactSize(s);
    v.clear();
    for (uint64_t i = 0; i < size; ++i) {
        T item;
        Unserialize(s, item);
        v.push_back(std::move(item));
    }
}

// ============================================================================
// DataStream Stream Operators
// ============================================================================

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

} // namespace pamtalk

#endif // PAMTALK_CORE_SERIALIZE_H
