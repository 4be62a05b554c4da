#pragma once

#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <utility>

namespace folio {

/**
 * BinaryWriter - Little-endian binary encoder.
 *
 * Integers are always written least significant byte first, so encoded
 * pages and file headers are portable between hosts. Strings are written
 * as a uint32 length followed by the raw bytes.
 */
class BinaryWriter {
public:
    BinaryWriter() = default;

    void reserve(size_t size) { buffer_.reserve(size); }

    void write_uint8(uint8_t v) {
        buffer_.push_back(static_cast<char>(v));
    }

    void write_uint16(uint16_t v) { write_le(v, sizeof(v)); }
    void write_uint32(uint32_t v) { write_le(v, sizeof(v)); }
    void write_uint64(uint64_t v) { write_le(v, sizeof(v)); }

    void write_int64(int64_t v) {
        write_le(static_cast<uint64_t>(v), sizeof(v));
    }

    void write_bool(bool v) { write_uint8(v ? 1 : 0); }

    // Length-prefixed string. Returns false if it does not fit a uint32 length.
    bool write_string(const std::string& s) {
        if (s.size() > std::numeric_limits<uint32_t>::max()) {
            return false;
        }
        write_uint32(static_cast<uint32_t>(s.size()));
        buffer_.append(s);
        return true;
    }

    void write_raw(const void* data, size_t size) {
        buffer_.append(reinterpret_cast<const char*>(data), size);
    }

    // Zero fill up to a total size (no-op if already larger)
    void pad_to(size_t size) {
        if (buffer_.size() < size) {
            buffer_.append(size - buffer_.size(), '\0');
        }
    }

    const std::string& data() const { return buffer_; }
    std::string release() { return std::move(buffer_); }

    size_t size() const { return buffer_.size(); }

    void clear() { buffer_.clear(); }

private:
    void write_le(uint64_t v, size_t width) {
        for (size_t i = 0; i < width; ++i) {
            buffer_.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
        }
    }

    std::string buffer_;
};

/**
 * BinaryReader - Bounds-checked little-endian decoder.
 *
 * Every read returns false instead of running past the end of the input.
 */
class BinaryReader {
public:
    explicit BinaryReader(const std::string& data)
        : ptr_(data.data())
        , end_(data.data() + data.size())
    {}

    BinaryReader(const char* data, size_t size)
        : ptr_(data)
        , end_(data + size)
    {}

    bool has_remaining(size_t size) const {
        return static_cast<size_t>(end_ - ptr_) >= size;
    }

    size_t remaining() const {
        return static_cast<size_t>(end_ - ptr_);
    }

    bool read_uint8(uint8_t* v) {
        if (!has_remaining(1)) return false;
        *v = static_cast<uint8_t>(*ptr_);
        ++ptr_;
        return true;
    }

    bool read_uint16(uint16_t* v) {
        uint64_t tmp;
        if (!read_le(&tmp, sizeof(*v))) return false;
        *v = static_cast<uint16_t>(tmp);
        return true;
    }

    bool read_uint32(uint32_t* v) {
        uint64_t tmp;
        if (!read_le(&tmp, sizeof(*v))) return false;
        *v = static_cast<uint32_t>(tmp);
        return true;
    }

    bool read_uint64(uint64_t* v) {
        return read_le(v, sizeof(*v));
    }

    bool read_int64(int64_t* v) {
        uint64_t tmp;
        if (!read_le(&tmp, sizeof(tmp))) return false;
        *v = static_cast<int64_t>(tmp);
        return true;
    }

    bool read_bool(bool* v) {
        uint8_t b;
        if (!read_uint8(&b) || b > 1) return false;
        *v = (b == 1);
        return true;
    }

    bool read_string(std::string* s) {
        uint32_t len;
        if (!read_uint32(&len)) return false;
        if (!has_remaining(len)) return false;
        s->assign(ptr_, len);
        ptr_ += len;
        return true;
    }

    bool read_raw(void* data, size_t size) {
        if (!has_remaining(size)) return false;
        std::memcpy(data, ptr_, size);
        ptr_ += size;
        return true;
    }

    bool skip(size_t size) {
        if (!has_remaining(size)) return false;
        ptr_ += size;
        return true;
    }

private:
    bool read_le(uint64_t* v, size_t width) {
        if (!has_remaining(width)) return false;
        uint64_t out = 0;
        for (size_t i = 0; i < width; ++i) {
            out |= static_cast<uint64_t>(static_cast<uint8_t>(ptr_[i])) << (8 * i);
        }
        ptr_ += width;
        *v = out;
        return true;
    }

    const char* ptr_;
    const char* end_;
};

}  // namespace folio
