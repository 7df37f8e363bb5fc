#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <utility>

namespace minirel {

/**
 * BinaryWriter - Little-endian binary serialization into a growable buffer.
 *
 * Used by the row codec and the index entry log so both agree on the
 * width of every scalar.
 */
class BinaryWriter {
public:
    BinaryWriter() = default;

    void write_uint8(uint8_t v) {
        buffer_.push_back(static_cast<char>(v));
    }

    void write_uint16(uint16_t v) {
        buffer_.append(reinterpret_cast<const char*>(&v), sizeof(v));
    }

    void write_int32(int32_t v) {
        buffer_.append(reinterpret_cast<const char*>(&v), sizeof(v));
    }

    void write_int64(int64_t v) {
        buffer_.append(reinterpret_cast<const char*>(&v), sizeof(v));
    }

    void write_float(float v) {
        buffer_.append(reinterpret_cast<const char*>(&v), sizeof(v));
    }

    void write_double(double v) {
        buffer_.append(reinterpret_cast<const char*>(&v), sizeof(v));
    }

    // Length-prefixed string (uint16 length + data)
    void write_short_string(const std::string& s) {
        write_uint16(static_cast<uint16_t>(s.size()));
        buffer_.append(s);
    }

    // Exactly `width` bytes, NUL-padded
    void write_fixed(const std::string& s, size_t width) {
        size_t n = s.size() < width ? s.size() : width;
        buffer_.append(s.data(), n);
        buffer_.append(width - n, '\0');
    }

    const std::string& data() const { return buffer_; }
    std::string&& release() { return std::move(buffer_); }

private:
    std::string buffer_;
};

/**
 * BinaryReader - Bounds-checked counterpart of BinaryWriter.
 *
 * Every read returns false instead of running past the end of the buffer.
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
        if (!has_remaining(sizeof(*v))) return false;
        *v = static_cast<uint8_t>(*ptr_);
        ptr_ += sizeof(*v);
        return true;
    }

    bool read_uint16(uint16_t* v) { return read_scalar(v); }
    bool read_int32(int32_t* v) { return read_scalar(v); }
    bool read_int64(int64_t* v) { return read_scalar(v); }
    bool read_float(float* v) { return read_scalar(v); }
    bool read_double(double* v) { return read_scalar(v); }

    bool read_short_string(std::string* s) {
        uint16_t len;
        if (!read_uint16(&len)) return false;
        if (!has_remaining(len)) return false;
        s->assign(ptr_, len);
        ptr_ += len;
        return true;
    }

    // Reads `width` bytes and strips the NUL padding
    bool read_fixed(std::string* s, size_t width) {
        if (!has_remaining(width)) return false;
        size_t n = width;
        while (n > 0 && ptr_[n - 1] == '\0') {
            --n;
        }
        s->assign(ptr_, n);
        ptr_ += width;
        return true;
    }

private:
    template<typename T>
    bool read_scalar(T* v) {
        if (!has_remaining(sizeof(T))) return false;
        std::memcpy(v, ptr_, sizeof(T));
        ptr_ += sizeof(T);
        return true;
    }

    const char* ptr_;
    const char* end_;
};

}  // namespace minirel
