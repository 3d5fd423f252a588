#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include <boost/endian/conversion.hpp>

// Big-endian field encoding shared by every on-disk structure.
// Readers do not bounds-check; callers test remaining() first.
namespace byteio {

class ByteWriter {
public:
    explicit ByteWriter(std::vector<uint8_t>& out) : out_(out) {}

    void u16(uint16_t v) {
        unsigned char buf[2];
        boost::endian::store_big_u16(buf, v);
        out_.insert(out_.end(), buf, buf + sizeof(buf));
    }

    void u32(uint32_t v) {
        unsigned char buf[4];
        boost::endian::store_big_u32(buf, v);
        out_.insert(out_.end(), buf, buf + sizeof(buf));
    }

    void u64(uint64_t v) {
        unsigned char buf[8];
        boost::endian::store_big_u64(buf, v);
        out_.insert(out_.end(), buf, buf + sizeof(buf));
    }

    void bytes(const uint8_t* data, size_t size) {
        out_.insert(out_.end(), data, data + size);
    }

    size_t size() const { return out_.size(); }

private:
    std::vector<uint8_t>& out_;
};

class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size), pos_(0) {}

    uint16_t u16() {
        uint16_t v = boost::endian::load_big_u16(data_ + pos_);
        pos_ += 2;
        return v;
    }

    uint32_t u32() {
        uint32_t v = boost::endian::load_big_u32(data_ + pos_);
        pos_ += 4;
        return v;
    }

    uint64_t u64() {
        uint64_t v = boost::endian::load_big_u64(data_ + pos_);
        pos_ += 8;
        return v;
    }

    void bytes(uint8_t* out, size_t n) {
        std::memcpy(out, data_ + pos_, n);
        pos_ += n;
    }

    const uint8_t* current() const { return data_ + pos_; }
    void skip(size_t n) { pos_ += n; }
    size_t position() const { return pos_; }
    size_t remaining() const { return size_ - pos_; }

private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_;
};

} // namespace byteio
