#ifndef BYTE_IO_HPP
#define BYTE_IO_HPP

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include "codec_error.hpp"

namespace sonicpx {

    // Little-endian append-only writer
    class ByteWriter {
    public:
        void writeU8(uint8_t v) { buf_.push_back(v); }
        void writeU32LE(uint32_t v) {
            buf_.push_back(static_cast<uint8_t>(v & 0xFF));
            buf_.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
            buf_.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
            buf_.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
        }
        void writeBytes(const void* p, size_t n) {
            const uint8_t* b = static_cast<const uint8_t*>(p);
            buf_.insert(buf_.end(), b, b + n);
        }
        void reserve(size_t n) { buf_.reserve(n); }
        size_t size() const { return buf_.size(); }
        std::vector<uint8_t> release() { return std::move(buf_); }
    private:
        std::vector<uint8_t> buf_;
    };

    // Bounds-checked reader over a borrowed buffer. Running past the end is a
    // TruncatedHeader: everything read through this class is header data.
    class ByteReader {
    public:
        ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}
        explicit ByteReader(const std::vector<uint8_t>& buf) : data_(buf.data()), size_(buf.size()) {}

        uint8_t readU8(const char* what) {
            need(1, what);
            return data_[pos_++];
        }
        uint32_t readU32LE(const char* what) {
            need(4, what);
            uint32_t v = static_cast<uint32_t>(data_[pos_]) |
                         (static_cast<uint32_t>(data_[pos_ + 1]) << 8) |
                         (static_cast<uint32_t>(data_[pos_ + 2]) << 16) |
                         (static_cast<uint32_t>(data_[pos_ + 3]) << 24);
            pos_ += 4;
            return v;
        }
        std::string readString(size_t n, const char* what) {
            need(n, what);
            std::string s(data_ + pos_, data_ + pos_ + n);
            pos_ += n;
            return s;
        }
        // Copies at most n bytes; never throws
        std::vector<uint8_t> readUpTo(size_t n) {
            size_t take = n < remaining() ? n : remaining();
            std::vector<uint8_t> out(data_ + pos_, data_ + pos_ + take);
            pos_ += take;
            return out;
        }
        size_t position() const { return pos_; }
        size_t remaining() const { return size_ - pos_; }
    private:
        void need(size_t n, const char* what) {
            if (n > remaining()) {
                throw CodecError(ErrorKind::TruncatedHeader,
                                 std::string("buffer truncated while reading ") + what);
            }
        }
        const uint8_t* data_;
        size_t size_;
        size_t pos_ = 0;
    };

}

#endif // BYTE_IO_HPP
