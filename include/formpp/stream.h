#pragma once
// ═══════════════════════════════════════════════════════════════════
//  formpp/stream.h — Blocking, forward-only byte sources
// ═══════════════════════════════════════════════════════════════════

#include "error.h"
#include <algorithm>
#include <cstring>
#include <istream>
#include <string>

namespace formpp {

// ═══════════════════════════════════════════════════════════════════
//  class InputStream
//  read() blocks until at least one byte is available and returns the
//  number of bytes copied into dst (at most n). 0 means end of stream.
// ═══════════════════════════════════════════════════════════════════
class InputStream {
public:
    virtual ~InputStream() = default;
    virtual std::size_t read(char* dst, std::size_t n) = 0;
};

// ── A body that is already in memory ──
class StringStream : public InputStream {
public:
    explicit StringStream(std::string data) : data_(std::move(data)) {}

    std::size_t read(char* dst, std::size_t n) override {
        auto count = std::min(n, data_.size() - pos_);
        std::memcpy(dst, data_.data() + pos_, count);
        pos_ += count;
        return count;
    }

    std::size_t position() const { return pos_; }
    std::size_t size() const { return data_.size(); }

private:
    std::string data_;
    std::size_t pos_ = 0;
};

// ── Adapter over any std::istream (sockets, files, stringstreams) ──
class IStreamReader : public InputStream {
public:
    explicit IStreamReader(std::istream& in) : in_(in) {}

    std::size_t read(char* dst, std::size_t n) override {
        if (n == 0 || in_.eof()) return 0;
        in_.read(dst, static_cast<std::streamsize>(n));
        if (in_.bad()) {
            throw HttpError::protocol("Failed to read request body");
        }
        return static_cast<std::size_t>(in_.gcount());
    }

private:
    std::istream& in_;
};

} // namespace formpp
