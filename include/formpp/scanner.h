#pragma once
// ═══════════════════════════════════════════════════════════════════
//  formpp/scanner.h — Bounded read-and-search buffer over a stream
// ═══════════════════════════════════════════════════════════════════
//
//  The scanner never reads more than the declared content length and
//  only grows its buffer by one chunk at a time. Callers bound memory
//  by consuming (or flushing) the searched prefix before each fill().
//
// ═══════════════════════════════════════════════════════════════════

#include "error.h"
#include "stream.h"
#include <algorithm>
#include <string>
#include <string_view>

namespace formpp::multipart {

class ChunkedScanner {
public:
    ChunkedScanner(InputStream& stream, std::size_t contentLength,
                   std::size_t maxBodySize, std::size_t chunkSize)
        : stream_(stream),
          remaining_(contentLength),
          maxBodySize_(maxBodySize),
          chunkSize_(chunkSize) {}

    // ── Appends up to one chunk. False when nothing could be read ──
    bool fill() {
        if (remaining_ == 0 || dry_) return false;

        auto want = std::min(chunkSize_, remaining_);
        auto offset = buffer_.size();
        buffer_.resize(offset + want);
        auto got = stream_.read(buffer_.data() + offset, want);
        buffer_.resize(offset + got);

        if (got == 0) {
            dry_ = true;
            return false;
        }

        totalRead_ += got;
        if (totalRead_ > maxBodySize_) {
            throw HttpError::sizeLimit("Request entity too large",
                                       {{"max_body_size", maxBodySize_}});
        }
        remaining_ -= got;
        peak_ = std::max(peak_, buffer_.size());
        return true;
    }

    // ── Fills until at least n bytes are buffered or input runs out ──
    bool ensure(std::size_t n) {
        while (buffer_.size() < n) {
            if (!fill()) return false;
        }
        return true;
    }

    std::size_t find(std::string_view needle) const { return view().find(needle); }

    bool startsWith(std::string_view prefix) const {
        return view().substr(0, prefix.size()) == prefix;
    }

    void consume(std::size_t n) { buffer_.erase(0, std::min(n, buffer_.size())); }

    // Drops everything but the last n bytes.
    void keepTail(std::size_t n) {
        if (buffer_.size() > n) consume(buffer_.size() - n);
    }

    void reset() {
        buffer_.clear();
        buffer_.shrink_to_fit();
    }

    std::string_view view() const { return buffer_; }
    std::size_t size() const { return buffer_.size(); }

    std::size_t remaining() const { return remaining_; }
    // True once the declared length is read or the stream ran dry.
    bool exhausted() const { return remaining_ == 0 || dry_; }
    std::size_t totalRead() const { return totalRead_; }
    std::size_t peakSize() const { return peak_; }

private:
    InputStream& stream_;
    std::string buffer_;
    std::size_t remaining_;
    std::size_t maxBodySize_;
    std::size_t chunkSize_;
    std::size_t totalRead_ = 0;
    std::size_t peak_ = 0;
    bool dry_ = false;
};

} // namespace formpp::multipart
