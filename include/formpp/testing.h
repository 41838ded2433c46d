#pragma once
// ═══════════════════════════════════════════════════════════════════
//  formpp/testing.h — Body builder and instrumented streams for tests
// ═══════════════════════════════════════════════════════════════════

#include "stream.h"
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <iterator>
#include <system_error>
#include <string>
#include <vector>

#include <unistd.h>

namespace formpp::testing {

// ═══════════════════════════════════════════
//  MultipartBuilder — encodes form bodies
// ═══════════════════════════════════════════
//
//  auto body = MultipartBuilder("XyZ")
//      .field("title", "Hello")
//      .file("doc", "a.txt", "text/plain", "contents")
//      .build();
//
class MultipartBuilder {
public:
    explicit MultipartBuilder(std::string boundary, std::string delimiter = "\r\n")
        : boundary_(std::move(boundary)), delimiter_(std::move(delimiter)) {}

    MultipartBuilder& field(const std::string& name, const std::string& value) {
        return raw({"Content-Disposition: form-data; name=\"" + name + "\""}, value);
    }

    MultipartBuilder& file(const std::string& name, const std::string& filename,
                           const std::string& contentType, const std::string& content) {
        return raw({"Content-Disposition: form-data; name=\"" + name +
                        "\"; filename=\"" + filename + "\"",
                    "Content-Type: " + contentType},
                   content);
    }

    // A part with arbitrary header lines.
    MultipartBuilder& raw(std::vector<std::string> headers, const std::string& body) {
        std::string part = "--" + boundary_ + delimiter_;
        for (const auto& h : headers) part += h + delimiter_;
        part += delimiter_ + body + delimiter_;
        parts_.push_back(std::move(part));
        return *this;
    }

    MultipartBuilder& preamble(std::string text) {
        preamble_ = std::move(text);
        return *this;
    }

    MultipartBuilder& epilogue(std::string text) {
        epilogue_ = std::move(text);
        return *this;
    }

    std::string contentType() const {
        return "multipart/form-data; boundary=" + boundary_;
    }

    std::string build() const {
        std::string out = preamble_;
        for (const auto& p : parts_) out += p;
        out += "--" + boundary_ + "--" + delimiter_ + epilogue_;
        return out;
    }

    // The body without its closing boundary line.
    std::string buildTruncated() const {
        std::string out = preamble_;
        for (const auto& p : parts_) out += p;
        return out;
    }

private:
    std::string boundary_;
    std::string delimiter_;
    std::string preamble_;
    std::string epilogue_;
    std::vector<std::string> parts_;
};

// ═══════════════════════════════════════════
//  ChunkedStream — short reads of a fixed size
// ═══════════════════════════════════════════
class ChunkedStream : public InputStream {
public:
    ChunkedStream(std::string data, std::size_t maxRead)
        : data_(std::move(data)), maxRead_(std::max<std::size_t>(1, maxRead)) {}

    std::size_t read(char* dst, std::size_t n) override {
        auto count = std::min({n, maxRead_, data_.size() - pos_});
        std::memcpy(dst, data_.data() + pos_, count);
        pos_ += count;
        ++calls_;
        return count;
    }

    std::size_t calls() const { return calls_; }
    std::size_t position() const { return pos_; }

private:
    std::string data_;
    std::size_t maxRead_;
    std::size_t pos_ = 0;
    std::size_t calls_ = 0;
};

// ═══════════════════════════════════════════
//  CountingStream — records every read() request
// ═══════════════════════════════════════════
class CountingStream : public InputStream {
public:
    explicit CountingStream(std::string data) : inner_(std::move(data)) {}

    std::size_t read(char* dst, std::size_t n) override {
        ++calls_;
        largestRequest_ = std::max(largestRequest_, n);
        return inner_.read(dst, n);
    }

    std::size_t calls() const { return calls_; }
    std::size_t largestRequest() const { return largestRequest_; }
    std::size_t bytesDelivered() const { return inner_.position(); }

private:
    StringStream inner_;
    std::size_t calls_ = 0;
    std::size_t largestRequest_ = 0;
};

// ═══════════════════════════════════════════
//  PatternStream — a large synthetic body produced on the fly
// ═══════════════════════════════════════════
//  head + `fillerSize` bytes of a repeating pattern + tail, without ever
//  materialising the whole body in memory.
class PatternStream : public InputStream {
public:
    PatternStream(std::string head, std::size_t fillerSize, std::string tail,
                  std::string pattern = "0123456789abcdef")
        : head_(std::move(head)), tail_(std::move(tail)), pattern_(std::move(pattern)),
          fillerSize_(fillerSize) {}

    std::size_t size() const { return head_.size() + fillerSize_ + tail_.size(); }

    std::size_t read(char* dst, std::size_t n) override {
        std::size_t written = 0;
        while (written < n && pos_ < size()) {
            if (pos_ < head_.size()) {
                dst[written++] = head_[pos_];
            } else if (pos_ < head_.size() + fillerSize_) {
                dst[written++] = pattern_[(pos_ - head_.size()) % pattern_.size()];
            } else {
                dst[written++] = tail_[pos_ - head_.size() - fillerSize_];
            }
            ++pos_;
        }
        return written;
    }

private:
    std::string head_;
    std::string tail_;
    std::string pattern_;
    std::size_t fillerSize_;
    std::size_t pos_ = 0;
};

// ═══════════════════════════════════════════
//  ScratchDir — a private temp directory, removed on destruction
// ═══════════════════════════════════════════
class ScratchDir {
public:
    explicit ScratchDir(const std::string& tag)
        : path_(std::filesystem::temp_directory_path() /
                ("formpp-test-" + tag + "-" + std::to_string(::getpid()))) {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::size_t fileCount() const {
        return static_cast<std::size_t>(std::distance(
            std::filesystem::directory_iterator(path_), std::filesystem::directory_iterator{}));
    }

private:
    std::filesystem::path path_;
};

} // namespace formpp::testing
