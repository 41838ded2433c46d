#pragma once
// ═══════════════════════════════════════════════════════════════════
//  formpp/sink.h — Destinations for part bodies
// ═══════════════════════════════════════════════════════════════════

#include "temp_file.h"
#include <memory>
#include <string>
#include <string_view>

namespace formpp::multipart {

class PartSink {
public:
    virtual ~PartSink() = default;
    virtual void write(std::string_view data) = 0;
    virtual std::size_t bytesWritten() const = 0;
};

// ── Form fields: raw bytes kept in memory until the part ends ──
class FieldSink : public PartSink {
public:
    void write(std::string_view data) override { data_.append(data); }
    std::size_t bytesWritten() const override { return data_.size(); }

    const std::string& data() const { return data_; }

private:
    std::string data_;
};

// ── File uploads: streamed into an already-registered temp file ──
class FileSink : public PartSink {
public:
    explicit FileSink(std::shared_ptr<TempFile> file) : file_(std::move(file)) {}

    void write(std::string_view data) override {
        file_->write(data);
        written_ += data.size();
    }
    std::size_t bytesWritten() const override { return written_; }

    // Rewinds to offset 0 and hands the file over.
    std::shared_ptr<TempFile> finish() {
        file_->rewind();
        return std::move(file_);
    }

private:
    std::shared_ptr<TempFile> file_;
    std::size_t written_ = 0;
};

} // namespace formpp::multipart
