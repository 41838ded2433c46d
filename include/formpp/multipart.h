#pragma once
// ═══════════════════════════════════════════════════════════════════
//  formpp/multipart.h — Streaming multipart/form-data parser
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    formpp::StringStream body(raw);
//    formpp::multipart::MultipartParser parser(body, contentType, raw.size());
//    auto [forms, files] = parser.parse();
//
//    auto name   = forms.at("username").value();
//    auto avatar = files.at("avatar").value();
//    auto bytes  = avatar.file->readAll();
//
//    parser.cleanup();   // or let the parser go out of scope
//
//  Field values are held in memory; file bodies are spooled to temp
//  files that live until cleanup(). The parser reads at most
//  `contentLength` bytes and never buffers more than one chunk plus
//  the boundary length while scanning a part body.
//
// ═══════════════════════════════════════════════════════════════════

#include "charset.h"
#include "delimiter.h"
#include "form_data.h"
#include "headers.h"
#include "scanner.h"
#include "sink.h"
#include "stream.h"
#include "temp_file.h"

#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>

namespace formpp::multipart {

// ═══════════════════════════════════════════
//  Options
// ═══════════════════════════════════════════
struct Options {
    std::size_t maxBodySize = 2 * 1024 * 1024;  // 2MB
    std::size_t chunkSize = 4096;               // 4KB
    std::string encoding = "utf-8";
    charset::DecodeErrors encodingErrors = charset::DecodeErrors::Strict;
    std::filesystem::path tempDir;              // empty = system temp directory
    std::string tempPrefix = "formpp-";

    // Throws std::invalid_argument on unusable values.
    void validate() const;

    // Directory actually used for spooling. Throws a Storage HttpError
    // when no temp directory is configured and the system one is unusable.
    std::filesystem::path resolvedTempDir() const;

    // FORMPP_MAX_BODY_SIZE, FORMPP_CHUNK_SIZE, FORMPP_ENCODING,
    // FORMPP_ENCODING_ERRORS, FORMPP_TEMP_DIR, FORMPP_TEMP_PREFIX
    static Options fromEnv(const std::string& prefix = "FORMPP_");

    // Keys: max_body_size, chunk_size, encoding, encoding_errors,
    // temp_dir, temp_prefix. Missing keys keep their defaults.
    static Options fromJson(const nlohmann::json& j);
    nlohmann::json toJson() const;
};

// ═══════════════════════════════════════════════════════════════════
//  class MultipartParser
//  One instance per request body, one parse() call per instance.
// ═══════════════════════════════════════════════════════════════════
class MultipartParser {
public:
    // Throws a SizeLimit HttpError (413) when contentLength exceeds
    // options.maxBodySize. Nothing is read from the stream here.
    MultipartParser(InputStream& stream, std::string contentType,
                    std::size_t contentLength, Options options = {});

    // Runs cleanup() as a backstop.
    ~MultipartParser();

    MultipartParser(const MultipartParser&) = delete;
    MultipartParser& operator=(const MultipartParser&) = delete;

    // Parses the whole body. On any error the parser is cleaned up
    // before the HttpError propagates. Calling parse() twice throws
    // std::logic_error.
    std::pair<FormFields&, FileFields&> parse();

    // Closes and deletes every temp file, empties forms/files and all
    // scratch state. Idempotent; never throws.
    void cleanup() noexcept;

    // ── Results ──
    FormFields& forms() { return forms_; }
    FileFields& files() { return files_; }

    // ── Introspection ──
    // Resolves the boundary from Content-Type (and applies its charset).
    std::string boundary();
    std::size_t contentLength() const { return contentLength_; }
    const std::string& encoding() const { return encoding_; }
    std::optional<Delimiter> delimiter() const { return delimiter_; }
    std::size_t bytesRead() const { return scanner_.totalRead(); }
    std::size_t peakBufferSize() const { return scanner_.peakSize(); }
    std::size_t tempFileCount() const { return registry_.size(); }
    const Options& options() const { return options_; }

private:
    void run();
    void locateFirstBoundary(const std::string& boundary);
    void readPart(const std::string& boundary, std::string_view delim,
                  const std::string& headerTerminator);
    void finishPart(const PartInfo& part);
    void stripDelimiter(std::string_view delim);

    std::string contentType_;
    std::size_t contentLength_;
    Options options_;
    std::string encoding_;

    ChunkedScanner scanner_;
    TempFileRegistry registry_;
    std::optional<Delimiter> delimiter_;
    std::unique_ptr<PartSink> sink_;  // part currently being read

    FormFields forms_;
    FileFields files_;
    bool parsed_ = false;
};

} // namespace formpp::multipart
