// ═══════════════════════════════════════════════════════════════════
//  src/multipart.cpp — Streaming multipart/form-data parser
// ═══════════════════════════════════════════════════════════════════

#include "formpp/multipart.h"
#include "formpp/console.h"
#include "formpp/env.h"
#include "formpp/params.h"

#include <cstdint>
#include <stdexcept>

namespace formpp::multipart {

namespace {

constexpr std::string_view kClosingMarker = "--";

std::string invalid(const std::string& what) {
    return "Invalid multipart/form-data: " + what;
}

// Sizes must be non-negative JSON integers; get<std::size_t>() would wrap -1.
std::size_t sizeOption(const nlohmann::json& j, const char* key, std::size_t fallback) {
    auto it = j.find(key);
    if (it == j.end()) return fallback;
    if (!it->is_number_integer() ||
        (!it->is_number_unsigned() && it->get<std::int64_t>() < 0)) {
        throw std::invalid_argument(std::string("invalid multipart options: '") + key +
                                    "' must be a non-negative integer");
    }
    return it->get<std::size_t>();
}

} // namespace

// ═══════════════════════════════════════════
//  Options
// ═══════════════════════════════════════════

void Options::validate() const {
    if (chunkSize == 0) {
        throw std::invalid_argument("chunk size must be greater than zero");
    }
    if (encoding.empty()) {
        throw std::invalid_argument("encoding must not be empty");
    }
    if (tempPrefix.find('/') != std::string::npos) {
        throw std::invalid_argument("temp prefix must not contain '/'");
    }
}

std::filesystem::path Options::resolvedTempDir() const {
    return tempDir.empty() ? systemTempDirectory() : tempDir;
}

Options Options::fromEnv(const std::string& prefix) {
    Options o;
    o.maxBodySize = env::get<std::size_t>(prefix + "MAX_BODY_SIZE", o.maxBodySize);
    o.chunkSize = env::get<std::size_t>(prefix + "CHUNK_SIZE", o.chunkSize);
    o.encoding = env::get<std::string>(prefix + "ENCODING", o.encoding);
    if (auto errors = env::get(prefix + "ENCODING_ERRORS")) {
        o.encodingErrors = charset::parseDecodeErrors(*errors);
    }
    if (auto dir = env::get(prefix + "TEMP_DIR")) {
        o.tempDir = *dir;
    }
    o.tempPrefix = env::get<std::string>(prefix + "TEMP_PREFIX", o.tempPrefix);
    o.validate();
    return o;
}

Options Options::fromJson(const nlohmann::json& j) {
    Options o;
    if (!j.is_object()) {
        throw std::invalid_argument("multipart options must be a JSON object");
    }
    try {
        o.maxBodySize = sizeOption(j, "max_body_size", o.maxBodySize);
        o.chunkSize = sizeOption(j, "chunk_size", o.chunkSize);
        o.encoding = j.value("encoding", o.encoding);
        if (j.contains("encoding_errors")) {
            o.encodingErrors = charset::parseDecodeErrors(j.at("encoding_errors").get<std::string>());
        }
        if (j.contains("temp_dir")) {
            o.tempDir = j.at("temp_dir").get<std::string>();
        }
        o.tempPrefix = j.value("temp_prefix", o.tempPrefix);
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("invalid multipart options: ") + e.what());
    }
    o.validate();
    return o;
}

nlohmann::json Options::toJson() const {
    return {
        {"max_body_size", maxBodySize},
        {"chunk_size", chunkSize},
        {"encoding", encoding},
        {"encoding_errors", charset::toString(encodingErrors)},
        {"temp_dir", tempDir.string()},
        {"temp_prefix", tempPrefix}
    };
}

// ═══════════════════════════════════════════
//  MultipartParser
// ═══════════════════════════════════════════

MultipartParser::MultipartParser(InputStream& stream, std::string contentType,
                                 std::size_t contentLength, Options options)
    : contentType_(std::move(contentType)),
      contentLength_(contentLength),
      options_(std::move(options)),
      encoding_(options_.encoding),
      scanner_(stream, contentLength_, options_.maxBodySize, options_.chunkSize),
      registry_(options_.tempDir, options_.tempPrefix) {
    options_.validate();
    if (contentLength_ > options_.maxBodySize) {
        throw HttpError::sizeLimit(
            "Content-Length " + std::to_string(contentLength_) +
                " exceeds max body size of " + std::to_string(options_.maxBodySize) + ".",
            {{"content_length", contentLength_}, {"max_body_size", options_.maxBodySize}});
    }
}

MultipartParser::~MultipartParser() {
    cleanup();
}

std::string MultipartParser::boundary() {
    auto info = resolveBoundary(contentType_);
    if (info.charset) encoding_ = *info.charset;
    return info.boundary;
}

std::pair<FormFields&, FileFields&> MultipartParser::parse() {
    if (parsed_) {
        throw std::logic_error("MultipartParser::parse() may only be called once");
    }
    parsed_ = true;

    try {
        run();
    } catch (...) {
        cleanup();
        throw;
    }

    console::debug("formpp: parsed", forms_.size(), "field names and", files_.size(),
                   "file names from", scanner_.totalRead(), "bytes");
    return {forms_, files_};
}

void MultipartParser::cleanup() noexcept {
    registry_.cleanup();
    sink_.reset();
    scanner_.reset();
    forms_.clear();
    files_.clear();
}

// ── Skips the preamble and learns the line delimiter ──
void MultipartParser::locateFirstBoundary(const std::string& boundary) {
    const std::size_t blength = boundary.size();

    scanner_.fill();
    auto start = scanner_.find(boundary);
    while (start == std::string_view::npos || scanner_.size() < start + blength + 2) {
        if (start == std::string_view::npos) {
            scanner_.keepTail(blength + 2);
        }
        if (!scanner_.fill()) break;
        start = scanner_.find(boundary);
    }

    try {
        delimiter_ = detectDelimiter(scanner_.view(), boundary);
    } catch (const HttpError& e) {
        throw HttpError::protocol(invalid(e.what()));
    }

    scanner_.consume(scanner_.find(boundary) + blength);
    stripDelimiter(bytes(*delimiter_));
}

void MultipartParser::stripDelimiter(std::string_view delim) {
    scanner_.ensure(delim.size());
    if (scanner_.startsWith(delim)) scanner_.consume(delim.size());
}

void MultipartParser::run() {
    const std::string boundary = "--" + this->boundary();

    locateFirstBoundary(boundary);
    console::debug("formpp: boundary", boundary, "with", toString(*delimiter_), "delimiter");

    const auto delim = bytes(*delimiter_);
    const std::string headerTerminator = std::string(delim) + std::string(delim);

    while (true) {
        // The closing "--" may arrive in the next chunk.
        scanner_.ensure(kClosingMarker.size());
        if (scanner_.startsWith(kClosingMarker)) break;

        readPart(boundary, delim, headerTerminator);
        stripDelimiter(delim);
    }
}

void MultipartParser::readPart(const std::string& boundary, std::string_view delim,
                               const std::string& headerTerminator) {
    // ── Headers ──
    auto headerEnd = scanner_.find(headerTerminator);
    while (headerEnd == std::string_view::npos) {
        if (scanner_.remaining() == 0) {
            throw HttpError::protocol(invalid("malformed part headers"));
        }
        if (!scanner_.fill()) break;
        headerEnd = scanner_.find(headerTerminator);
    }
    if (headerEnd == std::string_view::npos) {
        throw HttpError::protocol(invalid("part header terminator not found"));
    }

    auto headers = parsePartHeaders(scanner_.view().substr(0, headerEnd), *delimiter_,
                                    encoding_, options_.encodingErrors);
    scanner_.consume(headerEnd + headerTerminator.size());
    auto part = describePart(headers);

    if (part.isFile()) {
        sink_ = std::make_unique<FileSink>(registry_.create());
    } else {
        sink_ = std::make_unique<FieldSink>();
    }

    // ── Body: slide a boundary-sized window over the stream ──
    const std::size_t tail = boundary.size() + 2;
    auto next = scanner_.find(boundary);
    while (next == std::string_view::npos) {
        if (scanner_.size() > tail) {
            auto flushable = scanner_.size() - tail;
            sink_->write(scanner_.view().substr(0, flushable));
            scanner_.consume(flushable);
        }
        if (scanner_.remaining() == 0) {
            throw HttpError::protocol(invalid("closing boundary not found."));
        }
        if (!scanner_.fill()) break;
        next = scanner_.find(boundary);
    }
    if (next == std::string_view::npos) {
        throw HttpError::protocol(invalid("part body terminator not found."));
    }

    auto body = scanner_.view().substr(0, next);
    if (body.size() >= delim.size() && body.substr(body.size() - delim.size()) == delim) {
        body.remove_suffix(delim.size());
    }
    sink_->write(body);
    scanner_.consume(next + boundary.size());

    finishPart(part);
}

void MultipartParser::finishPart(const PartInfo& part) {
    auto sink = std::move(sink_);

    if (part.isFile()) {
        auto& file = static_cast<FileSink&>(*sink);
        UploadedFile upload;
        upload.filename = *part.filename;
        upload.contentType = part.contentType;
        upload.size = file.bytesWritten();
        upload.file = file.finish();
        console::debug("formpp: file", part.name, "->", upload.filename,
                       "(" + std::to_string(upload.size) + " bytes)");
        appendValue(files_, part.name, std::move(upload));
        return;
    }

    auto& field = static_cast<FieldSink&>(*sink);
    auto value = charset::decode(field.data(), encoding_, options_.encodingErrors);
    console::debug("formpp: field", part.name,
                   "(" + std::to_string(field.bytesWritten()) + " bytes)");
    appendValue(forms_, part.name, std::move(value));
}

} // namespace formpp::multipart
