// ═══════════════════════════════════════════════════════════════════
//  src/request.cpp — FormRequest
// ═══════════════════════════════════════════════════════════════════

#include "formpp/request.h"
#include "formpp/params.h"

namespace formpp {

FormRequest::FormRequest(std::string contentType, std::size_t contentLength,
                         InputStream& body, multipart::Options options)
    : contentType_(std::move(contentType)),
      contentLength_(contentLength),
      options_(std::move(options)),
      body_(&body) {}

FormRequest::FormRequest(std::string contentType, std::size_t contentLength,
                         std::unique_ptr<InputStream> body, multipart::Options options)
    : contentType_(std::move(contentType)),
      contentLength_(contentLength),
      options_(std::move(options)),
      owned_(std::move(body)),
      body_(owned_.get()) {}

FormRequest::~FormRequest() {
    close();
}

std::string FormRequest::mediaType() const {
    return formpp::mediaType(contentType_);
}

bool FormRequest::isMultipart() const {
    return mediaType() == "multipart/form-data";
}

const FormFields& FormRequest::forms() {
    ensureParsed();
    return parser_ ? parser_->forms() : noForms_;
}

const FileFields& FormRequest::files() {
    ensureParsed();
    return parser_ ? parser_->files() : noFiles_;
}

void FormRequest::close() noexcept {
    if (parser_) parser_->cleanup();
}

void FormRequest::ensureParsed() {
    if (failure_) std::rethrow_exception(failure_);
    if (attempted_ || !isMultipart() || body_ == nullptr) {
        attempted_ = true;
        return;
    }
    attempted_ = true;

    try {
        auto parser = std::make_unique<multipart::MultipartParser>(
            *body_, contentType_, contentLength_, options_);
        parser->parse();
        parser_ = std::move(parser);
    } catch (const HttpError&) {
        failure_ = std::current_exception();
        throw;
    }
}

} // namespace formpp
