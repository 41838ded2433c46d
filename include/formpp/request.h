#pragma once
// ═══════════════════════════════════════════════════════════════════
//  formpp/request.h — Lazily parsed request body
// ═══════════════════════════════════════════════════════════════════
//
//  FormRequest is what a request object embeds: it only touches the
//  body when forms() or files() is first called, and only when the
//  Content-Type is multipart/form-data. Temp files are released when
//  the FormRequest is closed or destroyed.
//
//    FormRequest req(contentType, contentLength, body);
//    if (req.isMultipart()) {
//        auto& upload = req.files().at("avatar").value();
//        upload.file->saveAs("avatars/" + userId + ".png");
//    }
//
// ═══════════════════════════════════════════════════════════════════

#include "form_data.h"
#include "multipart.h"
#include "stream.h"

#include <exception>
#include <memory>
#include <string>

namespace formpp {

class FormRequest {
public:
    // Borrows `body`; it must outlive the FormRequest.
    FormRequest(std::string contentType, std::size_t contentLength, InputStream& body,
                multipart::Options options = {});

    // Takes ownership of `body`.
    FormRequest(std::string contentType, std::size_t contentLength,
                std::unique_ptr<InputStream> body, multipart::Options options = {});

    ~FormRequest();

    FormRequest(FormRequest&&) noexcept = default;
    FormRequest& operator=(FormRequest&&) noexcept = default;

    FormRequest(const FormRequest&) = delete;
    FormRequest& operator=(const FormRequest&) = delete;

    const std::string& contentType() const { return contentType_; }
    std::size_t contentLength() const { return contentLength_; }
    std::string mediaType() const;
    bool isMultipart() const;

    // Parse on first access. A failed parse rethrows the same HttpError
    // on every later access.
    const FormFields& forms();
    const FileFields& files();

    // Deletes temp files and forgets the parsed data.
    void close() noexcept;

private:
    void ensureParsed();

    std::string contentType_;
    std::size_t contentLength_;
    multipart::Options options_;
    std::unique_ptr<InputStream> owned_;
    InputStream* body_;
    std::unique_ptr<multipart::MultipartParser> parser_;
    std::exception_ptr failure_;
    FormFields noForms_;
    FileFields noFiles_;
    bool attempted_ = false;
};

} // namespace formpp
