#pragma once
// ═══════════════════════════════════════════════════════════════════
//  formpp/error.h — HttpError: the single failure type of the library
// ═══════════════════════════════════════════════════════════════════
//
//  Every failure surfaces as an HttpError carrying an HTTP status code,
//  a human-readable message and an optional JSON details object.
//  Callers switch on kind() instead of catching a class hierarchy:
//
//    try {
//        auto [forms, files] = parser.parse();
//    } catch (const formpp::HttpError& e) {
//        res.status(e.statusCode()).json(e.toJson());
//    }
//
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace formpp {

enum class ErrorKind {
    Configuration,  // 400: Content-Type unusable (no boundary, unknown charset)
    SizeLimit,      // 413: body larger than the configured ceiling
    Protocol,       // 400: malformed multipart stream
    Encoding,       // 400: bytes not decodable under the strict policy
    Storage         // 500: temp file could not be created or written
};

const char* toString(ErrorKind kind);

class HttpError : public std::runtime_error {
public:
    HttpError(ErrorKind kind, int statusCode, const std::string& message,
              nlohmann::json details = nlohmann::json::object())
        : std::runtime_error(message),
          kind_(kind),
          statusCode_(statusCode),
          details_(std::move(details)) {}

    ErrorKind kind() const noexcept { return kind_; }
    int statusCode() const noexcept { return statusCode_; }
    std::string message() const { return what(); }
    const nlohmann::json& details() const noexcept { return details_; }

    // ── {"error": "Bad Request", "message": ..., "status": 400, "details": {...}} ──
    nlohmann::json toJson() const;

    // ── Factories, one per kind ──
    static HttpError configuration(const std::string& message,
                                   nlohmann::json details = nlohmann::json::object()) {
        return HttpError(ErrorKind::Configuration, 400, message, std::move(details));
    }

    static HttpError sizeLimit(const std::string& message,
                               nlohmann::json details = nlohmann::json::object()) {
        return HttpError(ErrorKind::SizeLimit, 413, message, std::move(details));
    }

    static HttpError protocol(const std::string& message,
                              nlohmann::json details = nlohmann::json::object()) {
        return HttpError(ErrorKind::Protocol, 400, message, std::move(details));
    }

    static HttpError encoding(const std::string& message,
                              nlohmann::json details = nlohmann::json::object()) {
        return HttpError(ErrorKind::Encoding, 400, message, std::move(details));
    }

    static HttpError storage(const std::string& message,
                             nlohmann::json details = nlohmann::json::object()) {
        return HttpError(ErrorKind::Storage, 500, message, std::move(details));
    }

private:
    ErrorKind kind_;
    int statusCode_;
    nlohmann::json details_;
};

} // namespace formpp
