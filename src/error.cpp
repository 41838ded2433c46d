// ═══════════════════════════════════════════════════════════════════
//  src/error.cpp — HttpError JSON rendering
// ═══════════════════════════════════════════════════════════════════

#include "formpp/error.h"

#include <boost/beast/http/status.hpp>

#include <string>

namespace formpp {

namespace bhttp = boost::beast::http;

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::SizeLimit:     return "size_limit";
        case ErrorKind::Protocol:      return "protocol";
        case ErrorKind::Encoding:      return "encoding";
        case ErrorKind::Storage:       return "storage";
    }
    return "unknown";
}

nlohmann::json HttpError::toJson() const {
    auto reason = bhttp::obsolete_reason(bhttp::int_to_status(
        static_cast<unsigned>(statusCode_)));

    nlohmann::json j = {
        {"error",   std::string(reason.data(), reason.size())},
        {"message", what()},
        {"status",  statusCode_},
        {"kind",    toString(kind_)}
    };
    if (!details_.is_null() && !details_.empty()) {
        j["details"] = details_;
    }
    return j;
}

} // namespace formpp
