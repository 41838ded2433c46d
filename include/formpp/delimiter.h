#pragma once
// ═══════════════════════════════════════════════════════════════════
//  formpp/delimiter.h — Line delimiter of a multipart stream
// ═══════════════════════════════════════════════════════════════════

#include "error.h"
#include <string_view>

namespace formpp::multipart {

enum class Delimiter { CRLF, LF };

constexpr std::string_view bytes(Delimiter d) {
    return d == Delimiter::CRLF ? std::string_view("\r\n", 2) : std::string_view("\n", 1);
}

constexpr const char* toString(Delimiter d) {
    return d == Delimiter::CRLF ? "CRLF" : "LF";
}

// ── Look at what follows the first boundary in `buffer` ──
//    Only the first occurrence is inspected; a stream that switches
//    line endings afterwards is not supported.
inline Delimiter detectDelimiter(std::string_view buffer, std::string_view boundary) {
    auto idx = buffer.find(boundary);
    if (idx == std::string_view::npos) {
        throw HttpError::protocol("Unable to determine line delimiter.");
    }

    auto after = buffer.substr(idx + boundary.size());
    if (after.substr(0, 2) == bytes(Delimiter::CRLF)) return Delimiter::CRLF;
    if (after.substr(0, 1) == bytes(Delimiter::LF))   return Delimiter::LF;
    throw HttpError::protocol("Unable to determine line delimiter.");
}

} // namespace formpp::multipart
