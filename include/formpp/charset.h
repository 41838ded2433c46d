#pragma once
// ═══════════════════════════════════════════════════════════════════
//  formpp/charset.h — Decoding form bytes into UTF-8 text
// ═══════════════════════════════════════════════════════════════════

#include <string>
#include <string_view>

namespace formpp::charset {

// ── What to do with bytes that are invalid in the source charset ──
enum class DecodeErrors {
    Strict,   // fail with an Encoding HttpError
    Ignore,   // drop the offending bytes
    Replace   // substitute U+FFFD (UTF-8 sources only; otherwise as Ignore)
};

// "strict" | "ignore" | "replace"; throws std::invalid_argument otherwise.
DecodeErrors parseDecodeErrors(std::string_view name);
const char* toString(DecodeErrors errors);

// Lower-cases and drops '-', '_' and spaces: "UTF-8" -> "utf8".
std::string normalizeName(std::string_view charset);

bool isUtf8(std::string_view charset);

// ═══════════════════════════════════════════════════════════════════
//  decode()
//  Converts `bytes` from `charset` to UTF-8. Throws HttpError with kind
//  Encoding on invalid input under Strict, and kind Configuration when
//  the charset is unknown.
// ═══════════════════════════════════════════════════════════════════
std::string decode(std::string_view bytes, const std::string& charset,
                   DecodeErrors errors);

} // namespace formpp::charset
