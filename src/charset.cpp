// ═══════════════════════════════════════════════════════════════════
//  src/charset.cpp — Boost.Locale-backed text decoding
// ═══════════════════════════════════════════════════════════════════

#include "formpp/charset.h"
#include "formpp/error.h"

#include <boost/locale/encoding.hpp>
#include <boost/locale/utf.hpp>

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace formpp::charset {

namespace utf  = boost::locale::utf;
namespace conv = boost::locale::conv;

DecodeErrors parseDecodeErrors(std::string_view name) {
    if (name == "strict")  return DecodeErrors::Strict;
    if (name == "ignore")  return DecodeErrors::Ignore;
    if (name == "replace") return DecodeErrors::Replace;
    throw std::invalid_argument("Unknown encoding error policy '" + std::string(name) +
                                "' (expected strict, ignore or replace)");
}

const char* toString(DecodeErrors errors) {
    switch (errors) {
        case DecodeErrors::Strict:  return "strict";
        case DecodeErrors::Ignore:  return "ignore";
        case DecodeErrors::Replace: return "replace";
    }
    return "strict";
}

std::string normalizeName(std::string_view charset) {
    std::string out;
    out.reserve(charset.size());
    for (char c : charset) {
        if (c == '-' || c == '_' || c == ' ') continue;
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

bool isUtf8(std::string_view charset) {
    auto name = normalizeName(charset);
    return name == "utf8" || name == "utf8sig";
}

namespace {

std::string hexByte(unsigned char b) {
    char buf[5];
    std::snprintf(buf, sizeof(buf), "0x%02x", b);
    return buf;
}

// Length of the longest prefix at `p` that could still start a
// well-formed sequence, at least one byte. Each such run counts as one
// error, so "\xE2\x82z" yields a single replacement.
std::size_t invalidRunLength(const char* p, const char* end) {
    auto lead = static_cast<unsigned char>(*p);
    std::size_t need = 0;
    unsigned char lo = 0x80, hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        need = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        need = 3;
        if (lead == 0xE0) lo = 0xA0;
        if (lead == 0xED) hi = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        need = 4;
        if (lead == 0xF0) lo = 0x90;
        if (lead == 0xF4) hi = 0x8F;
    } else {
        return 1;
    }

    std::size_t n = 1;
    while (n < need && p + n != end) {
        auto c = static_cast<unsigned char>(p[n]);
        if (c < lo || c > hi) break;
        lo = 0x80;
        hi = 0xBF;
        ++n;
    }
    return n;
}

// ── UTF-8 → UTF-8 with validation, one code point at a time ──
std::string decodeUtf8(std::string_view bytes, const std::string& charset, DecodeErrors errors) {
    static constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

    std::string out;
    out.reserve(bytes.size());

    const char* p = bytes.data();
    const char* end = p + bytes.size();
    while (p != end) {
        const char* start = p;
        utf::code_point cp = utf::utf_traits<char>::decode(p, end);
        if (cp != utf::illegal && cp != utf::incomplete) {
            out.append(start, p);
            continue;
        }

        auto offset = static_cast<std::size_t>(start - bytes.data());
        switch (errors) {
            case DecodeErrors::Strict:
                throw HttpError::encoding(
                    "Unable to decode form data as " + charset + ": invalid byte " +
                        hexByte(static_cast<unsigned char>(*start)) + " at offset " +
                        std::to_string(offset),
                    {{"charset", charset}, {"offset", offset}});
            case DecodeErrors::Replace:
                out.append(kReplacement);
                break;
            case DecodeErrors::Ignore:
                break;
        }
        p = start + invalidRunLength(start, end);
    }
    return out;
}

} // namespace

std::string decode(std::string_view bytes, const std::string& charset, DecodeErrors errors) {
    if (isUtf8(charset)) {
        return decodeUtf8(bytes, charset, errors);
    }

    // Boost.Locale only knows stop/skip; Replace degrades to skip here.
    auto how = errors == DecodeErrors::Strict ? conv::stop : conv::skip;
    try {
        return conv::to_utf<char>(bytes.data(), bytes.data() + bytes.size(), charset, how);
    } catch (const conv::invalid_charset_error&) {
        throw HttpError::configuration("Unsupported charset '" + charset + "'",
                                       {{"charset", charset}});
    } catch (const conv::conversion_error&) {
        throw HttpError::encoding("Unable to decode form data as " + charset,
                                  {{"charset", charset}});
    }
}

} // namespace formpp::charset
