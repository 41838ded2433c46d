// ═══════════════════════════════════════════════════════════════════
//  src/params.cpp — Header parameter parsing
// ═══════════════════════════════════════════════════════════════════

#include "formpp/params.h"
#include "formpp/charset.h"
#include "formpp/error.h"

#include <algorithm>
#include <cctype>

namespace formpp {

namespace {

std::string_view trim(std::string_view s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Splits on ';' outside of double quotes.
std::vector<std::string_view> splitSegments(std::string_view raw) {
    std::vector<std::string_view> segments;
    bool quoted = false;
    bool escaped = false;
    std::size_t start = 0;
    for (std::size_t i = 0; i < raw.size(); ++i) {
        char c = raw[i];
        if (escaped) {
            escaped = false;
        } else if (quoted && c == '\\') {
            escaped = true;
        } else if (c == '"') {
            quoted = !quoted;
        } else if (c == ';' && !quoted) {
            segments.push_back(raw.substr(start, i - start));
            start = i + 1;
        }
    }
    segments.push_back(raw.substr(start));
    return segments;
}

// Only \\ and \" are escapes; other backslashes survive (legacy
// Windows paths in filename="C:\dir\file").
std::string unquote(std::string_view v) {
    if (v.size() < 2 || v.front() != '"') return std::string(v);
    auto inner = v.substr(1, v.back() == '"' ? v.size() - 2 : v.size() - 1);

    std::string out;
    out.reserve(inner.size());
    for (std::size_t i = 0; i < inner.size(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.size() &&
            (inner[i + 1] == '\\' || inner[i + 1] == '"')) {
            out += inner[++i];
        } else {
            out += inner[i];
        }
    }
    return out;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// charset'language'percent-encoded
std::string decodeExtendedValue(std::string_view v) {
    auto first = v.find('\'');
    auto second = first == std::string_view::npos ? first : v.find('\'', first + 1);
    if (second == std::string_view::npos) return std::string(v);

    std::string charsetName(v.substr(0, first));
    auto encoded = v.substr(second + 1);

    std::string bytes;
    bytes.reserve(encoded.size());
    for (std::size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] == '%' && i + 2 < encoded.size()) {
            int hi = hexValue(encoded[i + 1]);
            int lo = hexValue(encoded[i + 2]);
            if (hi >= 0 && lo >= 0) {
                bytes += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        bytes += encoded[i];
    }

    if (charsetName.empty()) charsetName = "us-ascii";
    return charset::decode(bytes, charsetName, charset::DecodeErrors::Replace);
}

} // namespace

std::optional<std::string> HeaderValue::param(std::string_view name) const {
    auto wanted = toLower(name);
    for (const auto& [key, value] : params) {
        if (key == wanted) return value;
    }
    return std::nullopt;
}

HeaderValue parseHeaderValue(std::string_view raw) {
    HeaderValue result;
    auto segments = splitSegments(raw);
    result.value = std::string(trim(segments.front()));

    for (std::size_t i = 1; i < segments.size(); ++i) {
        auto segment = trim(segments[i]);
        auto eq = segment.find('=');
        if (eq == std::string_view::npos) continue;

        auto name = toLower(trim(segment.substr(0, eq)));
        auto value = trim(segment.substr(eq + 1));
        if (name.empty()) continue;

        if (name.back() == '*') {
            result.params.emplace_back(std::move(name), decodeExtendedValue(value));
        } else {
            result.params.emplace_back(std::move(name), unquote(value));
        }
    }
    return result;
}

std::string mediaType(std::string_view contentType) {
    auto value = toLower(trim(parseHeaderValue(contentType).value));
    auto slash = value.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 == value.size()) return "";
    return value;
}

BoundaryInfo resolveBoundary(std::string_view contentType) {
    auto parsed = parseHeaderValue(contentType);

    auto boundary = parsed.param("boundary");
    if (!boundary || boundary->empty()) {
        throw HttpError::configuration("Missing boundary in Content-Type header",
                                       {{"content_type", std::string(contentType)}});
    }

    BoundaryInfo info;
    info.boundary = std::move(*boundary);
    auto cs = parsed.param("charset");
    if (cs && !cs->empty()) info.charset = std::move(*cs);
    return info;
}

} // namespace formpp
