#pragma once
// ═══════════════════════════════════════════════════════════════════
//  formpp/params.h — Parameterised header values and boundary lookup
// ═══════════════════════════════════════════════════════════════════
//
//  parseHeaderValue("form-data; name=\"avatar\"; filename=\"me.png\"")
//    → value  = "form-data"
//      params = {name: "avatar", filename: "me.png"}
//
//  resolveBoundary("multipart/form-data; boundary=xyz; charset=latin1")
//    → {boundary: "xyz", charset: "latin1"}
//
// ═══════════════════════════════════════════════════════════════════

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace formpp {

struct HeaderValue {
    std::string value;
    // Parameter names are lower-cased; values are unquoted. RFC 2231
    // extended values (name*=charset'lang'pct-encoded) are stored decoded
    // under their starred name.
    std::vector<std::pair<std::string, std::string>> params;

    // First parameter with this (case-insensitive) name.
    std::optional<std::string> param(std::string_view name) const;
};

HeaderValue parseHeaderValue(std::string_view raw);

// ── Lower-cased "type/subtype" of a Content-Type value, "" if malformed ──
std::string mediaType(std::string_view contentType);

struct BoundaryInfo {
    std::string boundary;
    std::optional<std::string> charset;
};

// Throws a Configuration HttpError when no boundary parameter is present.
BoundaryInfo resolveBoundary(std::string_view contentType);

} // namespace formpp
