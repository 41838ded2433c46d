// ═══════════════════════════════════════════════════════════════════
//  src/headers.cpp — Part header block parsing
// ═══════════════════════════════════════════════════════════════════

#include "formpp/headers.h"
#include "formpp/error.h"
#include "formpp/params.h"

#include <algorithm>
#include <cctype>

namespace formpp::multipart {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string_view trim(std::string_view s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

} // namespace

bool PartHeaders::has(std::string_view key) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [&](const auto& e) { return iequals(e.first, key); });
}

std::optional<std::string> PartHeaders::get(std::string_view key) const {
    for (const auto& [k, v] : entries_) {
        if (iequals(k, key)) return v;
    }
    return std::nullopt;
}

std::string PartHeaders::contentType() const {
    auto raw = get("Content-Type");
    if (!raw) return "text/plain";
    auto type = mediaType(*raw);
    return type.empty() ? "text/plain" : type;
}

PartHeaders parsePartHeaders(std::string_view raw, Delimiter delimiter,
                             const std::string& encoding,
                             charset::DecodeErrors errors) {
    PartHeaders headers;
    const auto delim = bytes(delimiter);

    std::size_t pos = 0;
    while (pos <= raw.size()) {
        auto next = raw.find(delim, pos);
        auto line = raw.substr(pos, next == std::string_view::npos ? std::string_view::npos
                                                                     : next - pos);
        pos = next == std::string_view::npos ? raw.size() + 1 : next + delim.size();

        line = trim(line);
        if (line.empty()) continue;

        auto text = charset::decode(line, encoding, errors);
        auto colon = text.find(':');
        if (colon == std::string::npos) continue;

        auto key = trim(std::string_view(text).substr(0, colon));
        auto value = trim(std::string_view(text).substr(colon + 1));
        headers.add(std::string(key), std::string(value));
    }
    return headers;
}

PartInfo describePart(const PartHeaders& headers) {
    auto disposition = headers.get("Content-Disposition");
    if (!disposition) {
        throw HttpError::protocol("Missing Content-Disposition header.");
    }

    auto parsed = parseHeaderValue(*disposition);
    auto name = parsed.param("name");
    if (!name) {
        throw HttpError::protocol("Missing name in Content-Disposition header.",
                                  {{"content_disposition", *disposition}});
    }

    PartInfo info;
    info.name = std::move(*name);
    // filename="" (no file chosen in the browser) is sent as a plain field.
    auto filename = parsed.param("filename*");
    if (!filename || filename->empty()) filename = parsed.param("filename");
    if (filename && !filename->empty()) {
        info.filename = std::move(*filename);
    }
    info.contentType = headers.contentType();
    return info;
}

} // namespace formpp::multipart
