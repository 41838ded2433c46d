#pragma once
// ═══════════════════════════════════════════════════════════════════
//  formpp/headers.h — Headers of a single multipart part
// ═══════════════════════════════════════════════════════════════════

#include "charset.h"
#include "delimiter.h"
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace formpp::multipart {

// ═══════════════════════════════════════════════════════════════════
//  class PartHeaders
//  Ordered "Key: value" pairs with case-insensitive lookup. Repeated
//  keys are kept; get() returns the first one.
// ═══════════════════════════════════════════════════════════════════
class PartHeaders {
public:
    void add(std::string key, std::string value) {
        entries_.emplace_back(std::move(key), std::move(value));
    }

    bool has(std::string_view key) const;
    std::optional<std::string> get(std::string_view key) const;

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const std::vector<std::pair<std::string, std::string>>& entries() const { return entries_; }

    // Lower-cased media type of Content-Type, or "text/plain" when the
    // header is absent or not of the form type/subtype.
    std::string contentType() const;

private:
    std::vector<std::pair<std::string, std::string>> entries_;
};

// ── What the parser needs to know about one part ──
struct PartInfo {
    std::string name;
    std::optional<std::string> filename;
    std::string contentType;

    bool isFile() const { return filename.has_value(); }
};

// Splits the raw header block on `delimiter`, decodes each line and
// keeps the well-formed "Key: value" lines. Lines without a colon are
// skipped.
PartHeaders parsePartHeaders(std::string_view raw, Delimiter delimiter,
                             const std::string& encoding,
                             charset::DecodeErrors errors);

// Throws a Protocol HttpError when Content-Disposition or its name
// parameter is missing.
PartInfo describePart(const PartHeaders& headers);

} // namespace formpp::multipart
