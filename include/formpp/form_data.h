#pragma once
// ═══════════════════════════════════════════════════════════════════
//  formpp/form_data.h — Parsed fields and uploaded files
// ═══════════════════════════════════════════════════════════════════
//
//  A name seen once maps to a single value; a repeated name is promoted
//  to an ordered list on its second occurrence:
//
//    forms["title"].isList()    → false, forms["title"].value() == "Hi"
//    files["photos"].isList()   → true,  files["photos"].at(1).filename
//
// ═══════════════════════════════════════════════════════════════════

#include "temp_file.h"
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <cstdint>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace formpp {

// ═══════════════════════════════════════════════════════════════════
//  class FormValue<T>
//  Either Single(T) or Many(std::vector<T>). Never an empty list.
// ═══════════════════════════════════════════════════════════════════
template <typename T>
class FormValue {
public:
    explicit FormValue(T value) : data_(std::move(value)) {}

    bool isList() const { return std::holds_alternative<std::vector<T>>(data_); }

    std::size_t size() const {
        return isList() ? std::get<std::vector<T>>(data_).size() : 1;
    }

    // The single value. Throws std::bad_variant_access on a list.
    const T& value() const { return std::get<T>(data_); }

    // Occurrence i in stream order; works for both shapes.
    const T& at(std::size_t i) const {
        if (!isList()) {
            if (i != 0) throw std::out_of_range("FormValue index out of range");
            return std::get<T>(data_);
        }
        return std::get<std::vector<T>>(data_).at(i);
    }

    const T& first() const { return at(0); }
    const T& last() const { return at(size() - 1); }

    // All occurrences, copied into a list regardless of shape.
    std::vector<T> values() const {
        if (isList()) return std::get<std::vector<T>>(data_);
        return {std::get<T>(data_)};
    }

    // Promotes Single → Many on the first append.
    void append(T value) {
        if (!isList()) {
            std::vector<T> list;
            list.push_back(std::move(std::get<T>(data_)));
            data_ = std::move(list);
        }
        std::get<std::vector<T>>(data_).push_back(std::move(value));
    }

private:
    std::variant<T, std::vector<T>> data_;
};

// ── A spooled upload; `file` is positioned at offset 0 after parsing ──
struct UploadedFile {
    std::string filename;
    std::string contentType;
    std::uintmax_t size = 0;
    std::shared_ptr<TempFile> file;
};

using FormFields = std::unordered_map<std::string, FormValue<std::string>>;
using FileFields = std::unordered_map<std::string, FormValue<UploadedFile>>;

// ── Insert, or promote-and-append when the name already exists ──
template <typename T>
void appendValue(std::unordered_map<std::string, FormValue<T>>& map,
                 const std::string& name, T value) {
    auto it = map.find(name);
    if (it == map.end()) {
        map.emplace(name, FormValue<T>(std::move(value)));
    } else {
        it->second.append(std::move(value));
    }
}

// ═══════════════════════════════════════════
//  JSON views
// ═══════════════════════════════════════════

inline nlohmann::json toJson(const UploadedFile& file) {
    return {
        {"filename", file.filename},
        {"content_type", file.contentType},
        {"size", file.size},
        {"path", file.file ? file.file->path().string() : std::string()}
    };
}

template <typename T>
nlohmann::json toJson(const FormValue<T>& value) {
    auto one = [](const T& v) -> nlohmann::json {
        if constexpr (std::is_same_v<T, UploadedFile>) {
            return toJson(v);
        } else {
            return nlohmann::json(v);
        }
    };
    if (!value.isList()) return one(value.value());
    auto arr = nlohmann::json::array();
    for (std::size_t i = 0; i < value.size(); ++i) arr.push_back(one(value.at(i)));
    return arr;
}

inline nlohmann::json toJson(const FormFields& forms) {
    auto j = nlohmann::json::object();
    for (const auto& [name, value] : forms) j[name] = toJson(value);
    return j;
}

inline nlohmann::json toJson(const FileFields& files) {
    auto j = nlohmann::json::object();
    for (const auto& [name, value] : files) j[name] = toJson(value);
    return j;
}

} // namespace formpp
