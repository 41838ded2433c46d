#pragma once
// ═══════════════════════════════════════════════════════════════════
//  formpp/env.h — Typed access to environment variables
// ═══════════════════════════════════════════════════════════════════
//
//  auto size  = env::get<std::size_t>("FORMPP_MAX_BODY_SIZE", 2 << 20);
//  auto debug = env::get<bool>("FORMPP_DEBUG", false);
//  auto dir   = env::get("FORMPP_TEMP_DIR");   // std::optional<std::string>
//
//  Booleans are true for "true", "1", "yes", "y" and "on"
//  (case-insensitive) and false for any other value.
//
// ═══════════════════════════════════════════════════════════════════

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace formpp::env {

// ── Raw lookup ──
inline std::optional<std::string> get(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    if (value == nullptr) return std::nullopt;
    return std::string(value);
}

// ── Like get(), but a missing variable is an error ──
inline std::string require(const std::string& key) {
    auto value = get(key);
    if (!value) {
        throw std::invalid_argument(
            "Environment variable '" + key + "' is not set and no default value was provided.");
    }
    return *value;
}

template <typename T>
T parse(const std::string& key, const std::string& raw) {
    if constexpr (std::is_same_v<T, std::string>) {
        return raw;
    } else if constexpr (std::is_same_v<T, bool>) {
        std::string lower = raw;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower == "true" || lower == "1" || lower == "yes" || lower == "y" || lower == "on";
    } else if constexpr (std::is_integral_v<T>) {
        T value{};
        auto [end, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
        if (ec != std::errc() || end != raw.data() + raw.size()) {
            throw std::invalid_argument(
                "Environment variable '" + key + "' is not a valid integer: '" + raw + "'");
        }
        return value;
    } else {
        static_assert(std::is_same_v<T, std::string>, "unsupported environment value type");
    }
}

// ── Parsed lookup with a default ──
template <typename T>
T get(const std::string& key, T fallback) {
    auto raw = get(key);
    if (!raw) return fallback;
    return parse<T>(key, *raw);
}

} // namespace formpp::env
