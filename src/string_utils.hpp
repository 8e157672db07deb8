#pragma once

// Internal string helpers shared by the extractor, options and snapshot
// loaders.  This header is NOT installed.

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace digen::internal {

inline std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);
    return text;
}

inline bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x))
                   == std::tolower(static_cast<unsigned char>(y));
           });
}

inline bool is_blank(std::string_view text) {
    return trim(text).empty();
}

/// Split a comma separated list, trimming entries and dropping empty ones.
inline std::vector<std::string> split_list(std::string_view text) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto comma = text.find(',', start);
        auto piece = trim(text.substr(start, comma == std::string_view::npos
                                                 ? std::string_view::npos
                                                 : comma - start));
        if (!piece.empty()) out.emplace_back(piece);
        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }
    return out;
}

/// "true"/"false" (any case), "1"/"0", "yes"/"no".
inline std::optional<bool> parse_bool(std::string_view text) {
    text = trim(text);
    if (iequals(text, "true") || text == "1" || iequals(text, "yes")) return true;
    if (iequals(text, "false") || text == "0" || iequals(text, "no")) return false;
    return std::nullopt;
}

inline bool starts_with(std::string_view text, std::string_view prefix) {
    return text.substr(0, prefix.size()) == prefix;
}

} // namespace digen::internal
