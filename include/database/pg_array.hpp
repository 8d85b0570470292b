#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace SixDegrees {

// Array literals for binding lists as a single text parameter ($1::text[]).

// {"movie","tvSeries"}; every element quoted, " and \ escaped
inline std::string text_array_literal(const std::vector<std::string>& items) {
    std::string out = "{";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out.push_back(',');
        out.push_back('"');
        for (char c : items[i]) {
            if (c == '"' || c == '\\') out.push_back('\\');
            out.push_back(c);
        }
        out.push_back('"');
    }
    out.push_back('}');
    return out;
}

// {87277,164052}
inline std::string int_array_literal(const std::vector<int64_t>& items) {
    std::string out = "{";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out.push_back(',');
        out += std::to_string(items[i]);
    }
    out.push_back('}');
    return out;
}

} // namespace SixDegrees
