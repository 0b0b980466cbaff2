// SPDX-License-Identifier: MIT

// include/dbxfer/url_encode.hpp
#pragma once

#include <cctype>
#include <expected>
#include <iterator>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "dbxfer/error.hpp"

namespace dbxfer {

// URL encode helper - writes to output iterator
// Encodes all characters except alphanumeric and -_.~
template<typename OutputIt>
OutputIt UrlEncode(OutputIt out, std::string_view value) {
    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            *out++ = c;
        } else {
            out = fmt::format_to(out, "%{:02X}", static_cast<unsigned char>(c));
        }
    }
    return out;
}

inline std::string UrlEncode(std::string_view value) {
    std::string out;
    UrlEncode(std::back_inserter(out), value);
    return out;
}

// Decode %XX escapes. A '%' not followed by two hex digits is an error.
inline std::expected<std::string, Error> UrlDecode(std::string_view value) {
    auto hex = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] != '%') {
            out += value[i];
            continue;
        }
        int hi = i + 2 < value.size() ? hex(value[i + 1]) : -1;
        int lo = i + 2 < value.size() ? hex(value[i + 2]) : -1;
        if (hi < 0 || lo < 0) {
            return std::unexpected(Error{ErrorCode::InvalidLocator,
                                         fmt::format("invalid %-escape in {}", value)});
        }
        out += static_cast<char>(hi * 16 + lo);
        i += 2;
    }
    return out;
}

}  // namespace dbxfer
