// Copyright 2024 Robert A. Dunnagan
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#pragma once

#include <string>
#include <sstream>
#include <charconv>
#include <cstdio>
#include <cmath>

#include <reshape/support/types.h>
#include <reshape/support/exception.h>

namespace reshape {

inline
std::string int_to_str(int64_t v) {
    char buf[24];
    auto len = std::snprintf(buf, 23, "%lld", (long long)v);
    RESHAPE_ASSERT(len > 0);
    return {buf, (size_t)len};
}

inline
std::string int_to_str(uint64_t v) {
    char buf[24];
    auto len = std::snprintf(buf, 23, "%llu", (unsigned long long)v);
    RESHAPE_ASSERT(len > 0);
    return {buf, (size_t)len};
}

inline
std::string float_to_str(double v) {
    // JSON has no representation for these
    if (std::isnan(v) || std::isinf(v)) return "null";

    char buf[32];
    // There are 53-bits in IEEE 754 (64-bit float) standard, and log10(2**53) equals 15.95, so
    // round to 15 digits precision.
    auto len = std::snprintf(buf, 31, "%.15g", v);
    RESHAPE_ASSERT(len > 0);
    std::string str{buf, (size_t)len};
    if (str.find_first_of(".eE") == std::string::npos) str += ".0";
    return str;
}

/// Append the UTF-8 encoding of a unicode code point.
inline
void append_utf8(std::string& str, uint32_t cp) {
    if (cp < 0x80) {
        str.push_back((char)cp);
    } else if (cp < 0x800) {
        str.push_back((char)(0xC0 | (cp >> 6)));
        str.push_back((char)(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        str.push_back((char)(0xE0 | (cp >> 12)));
        str.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        str.push_back((char)(0x80 | (cp & 0x3F)));
    } else {
        str.push_back((char)(0xF0 | (cp >> 18)));
        str.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
        str.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        str.push_back((char)(0x80 | (cp & 0x3F)));
    }
}

/// Write a string as a double-quoted JSON string literal.
inline
void json_quote(std::ostream& os, const StringView& str) {
    os << '"';
    for (char c : str) {
        switch (c) {
            case '"':  os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\b': os << "\\b"; break;
            case '\f': os << "\\f"; break;
            case '\n': os << "\\n"; break;
            case '\r': os << "\\r"; break;
            case '\t': os << "\\t"; break;
            default:
                if ((unsigned char)c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)c);
                    os << buf;
                } else {
                    os << c;
                }
        }
    }
    os << '"';
}

inline
std::string json_quote(const StringView& str) {
    std::stringstream ss;
    json_quote(ss, str);
    return ss.str();
}

inline
bool str_to_uint(const StringView& str, UInt& value) {
    const char* beg = str.data();
    const char* end = beg + str.size();
    auto result = std::from_chars(beg, end, value);
    return result.ec == std::errc() && result.ptr == end;
}

} // namespace reshape
