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

#include <reshape/core/Value.h>
#include <reshape/support/parse.h>
#include <reshape/support/string.h>
#include <reshape/support/exception.h>

#include <fmt/format.h>

#include <cctype>
#include <cstdlib>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <optional>
#include <sstream>

namespace reshape {
namespace json {

struct Options
{
    size_t max_depth = 512;
};


namespace impl {

inline bool is_number_start(char c) { return c == '-' || (c >= '0' && c <= '9'); }

template <typename StreamType>
struct Parser
{
  public:
    Parser(const StreamType& stream) : m_it{stream} {}
    Parser(const Options& options, const StreamType& stream) : m_options{options}, m_it{stream} {}

    Parser(Parser&&) =  default;
    Parser(const Parser&) = delete;
    auto operator = (Parser&&) = delete;
    auto operator = (const Parser&) = delete;

    Value::ReprIX parse_type();  // quickly determine type without full parse
    bool parse_document();
    bool parse_object();
    bool parse_number();
    bool parse_string();
    bool parse_map();
    bool parse_list();

    template <typename T>
    bool expect(const char* seq, T value);

    void consume_whitespace();
    bool parse_hex4(uint32_t& code_point);

    void create_error(const std::string& message);

    Options m_options;
    StreamType m_it;
    Value m_curr;
    std::string m_scratch;
    size_t m_depth = 0;
    size_t m_error_offset = 0;
    std::string m_error_message;
};

template <typename StreamType>
Value::ReprIX Parser<StreamType>::parse_type() {
    consume_whitespace();
    char c = m_it.peek();
    switch (c) {
        case '{':  return Value::OMAP;
        case '[':  return Value::LIST;
        case 'n':  return Value::NIL;
        case 't':
        case 'f':  return Value::BOOL;
        case '"':
        case '\'': return Value::STR;
        default:
            if (is_number_start(c) && parse_number())
                return m_curr.type();
            break;
    }
    create_error("Unrecognized value");
    return Value::NIL;
}

/// Parse one complete document, rejecting anything but whitespace after it.
template <typename StreamType>
bool Parser<StreamType>::parse_document()
{
    consume_whitespace();
    if (m_it.done()) {
        create_error("No object in json stream");
        return false;
    }
    if (!parse_object()) return false;
    consume_whitespace();
    if (!m_it.done()) {
        create_error("Unexpected trailing characters");
        return false;
    }
    if (m_it.error()) {
        create_error("Stream read error");
        return false;
    }
    return true;
}

template <typename StreamType>
bool Parser<StreamType>::parse_object()
{
    consume_whitespace();
    char c = m_it.peek();
    switch (c)
    {
        case '\'':
        case '"': return parse_string();

        case '[': return parse_list();
        case '{': return parse_map();

        case 't': return expect("true", true);
        case 'f': return expect("false", false);
        case 'n': return expect("null", nil);

        default:
            if (is_number_start(c)) return parse_number();
            create_error(m_it.done()? "Unexpected end of json stream": "Expected value or object");
            return false;
    }
}

template <typename StreamType>
bool Parser<StreamType>::parse_number() {
    m_scratch.clear();

    bool is_float = false;
    for (; !m_it.done(); m_it.next()) {
        char c = m_it.peek();
        if (c == '.' || c == 'e' || c == 'E')
            is_float = true;
        else if (c != '+' && !is_number_start(c))
            break;
        m_scratch.push_back(c);
    }

    const char* str = m_scratch.c_str();
    const char* scratch_end = str + m_scratch.size();
    char* end = 0;
    errno = 0;
    if (is_float) {
        m_curr = Value{strtod(str, &end)};
    } else {
        Int value = strtoll(str, &end, 10);
        if (errno == ERANGE && m_scratch.front() != '-') {
            errno = 0;
            m_curr = Value{(UInt)strtoull(str, &end, 10)};
        } else {
            m_curr = Value{value};
        }
    }

    if (errno) {
        create_error(strerror(errno));
        errno = 0;
        return false;
    } else if (m_scratch.empty() || end != scratch_end) {
        create_error("Numeric syntax error");
        return false;
    } else {
        return true;
    }
}

template <typename StreamType>
bool Parser<StreamType>::parse_hex4(uint32_t& code_point) {
    code_point = 0;
    for (int i = 0; i < 4; ++i) {
        m_it.next();
        char c = m_it.peek();
        code_point <<= 4;
        if (c >= '0' && c <= '9')      code_point |= (c - '0');
        else if (c >= 'a' && c <= 'f') code_point |= (c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') code_point |= (c - 'A' + 10);
        else {
            create_error("Invalid unicode escape");
            return false;
        }
    }
    return true;
}

template <typename StreamType>
bool Parser<StreamType>::parse_string() {
    char quote = m_it.peek();
    m_it.next();
    std::string str;
    for(; !m_it.done(); m_it.next()) {
        char c = m_it.peek();
        if (c == quote) {
            m_it.next();
            m_curr = Value{std::move(str)};
            return true;
        } else if (c != '\\') {
            str.push_back(c);
            continue;
        }

        m_it.next();
        switch (m_it.peek()) {
            case 'b': str.push_back('\b'); break;
            case 'f': str.push_back('\f'); break;
            case 'n': str.push_back('\n'); break;
            case 'r': str.push_back('\r'); break;
            case 't': str.push_back('\t'); break;
            case 'u': {
                uint32_t code_point;
                if (!parse_hex4(code_point)) return false;
                if (code_point >= 0xDC00 && code_point <= 0xDFFF) {
                    create_error("Unpaired surrogate");
                    return false;
                }
                if (code_point >= 0xD800 && code_point < 0xDC00) {
                    // surrogate pair
                    m_it.next();
                    if (m_it.peek() != '\\') { create_error("Unpaired surrogate"); return false; }
                    m_it.next();
                    if (m_it.peek() != 'u') { create_error("Unpaired surrogate"); return false; }
                    uint32_t low;
                    if (!parse_hex4(low)) return false;
                    if (low < 0xDC00 || low > 0xDFFF) { create_error("Invalid surrogate pair"); return false; }
                    code_point = 0x10000 + ((code_point - 0xD800) << 10) + (low - 0xDC00);
                }
                append_utf8(str, code_point);
                break;
            }
            case '\0':
                if (m_it.done()) {
                    create_error("Unterminated string");
                    return false;
                }
                [[fallthrough]];
            default:
                str.push_back(m_it.peek());
                break;
        }
    }

    create_error("Unterminated string");
    return false;
}

template <typename StreamType>
bool Parser<StreamType>::parse_list() {
    if (++m_depth > m_options.max_depth) {
        create_error("Maximum nesting depth exceeded");
        return false;
    }

    List list;
    m_it.next();  // consume [
    consume_whitespace();
    if (m_it.peek() == ']') {
        m_it.next();
        m_curr = Value{std::move(list)};
        --m_depth;
        return true;
    }
    while (!m_it.done()) {
        if (!parse_object()) return false;
        list.push_back(std::move(m_curr));
        consume_whitespace();
        char c = m_it.peek();
        if (c == ']') {
            m_it.next();
            m_curr = Value{std::move(list)};
            --m_depth;
            return true;
        } else if (c == ',') {
            m_it.next();
            continue;
        } else if (!m_it.done()) {
            create_error("Expected token ',' or ']'");
            return false;
        }
    }

    create_error("Unterminated list");
    return false;
}

template <typename StreamType>
bool Parser<StreamType>::parse_map() {
    if (++m_depth > m_options.max_depth) {
        create_error("Maximum nesting depth exceeded");
        return false;
    }

    OrderedMap map;
    m_it.next();  // consume {
    consume_whitespace();
    if (m_it.peek() == '}') {
        m_it.next();
        m_curr = Value{std::move(map)};
        --m_depth;
        return true;
    }

    while (!m_it.done()) {
        // key
        consume_whitespace();
        char c = m_it.peek();
        if (c != '"' && c != '\'') {
            create_error("Expected dictionary key");
            return false;
        }
        if (!parse_string()) return false;
        String key = std::move(m_curr.as<String>());

        consume_whitespace();
        c = m_it.peek();
        if (c != ':') {
            create_error("Expected token ':'");
            return false;
        }

        // consume :
        m_it.next();

        // value
        if (!parse_object()) return false;

        map.insert_or_assign(std::move(key), std::move(m_curr));
        consume_whitespace();

        c = m_it.peek();
        if (c == '}') {
            m_it.next();
            m_curr = Value{std::move(map)};
            --m_depth;
            return true;
        } else if (c == ',') {
            m_it.next();
            continue;
        } else if (!m_it.done()) {
            create_error("Expected token ',' or '}'");
            return false;
        }
    }

    create_error("Unterminated map");
    return false;
}

template <typename StreamType>
template <typename T>
bool Parser<StreamType>::expect(const char* seq, T value) {
    const char* seq_it = seq;
    for (; *seq_it != 0; m_it.next(), seq_it++) {
        if (m_it.done() || *seq_it != m_it.peek()) {
            create_error("Invalid literal");
            return false;
        }
    }
    m_curr = Value{value};
    return true;
}

template <typename StreamType>
void Parser<StreamType>::consume_whitespace()
{
    while (!m_it.done() && std::isspace((unsigned char)m_it.peek())) m_it.next();
}

template <typename StreamType>
void Parser<StreamType>::create_error(const std::string& message)
{
    m_error_message = message;
    m_error_offset = m_it.consumed();
}

} // namespace impl


struct Error
{
    size_t error_offset = 0;
    std::string error_message;

    std::string to_str() const {
        if (error_message.size() > 0)
            return fmt::format("JSON parse error at {}: {}", error_offset, error_message);
        return "";
    }
};


inline
Value parse(const std::string_view& str, std::optional<Error>& error, const Options& options = {}) {
    impl::Parser parser{options, parse::StringStreamAdapter{str}};
    if (!parser.parse_document()) {
        error = Error{parser.m_error_offset, std::move(parser.m_error_message)};
        return nil;
    }
    return std::move(parser.m_curr);
}

inline
Value parse(const std::string_view& str, std::string& error, const Options& options = {}) {
    std::optional<Error> parse_error;
    Value result = parse(str, parse_error, options);
    if (parse_error) {
        error = parse_error->to_str();
        return nil;
    }
    return result;
}

inline
Value parse(const std::string_view& str, const Options& options = {}) {
    impl::Parser parser{options, parse::StringStreamAdapter{str}};
    if (!parser.parse_document()) {
        throw parse::SyntaxError(str, parser.m_error_offset, parser.m_error_message);
    }
    return std::move(parser.m_curr);
}

inline
Value parse(std::istream& stream, std::optional<Error>& error, const Options& options = {}) {
    impl::Parser parser{options, parse::StreamAdapter<std::istream>{stream}};
    if (!parser.parse_document()) {
        error = Error{parser.m_error_offset, std::move(parser.m_error_message)};
        return nil;
    }
    return std::move(parser.m_curr);
}

inline
Value parse_file(const std::string& file_name, std::string& error, const Options& options = {}) {
    std::ifstream f_in{file_name, std::ios::in};
    if (!f_in.is_open()) {
        error = fmt::format("Error opening file: {}", file_name);
        return nil;
    }

    std::optional<Error> parse_error;
    Value result = parse(f_in, parse_error, options);
    if (parse_error) {
        error = fmt::format("{}: {}", file_name, parse_error->to_str());
        return nil;
    }
    return result;
}

} // namespace json

inline
Value operator ""_json (const char* str, size_t size) {
    return json::parse(std::string_view{str, size});
}

} // namespace reshape
