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
#include <reshape/core/Path.h>
#include <reshape/core/Error.h>
#include <reshape/support/Flags.h>

#include <fmt/format.h>

namespace reshape {

//////////////////////////////////////////////////////////////////////////////
/// @brief A template key with its decorations removed.
/// - `[name]` marks an object to be converted into a list of copies.
/// - `...name` marks a field whose list is spread across those copies.
/// - `...[name]` is both: the converted list contributes to the enclosing
///   conversion.
//////////////////////////////////////////////////////////////////////////////
struct Decoration
{
    RESHAPE_FLAG8 NONE = 0x0;
    RESHAPE_FLAG8 ARRAY_CONVERSION = 0x1;
    RESHAPE_FLAG8 SPREAD = 0x2;

    String key;
    Flags<uint8_t> flags;

    bool is_array_conversion() const { return flags.has(ARRAY_CONVERSION); }
    bool is_spread() const           { return flags.has(SPREAD); }
};

constexpr StringView spread_marker = "...";

/// Strip the decorations from a template key.
/// @throw TemplateSyntaxError if a decoration is malformed.
inline
Decoration parse_key(const StringView& raw_key, const Location& location = {}) {
    Decoration decoration;
    StringView name = raw_key;

    if (name.starts_with(spread_marker)) {
        name.remove_prefix(spread_marker.size());
        if (name.size() == 0)
            throw TemplateSyntaxError(location, "spread marker without a field name");
        decoration.flags |= Decoration::SPREAD;
    }

    if (name.starts_with('[')) {
        if (name.size() < 2 || !name.ends_with(']'))
            throw TemplateSyntaxError(location, fmt::format("unterminated bracket in key {}", json_quote(raw_key)));
        name = name.substr(1, name.size() - 2);
        if (name.size() == 0)
            throw TemplateSyntaxError(location, "array conversion without an object name");
        if (name.starts_with(spread_marker))
            throw TemplateSyntaxError(location, fmt::format("spread marker must precede the brackets in key {}", json_quote(raw_key)));
        decoration.flags |= Decoration::ARRAY_CONVERSION;
    }

    decoration.key = name;
    return decoration;
}


//////////////////////////////////////////////////////////////////////////////
/// @brief Classification of a template value.
//////////////////////////////////////////////////////////////////////////////
struct Leaf
{
    enum Kind {
        PATH,       // string beginning with '/'
        LITERAL,    // string wrapped in single quotes
        VERBATIM,   // any other scalar, copied as is
        STRUCTURE,  // object or list template
    };

    Kind kind;
    Path path;
    String literal;
};

inline
bool is_literal(const StringView& str) {
    return str.size() >= 2 && str.front() == '\'' && str.back() == '\'';
}

/// Classify a template value.
/// @throw TemplateSyntaxError if a path expression is malformed.
inline
Leaf parse_leaf(const Value& tmpl, const Location& location = {}) {
    switch (tmpl.type()) {
        case Value::LIST: [[fallthrough]];
        case Value::OMAP: return {Leaf::STRUCTURE, {}, {}};
        case Value::STR: {
            auto& str = tmpl.as<String>();
            if (is_literal(str))
                return {Leaf::LITERAL, {}, str.substr(1, str.size() - 2)};
            if (Path::is_path(str)) {
                Leaf leaf{Leaf::PATH, {}, {}};
                std::string error;
                if (!Path::parse(str, leaf.path, error))
                    throw TemplateSyntaxError(location, fmt::format("malformed path {}: {}", json_quote(str), error));
                return leaf;
            }
            return {Leaf::VERBATIM, {}, {}};
        }
        default:
            return {Leaf::VERBATIM, {}, {}};
    }
}

} // namespace reshape
