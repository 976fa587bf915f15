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
#include <reshape/core/Options.h>
#include <reshape/core/Decoration.h>
#include <reshape/support/logging.h>
#include <reshape/fmt_support.h>

#include <fmt/format.h>
#include <optional>
#include <unordered_map>
#include <vector>

namespace reshape {
namespace impl {

//////////////////////////////////////////////////////////////////////////////
/// @brief Renders a template against a source document.
/// Array conversions are rendered by binding every spread field of the
/// converted object to one element of its list, and rendering the object
/// once per index with those bindings in effect.
//////////////////////////////////////////////////////////////////////////////
class Walker
{
  public:
    Walker(const Value& source, const Options& options) : m_source{source}, m_options{options} {}
    Walker(const Value& source, const Options& options, const Location& location)
      : m_source{source}, m_options{options}, m_location{location} {}

    Value render(const Value& tmpl) { return render_node(tmpl, nullptr); }

  private:
    // template node of a spread field -> element substituted for it
    using Bindings = std::unordered_map<const Value*, const Value*>;

    struct Spread
    {
        const Value* node;
        String location;
        Value sequence;
    };

    class DepthGuard
    {
      public:
        DepthGuard(Walker& walker) : m_walker{walker} {
            if (++m_walker.m_depth > m_walker.m_options.max_depth) {
                --m_walker.m_depth;
                throw DepthExceeded(m_walker.m_location, m_walker.m_options.max_depth);
            }
        }
        ~DepthGuard() { --m_walker.m_depth; }

        DepthGuard(const DepthGuard&) = delete;
        auto operator = (const DepthGuard&) = delete;

      private:
        Walker& m_walker;
    };

    Value render_node(const Value& tmpl, const Bindings* bindings);
    Value render_map(const OrderedMap& map, const Bindings* bindings);
    Value render_list(const List& list, const Bindings* bindings);
    Value render_leaf(const Value& tmpl);

    Value convert(const Value& tmpl, const Decoration& decoration);
    void scan_spreads(const Value& tmpl, std::vector<Spread>& spreads);
    Value spread_sequence(const Value& tmpl, const Decoration& decoration);

    const Value& m_source;
    const Options& m_options;
    Location m_location;
    size_t m_depth = 0;
};

inline
Value Walker::render_node(const Value& tmpl, const Bindings* bindings) {
    DepthGuard guard{*this};
    switch (tmpl.type()) {
        case Value::OMAP: return render_map(tmpl.as<OrderedMap>(), bindings);
        case Value::LIST: return render_list(tmpl.as<List>(), bindings);
        default:          return render_leaf(tmpl);
    }
}

inline
Value Walker::render_map(const OrderedMap& map, const Bindings* bindings) {
    Value result{Value::OMAP};
    auto& out = result.as<OrderedMap>();
    for (auto& [raw_key, tmpl] : map) {
        LocationStep step{m_location, raw_key};
        auto decoration = parse_key(raw_key, m_location);

        if (out.find(decoration.key) != out.end())
            throw TemplateSyntaxError(m_location, fmt::format("duplicate output key {}", json_quote(decoration.key)));

        if (bindings != nullptr) {
            auto it = bindings->find(&tmpl);
            if (it != bindings->end()) {
                out.emplace(decoration.key, *it->second);
                continue;
            }
        }

        if (decoration.is_array_conversion()) {
            out.emplace(decoration.key, convert(tmpl, decoration));
        } else {
            out.emplace(decoration.key, render_node(tmpl, bindings));
        }
    }
    return result;
}

inline
Value Walker::render_list(const List& list, const Bindings* bindings) {
    List result;
    result.reserve(list.size());
    for (size_t i = 0; i < list.size(); ++i) {
        LocationStep step{m_location, i};
        result.push_back(render_node(list[i], bindings));
    }
    return result;
}

inline
Value Walker::render_leaf(const Value& tmpl) {
    auto leaf = parse_leaf(tmpl, m_location);
    switch (leaf.kind) {
        case Leaf::PATH: {
            auto resolved = Resolver{m_options, m_location, m_depth}.resolve(m_source, leaf.path);
            RESHAPE_DEBUG("{} resolved {} at {}", resolved.is_flat()? "flat": "scalar", leaf.path, m_location);
            return resolved.to_value();
        }
        case Leaf::LITERAL: return std::move(leaf.literal);
        default:            return tmpl;
    }
}

/// Convert an object template into a list with one copy per element of its spread fields.
inline
Value Walker::convert(const Value& tmpl, const Decoration& decoration) {
    if (!tmpl.is_map()) {
        throw TemplateSyntaxError(m_location, fmt::format("array conversion [{}] requires an object, found {}",
                                                          decoration.key, tmpl.type_name()));
    }

    std::vector<Spread> spreads;
    scan_spreads(tmpl, spreads);

    if (spreads.size() == 0) {
        throw NoSpreadTarget(m_location, fmt::format("array conversion [{}] is detected but no spread field was found",
                                                     decoration.key));
    }

    auto length = spreads.front().sequence.size();
    for (auto& spread : spreads) {
        if (spread.sequence.size() != length) {
            throw SpreadLengthMismatch(m_location, fmt::format("spread field {} has length {}, but {} has length {}",
                                                               spreads.front().location, length,
                                                               spread.location, spread.sequence.size()));
        }
    }

    RESHAPE_DEBUG("array conversion {} with {} spread fields of length {}", m_location, spreads.size(), length);

    List result;
    result.reserve(length);
    Bindings bindings;
    for (size_t i = 0; i < length; ++i) {
        for (auto& spread : spreads)
            bindings[spread.node] = &spread.sequence.as<List>()[i];
        result.push_back(render_node(tmpl, &bindings));
    }
    return result;
}

/// Find the spread fields belonging to the conversion rooted at tmpl.
/// Nested conversions are independent scopes, and are not entered.
inline
void Walker::scan_spreads(const Value& tmpl, std::vector<Spread>& spreads) {
    DepthGuard guard{*this};
    switch (tmpl.type()) {
        case Value::OMAP: {
            for (auto& [raw_key, child] : tmpl.as<OrderedMap>()) {
                LocationStep step{m_location, raw_key};
                auto decoration = parse_key(raw_key, m_location);
                if (decoration.is_spread()) {
                    spreads.push_back({&child, m_location.to_str(), spread_sequence(child, decoration)});
                } else if (!decoration.is_array_conversion()) {
                    scan_spreads(child, spreads);
                }
            }
            break;
        }
        case Value::LIST: {
            auto& list = tmpl.as<List>();
            for (size_t i = 0; i < list.size(); ++i) {
                LocationStep step{m_location, i};
                scan_spreads(list[i], spreads);
            }
            break;
        }
        default:
            break;
    }
}

/// Render the value of a spread field, which must produce a list.
inline
Value Walker::spread_sequence(const Value& tmpl, const Decoration& decoration) {
    Value sequence;
    if (decoration.is_array_conversion()) {
        sequence = convert(tmpl, decoration);
    } else if (tmpl.is_map()) {
        throw SpreadTypeMismatch(m_location, fmt::format("spread field {} has an object template, expected a sequence",
                                                         json_quote(decoration.key)));
    } else {
        sequence = render_node(tmpl, nullptr);
    }

    if (!sequence.is_type<List>()) {
        throw SpreadTypeMismatch(m_location, fmt::format("spread field {} resolved to {}, expected a sequence",
                                                         json_quote(decoration.key), sequence.type_name()));
    }
    return sequence;
}

} // namespace impl


/// Reshape a source document into the structure declared by a template.
/// @throw TransformError (or a subclass) on the first unresolvable path or
///        malformed template; no partial result is produced.
inline
Value transform(const Value& source, const Value& tmpl, const Options& options = {}) {
    return impl::Walker{source, options}.render(tmpl);
}

/// Non-throwing form of transform.
/// @return The transformed document, or nil with error set.
inline
Value transform(const Value& source, const Value& tmpl, std::optional<Error>& error, const Options& options = {}) {
    try {
        return transform(source, tmpl, options);
    } catch (const TransformError& e) {
        error = Error{e.code(), e.location(), e.reason()};
        return nil;
    }
}

/// Transform a source document with each template of a list.
/// Every template must be a non-empty object naming its output.
/// @return A list containing one transformed document per template.
inline
Value transform_each(const Value& source, const Value& templates, const Options& options = {}) {
    Location location;
    if (!templates.is_type<List>())
        throw TemplateSyntaxError(location, "templates should be an array of objects");

    auto& list = templates.as<List>();
    List result;
    result.reserve(list.size());
    for (size_t i = 0; i < list.size(); ++i) {
        LocationStep step{location, i};
        auto& tmpl = list[i];
        if (!tmpl.is_map())
            throw TemplateSyntaxError(location, fmt::format("template array elements should be objects: {}", tmpl.to_json()));
        if (tmpl.size() == 0)
            throw TemplateSyntaxError(location, fmt::format("template has no output name: {}", tmpl.to_json()));
        result.push_back(impl::Walker{source, options, location}.render(tmpl));
    }
    return result;
}

inline
Value transform_each(const Value& source, const Value& templates, std::optional<Error>& error, const Options& options = {}) {
    try {
        return transform_each(source, templates, options);
    } catch (const TransformError& e) {
        error = Error{e.code(), e.location(), e.reason()};
        return nil;
    }
}

} // namespace reshape
