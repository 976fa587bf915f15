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
#include <reshape/core/Error.h>
#include <reshape/core/Options.h>
#include <reshape/support/logging.h>

#include <fmt/format.h>
#include <string>
#include <vector>

namespace reshape {

struct InvalidPath : public ReshapeException
{
    InvalidPath(const StringView& spec, const std::string& reason)
      : ReshapeException(fmt::format("invalid path {}: {}", json_quote(spec), reason)) {}
};


//////////////////////////////////////////////////////////////////////////////
/// @brief A path expression locating values in a source document.
/// The string form begins with `/` and separates keys with `/`, for example
/// `/order/shipments/tracking_number`. The path `/` refers to the document
/// root. Segments are always keys, never list indices.
/// @see reshape::resolve
//////////////////////////////////////////////////////////////////////////////
class Path
{
  public:
    using ConstIterator = KeyList::const_iterator;

    Path() {}
    Path(const StringView& spec);
    Path(const KeyList& keys) : m_keys{keys} {}
    Path(KeyList&& keys)      : m_keys{std::forward<KeyList>(keys)} {}

    static bool is_path(const StringView& str) { return str.size() > 0 && str[0] == '/'; }
    static bool parse(const StringView& spec, Path& path, std::string& error);

    ConstIterator begin() const { return m_keys.cbegin(); }
    ConstIterator end() const   { return m_keys.cend(); }
    size_t size() const         { return m_keys.size(); }

    bool operator == (const Path& other) const { return m_keys == other.m_keys; }

    String to_str() const;

  private:
    KeyList m_keys;
};

inline
Path::Path(const StringView& spec) {
    std::string error;
    if (!parse(spec, *this, error))
        throw InvalidPath(spec, error);
}

inline
bool Path::parse(const StringView& spec, Path& path, std::string& error) {
    if (!is_path(spec)) {
        error = "path must begin with '/'";
        return false;
    }

    KeyList keys;
    if (spec.size() > 1) {
        size_t pos = 1;
        while (true) {
            auto next = spec.find('/', pos);
            auto segment = spec.substr(pos, (next == StringView::npos)? StringView::npos: next - pos);
            if (segment.size() == 0) {
                error = fmt::format("empty segment at offset {}", pos);
                return false;
            }
            keys.emplace_back(segment);
            if (next == StringView::npos) break;
            pos = next + 1;
        }
    }

    path.m_keys = std::move(keys);
    return true;
}

inline
String Path::to_str() const {
    if (m_keys.size() == 0) return "/";
    String str;
    for (auto& key : m_keys) {
        str.push_back('/');
        str.append(key);
    }
    return str;
}

inline
Path operator ""_path (const char* str, size_t size) {
    return Path{StringView{str, size}};
}


//////////////////////////////////////////////////////////////////////////////
/// @brief The result of resolving a path against a source document.
/// A SCALAR result refers to a single node of the source, which may itself
/// be a list. A FLAT result is the concatenation of every value reached
/// after the path fanned out across one or more lists.
/// Results refer into the source document, which must outlive them.
//////////////////////////////////////////////////////////////////////////////
class Resolved
{
  public:
    enum Kind { SCALAR, FLAT };

    static Resolved scalar(const Value& value)                 { return Resolved{&value}; }
    static Resolved flat(std::vector<const Value*>&& values)   { return Resolved{std::forward<std::vector<const Value*>>(values)}; }

    Kind kind() const     { return m_kind; }
    bool is_flat() const  { return m_kind == FLAT; }

    const Value& value() const {
        if (m_kind != SCALAR) throw ReshapeException("resolved result is flat");
        return *m_scalar;
    }

    const std::vector<const Value*>& values() const {
        if (m_kind != FLAT) throw ReshapeException("resolved result is scalar");
        return m_flat;
    }

    /// True for a FLAT result, or a SCALAR result referring to a list.
    bool is_sequence() const { return m_kind == FLAT || m_scalar->is_type<List>(); }

    Value to_value() const {
        if (m_kind == SCALAR) return *m_scalar;
        List list;
        list.reserve(m_flat.size());
        for (auto p_value : m_flat)
            list.push_back(*p_value);
        return list;
    }

  private:
    Resolved(const Value* scalar) : m_kind{SCALAR}, m_scalar{scalar} {}
    Resolved(std::vector<const Value*>&& flat) : m_kind{FLAT}, m_flat{std::forward<std::vector<const Value*>>(flat)} {}

    Kind m_kind;
    const Value* m_scalar = nullptr;
    std::vector<const Value*> m_flat;
};


namespace impl {

inline
const Value& nil_value() {
    static const Value value;
    return value;
}

class Resolver
{
  public:
    Resolver(const Options& options, const Location& location, size_t base_depth = 0)
      : m_options{options}, m_location{location}, m_base_depth{base_depth} {}

    Resolved resolve(const Value& source, const Path& path) const;

  private:
    void collect(const Value& node, Path::ConstIterator it, Path::ConstIterator end,
                 std::vector<const Value*>& out, size_t depth) const;
    Resolved missing(const Value& node, const Path& path, const String& key) const;
    void check_depth(size_t depth) const;

    const Options& m_options;
    const Location& m_location;
    size_t m_base_depth;
};

inline
Resolved Resolver::resolve(const Value& source, const Path& path) const {
    const Value* p_node = &source;
    auto end = path.end();
    for (auto it = path.begin(); it != end; ++it) {
        switch (p_node->type()) {
            case Value::OMAP: {
                auto p_child = p_node->find(*it);
                if (p_child == nullptr) return missing(*p_node, path, *it);
                p_node = p_child;
                break;
            }
            case Value::LIST: {
                std::vector<const Value*> out;
                for (auto& item : p_node->as<List>())
                    collect(item, it, end, out, 1);
                return Resolved::flat(std::move(out));
            }
            default:
                return missing(*p_node, path, *it);
        }
    }
    return Resolved::scalar(*p_node);
}

inline
void Resolver::collect(const Value& node, Path::ConstIterator it, Path::ConstIterator end,
                       std::vector<const Value*>& out, size_t depth) const {
    check_depth(depth);

    if (it == end) {
        // a list reached at the end of a branch is concatenated with its siblings
        if (node.is_type<List>()) {
            for (auto& item : node.as<List>())
                out.push_back(&item);
        } else {
            out.push_back(&node);
        }
        return;
    }

    switch (node.type()) {
        case Value::OMAP: {
            auto p_child = node.find(*it);
            if (p_child != nullptr)
                collect(*p_child, it + 1, end, out, depth + 1);
            break;
        }
        case Value::LIST: {
            for (auto& item : node.as<List>())
                collect(item, it, end, out, depth + 1);
            break;
        }
        default:
            // absent inside a fan-out contributes nothing
            break;
    }
}

inline
Resolved Resolver::missing(const Value& node, const Path& path, const String& key) const {
    if (m_options.missing_field == MissingField::NIL) {
        RESHAPE_DEBUG("path {} has no field {}, emitting null", path.to_str(), key);
        return Resolved::scalar(nil_value());
    }

    if (node.is_map()) {
        throw PathError(m_location, fmt::format("couldn't find field {} of path {}", json_quote(key), path.to_str()));
    }
    throw PathError(m_location, fmt::format("couldn't find field {} of path {} in a value of type {}",
                                            json_quote(key), path.to_str(), node.type_name()));
}

inline
void Resolver::check_depth(size_t depth) const {
    if (m_base_depth + depth > m_options.max_depth)
        throw DepthExceeded(m_location, m_options.max_depth);
}

} // namespace impl


/// Resolve a path against a source document.
/// @throw PathError if the path names an absent key outside any fan-out, and
///        the Options do not request null for missing fields.
inline
Resolved resolve(const Value& source, const Path& path, const Options& options = {}) {
    Location location;
    return impl::Resolver{options, location}.resolve(source, path);
}

} // namespace reshape
