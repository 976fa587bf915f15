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
#include <string_view>
#include <vector>
#include <tsl/ordered_map.h>
#include <iostream>
#include <sstream>
#include <cstdint>
#include <type_traits>

#include <reshape/support/types.h>
#include <reshape/support/string.h>
#include <reshape/support/exception.h>

namespace reshape {

struct KeyError : public ReshapeException
{
    KeyError(const StringView& key) : ReshapeException(fmt_message(key)) {}

  private:
    static std::string fmt_message(const StringView& key) {
        std::stringstream ss;
        ss << "key not found: " << json_quote(key);
        return ss.str();
    }
};

struct IndexError : public ReshapeException
{
    IndexError(size_t index, size_t size)
      : ReshapeException(std::string("index ") + int_to_str((UInt)index) + " out of range for size " + int_to_str((UInt)size)) {}
};

class Value;

using List = std::vector<Value>;
using OrderedMap = tsl::ordered_map<String, Value>;
using KeyList = std::vector<String>;

template <typename T>
concept is_repr_byvalue = std::is_same<T, bool>::value || std::is_same<T, Int>::value ||
                          std::is_same<T, UInt>::value || std::is_same<T, Float>::value;

template <typename T>
concept is_repr_owned = std::is_same<T, String>::value || std::is_same<T, List>::value ||
                        std::is_same<T, OrderedMap>::value;


//////////////////////////////////////////////////////////////////////////////
/// @brief Generic document tree value.
/// A closed tagged union used uniformly for source documents, templates and
/// transformation results. Containers and strings are owned; copying a Value
/// copies the whole subtree.
//////////////////////////////////////////////////////////////////////////////
class Value
{
  public:
    enum ReprIX {
        NIL,     // json null
        BOOL,
        INT,
        UINT,
        FLOAT,
        STR,
        LIST,
        OMAP,    // ordered map
    };

  private:
    union Repr {
        Repr()               : z{nullptr} {}
        Repr(bool v)         : b{v} {}
        Repr(Int v)          : i{v} {}
        Repr(UInt v)         : u{v} {}
        Repr(Float v)        : f{v} {}
        Repr(String* p)      : ps{p} {}
        Repr(List* p)        : pl{p} {}
        Repr(OrderedMap* p)  : pm{p} {}

        void*       z;
        bool        b;
        Int         i;
        UInt        u;
        Float       f;
        String*     ps;
        List*       pl;
        OrderedMap* pm;
    };

    template <typename T>
    static constexpr ReprIX repr_ix_of() {
        if constexpr (std::is_same<T, bool>::value)            return BOOL;
        else if constexpr (std::is_same<T, Int>::value)        return INT;
        else if constexpr (std::is_same<T, UInt>::value)       return UINT;
        else if constexpr (std::is_same<T, Float>::value)      return FLOAT;
        else if constexpr (std::is_same<T, String>::value)     return STR;
        else if constexpr (std::is_same<T, List>::value)       return LIST;
        else                                                   return OMAP;
    }

  public:
    static std::string_view type_name(uint8_t repr_ix) {
        switch (repr_ix) {
            case NIL:   return "nil";
            case BOOL:  return "bool";
            case INT:   return "int";
            case UINT:  return "uint";
            case FLOAT: return "double";
            case STR:   return "string";
            case LIST:  return "list";
            case OMAP:  return "ordered-map";
            default:    return "<undefined>";
        }
    }

  public:
    Value()                           : m_repr{}, m_repr_ix{NIL} {}
    Value(nil_t)                      : m_repr{}, m_repr_ix{NIL} {}
    Value(const String& str)          : m_repr{new String{str}}, m_repr_ix{STR} {}
    Value(String&& str)               : m_repr{new String{std::forward<String>(str)}}, m_repr_ix{STR} {}
    Value(const StringView& sv)       : m_repr{new String{sv.data(), sv.size()}}, m_repr_ix{STR} {}
    Value(const char* v)              : m_repr{new String{v}}, m_repr_ix{STR} { RESHAPE_ASSERT(v != nullptr); }
    Value(bool v)                     : m_repr{v}, m_repr_ix{BOOL} {}
    Value(is_like_Float auto v)       : m_repr{(Float)v}, m_repr_ix{FLOAT} {}
    Value(is_like_Int auto v)         : m_repr{(Int)v}, m_repr_ix{INT} {}
    Value(is_like_UInt auto v)        : m_repr{(UInt)v}, m_repr_ix{UINT} {}

    Value(const List& list)           : m_repr{new List(list)}, m_repr_ix{LIST} {}
    Value(List&& list)                : m_repr{new List(std::forward<List>(list))}, m_repr_ix{LIST} {}
    Value(const OrderedMap& map)      : m_repr{new OrderedMap(map)}, m_repr_ix{OMAP} {}
    Value(OrderedMap&& map)           : m_repr{new OrderedMap(std::forward<OrderedMap>(map))}, m_repr_ix{OMAP} {}

    Value(ReprIX type);

    Value(const Value& other);
    Value(Value&& other) noexcept;

    ~Value() { release(); }

    Value& operator = (const Value& other);
    Value& operator = (Value&& other) noexcept;

    ReprIX type() const { return (ReprIX)m_repr_ix; }
    std::string_view type_name() const { return type_name(m_repr_ix); }

    template <typename T>
    bool is_type() const { return m_repr_ix == repr_ix_of<T>(); }

    bool is_num() const       { return m_repr_ix == INT || m_repr_ix == UINT || m_repr_ix == FLOAT; }
    bool is_map() const       { return m_repr_ix == OMAP; }
    bool is_container() const { return m_repr_ix == LIST || m_repr_ix == OMAP; }

    template <typename T>
    T as() const requires is_repr_byvalue<T> {
        if (m_repr_ix != repr_ix_of<T>()) throw wrong_type(m_repr_ix, repr_ix_of<T>());
        if constexpr (std::is_same<T, bool>::value)       return m_repr.b;
        else if constexpr (std::is_same<T, Int>::value)   return m_repr.i;
        else if constexpr (std::is_same<T, UInt>::value)  return m_repr.u;
        else                                              return m_repr.f;
    }

    template <typename T>
    const T& as() const requires is_repr_owned<T> {
        return const_cast<Value*>(this)->as<T>();
    }

    template <typename T>
    T& as() requires is_repr_owned<T> {
        if (m_repr_ix != repr_ix_of<T>()) throw wrong_type(m_repr_ix, repr_ix_of<T>());
        if constexpr (std::is_same<T, String>::value)     return *m_repr.ps;
        else if constexpr (std::is_same<T, List>::value)  return *m_repr.pl;
        else                                              return *m_repr.pm;
    }

    size_t size() const;
    KeyList keys() const;

    const Value* find(const StringView& key) const;
    const Value& at(const StringView& key) const;
    const Value& at(size_t index) const;

    Value& set(const StringView& key, const Value& value);
    Value& set(const StringView& key, Value&& value);
    Value& push_back(const Value& value);
    Value& push_back(Value&& value);

    String to_str() const;
    String to_json() const;
    String to_json(int indent) const;
    void to_json(std::ostream&, int indent = 0) const;

    bool operator == (const Value&) const;
    bool operator == (nil_t) const { return m_repr_ix == NIL; }

    static WrongType wrong_type(uint8_t actual)                   { return type_name(actual); };
    static WrongType wrong_type(uint8_t actual, uint8_t expected) { return {type_name(actual), type_name(expected)}; };

  private:
    void release();
    void copy_from(const Value& other);
    void to_json(std::ostream&, int indent, int level) const;

  private:
    Repr m_repr;
    uint8_t m_repr_ix;
};


inline
std::ostream& operator<< (std::ostream& ostream, const Value& value) {
    value.to_json(ostream);
    return ostream;
}

inline
Value::Value(ReprIX type) : m_repr_ix{(uint8_t)type} {
    switch (type) {
        case NIL:   m_repr.z = nullptr; break;
        case BOOL:  m_repr.b = false; break;
        case INT:   m_repr.i = 0; break;
        case UINT:  m_repr.u = 0; break;
        case FLOAT: m_repr.f = 0.0; break;
        case STR:   m_repr.ps = new String{}; break;
        case LIST:  m_repr.pl = new List{}; break;
        case OMAP:  m_repr.pm = new OrderedMap{}; break;
        default:    throw wrong_type(type);
    }
}

inline
Value::Value(const Value& other) : m_repr{}, m_repr_ix{NIL} {
    copy_from(other);
}

inline
Value::Value(Value&& other) noexcept : m_repr{other.m_repr}, m_repr_ix{other.m_repr_ix} {
    other.m_repr.z = nullptr;
    other.m_repr_ix = NIL;
}

inline
Value& Value::operator = (const Value& other) {
    if (this == &other) return *this;
    // other may be a descendant of this
    Value tmp{other};
    return operator = (std::move(tmp));
}

inline
Value& Value::operator = (Value&& other) noexcept {
    if (this == &other) return *this;
    release();
    m_repr = other.m_repr;
    m_repr_ix = other.m_repr_ix;
    other.m_repr.z = nullptr;
    other.m_repr_ix = NIL;
    return *this;
}

inline
void Value::release() {
    switch (m_repr_ix) {
        case STR:   delete m_repr.ps; break;
        case LIST:  delete m_repr.pl; break;
        case OMAP:  delete m_repr.pm; break;
        default:    break;
    }
    m_repr.z = nullptr;
    m_repr_ix = NIL;
}

inline
void Value::copy_from(const Value& other) {
    switch (other.m_repr_ix) {
        case NIL:   m_repr.z = nullptr; break;
        case BOOL:  m_repr.b = other.m_repr.b; break;
        case INT:   m_repr.i = other.m_repr.i; break;
        case UINT:  m_repr.u = other.m_repr.u; break;
        case FLOAT: m_repr.f = other.m_repr.f; break;
        case STR:   m_repr.ps = new String{*other.m_repr.ps}; break;
        case LIST:  m_repr.pl = new List(*other.m_repr.pl); break;
        case OMAP:  m_repr.pm = new OrderedMap(*other.m_repr.pm); break;
        default:    throw wrong_type(other.m_repr_ix);
    }
    m_repr_ix = other.m_repr_ix;
}

inline
size_t Value::size() const {
    switch (m_repr_ix) {
        case STR:   return m_repr.ps->size();
        case LIST:  return m_repr.pl->size();
        case OMAP:  return m_repr.pm->size();
        default:    throw wrong_type(m_repr_ix);
    }
}

inline
KeyList Value::keys() const {
    KeyList keys;
    for (const auto& item : as<OrderedMap>())
        keys.push_back(item.first);
    return keys;
}

inline
const Value* Value::find(const StringView& key) const {
    if (m_repr_ix != OMAP) throw wrong_type(m_repr_ix, OMAP);
    auto it = m_repr.pm->find(String{key});
    return (it == m_repr.pm->end())? nullptr: &(it->second);
}

inline
const Value& Value::at(const StringView& key) const {
    auto p_value = find(key);
    if (p_value == nullptr) throw KeyError(key);
    return *p_value;
}

inline
const Value& Value::at(size_t index) const {
    auto& list = as<List>();
    if (index >= list.size()) throw IndexError(index, list.size());
    return list[index];
}

inline
Value& Value::set(const StringView& key, const Value& value) {
    return set(key, Value{value});
}

inline
Value& Value::set(const StringView& key, Value&& value) {
    auto& map = as<OrderedMap>();
    auto [it, inserted] = map.insert_or_assign(String{key}, std::forward<Value>(value));
    return it.value();
}

inline
Value& Value::push_back(const Value& value) {
    return push_back(Value{value});
}

inline
Value& Value::push_back(Value&& value) {
    auto& list = as<List>();
    list.push_back(std::forward<Value>(value));
    return list.back();
}

inline
String Value::to_str() const {
    switch (m_repr_ix) {
        case NIL:   return "nil";
        case BOOL:  return m_repr.b? "true": "false";
        case INT:   return int_to_str(m_repr.i);
        case UINT:  return int_to_str(m_repr.u);
        case FLOAT: return float_to_str(m_repr.f);
        case STR:   return *m_repr.ps;
        case LIST:  [[fallthrough]];
        case OMAP:  return to_json();
        default:    throw wrong_type(m_repr_ix);
    }
}

inline
String Value::to_json() const {
    StringStream ss;
    to_json(ss, 0, 0);
    return ss.str();
}

inline
String Value::to_json(int indent) const {
    StringStream ss;
    to_json(ss, indent, 0);
    return ss.str();
}

inline
void Value::to_json(std::ostream& os, int indent) const {
    to_json(os, indent, 0);
}

inline
void Value::to_json(std::ostream& os, int indent, int level) const {
    auto newline = [&os, indent] (int level) {
        if (indent > 0) {
            os << '\n';
            for (int i = 0; i < indent * level; ++i) os << ' ';
        }
    };

    switch (m_repr_ix) {
        case NIL:   os << "null"; break;
        case BOOL:  os << (m_repr.b? "true": "false"); break;
        case INT:   os << int_to_str(m_repr.i); break;
        case UINT:  os << int_to_str(m_repr.u); break;
        case FLOAT: os << float_to_str(m_repr.f); break;
        case STR:   json_quote(os, *m_repr.ps); break;
        case LIST: {
            auto& list = *m_repr.pl;
            os << '[';
            bool first = true;
            for (auto& item : list) {
                if (!first) os << ((indent > 0)? ",": ", ");
                first = false;
                newline(level + 1);
                item.to_json(os, indent, level + 1);
            }
            if (!list.empty()) newline(level);
            os << ']';
            break;
        }
        case OMAP: {
            auto& map = *m_repr.pm;
            os << '{';
            bool first = true;
            for (auto& item : map) {
                if (!first) os << ((indent > 0)? ",": ", ");
                first = false;
                newline(level + 1);
                json_quote(os, item.first);
                os << ": ";
                item.second.to_json(os, indent, level + 1);
            }
            if (!map.empty()) newline(level);
            os << '}';
            break;
        }
        default: throw wrong_type(m_repr_ix);
    }
}

inline
bool Value::operator == (const Value& obj) const {
    if (this == &obj) return true;

    switch (m_repr_ix) {
        case NIL: return obj.m_repr_ix == NIL;
        case BOOL: return obj.m_repr_ix == BOOL && m_repr.b == obj.m_repr.b;
        case INT: {
            switch (obj.m_repr_ix)
            {
                case INT:   return m_repr.i == obj.m_repr.i;
                case UINT:  return obj.m_repr.u <= (UInt)INT64_MAX && (Int)obj.m_repr.u == m_repr.i;
                case FLOAT: return m_repr.i == obj.m_repr.f;
                default:    return false;
            }
        }
        case UINT: {
            switch (obj.m_repr_ix)
            {
                case INT:   return m_repr.u <= (UInt)INT64_MAX && (Int)m_repr.u == obj.m_repr.i;
                case UINT:  return m_repr.u == obj.m_repr.u;
                case FLOAT: return m_repr.u == obj.m_repr.f;
                default:    return false;
            }
        }
        case FLOAT: {
            switch (obj.m_repr_ix)
            {
                case INT:   return m_repr.f == obj.m_repr.i;
                case UINT:  return m_repr.f == obj.m_repr.u;
                case FLOAT: return m_repr.f == obj.m_repr.f;
                default:    return false;
            }
        }
        case STR: {
            if (obj.m_repr_ix == STR) return *m_repr.ps == *obj.m_repr.ps;
            return false;
        }
        case LIST: {
            if (obj.m_repr_ix != LIST) return false;
            return *m_repr.pl == *obj.m_repr.pl;
        }
        case OMAP: {
            if (obj.m_repr_ix != OMAP) return false;
            auto& lhs = *m_repr.pm;
            auto& rhs = *obj.m_repr.pm;
            if (lhs.size() != rhs.size()) return false;
            auto r_it = rhs.begin();
            for (auto l_it = lhs.begin(); l_it != lhs.end(); ++l_it, ++r_it) {
                if (l_it->first != r_it->first || !(l_it->second == r_it->second))
                    return false;
            }
            return true;
        }
        default: throw wrong_type(m_repr_ix);
    }
}

} // namespace reshape
