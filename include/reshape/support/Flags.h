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

#include <cstdint>

namespace reshape {

template <typename T>
struct Flags
{
    constexpr Flags() : m_value{0} {}
    constexpr Flags(T value) : m_value{value} {}

    bool operator == (const Flags& flags) const { return m_value == flags.m_value; }

    Flags<T>& operator |= (Flags flags) { m_value |= flags.m_value; return *this; }
    Flags<T>& operator &= (Flags flags) { m_value &= flags.m_value; return *this; }
    Flags<T>& operator ^= (Flags flags) { m_value ^= flags.m_value; return *this; }

    bool operator ! () const { return m_value == 0; }
    Flags<T> operator ~ () const { return (T)~m_value; }

    bool has(Flags flags) const { return (m_value & flags.m_value) == flags.m_value; }

    T value() const { return m_value; }
    explicit operator bool () const { return m_value != 0; }

  protected:
    T m_value;

  template <typename V> friend constexpr Flags<V> operator | (Flags<V>, Flags<V>);
  template <typename V> friend constexpr Flags<V> operator & (Flags<V>, Flags<V>);
  template <typename V> friend constexpr Flags<V> operator ^ (Flags<V>, Flags<V>);
};

template <typename T>
constexpr Flags<T> operator | (Flags<T> l, Flags<T> r) { return (T)(l.m_value | r.m_value); }

template <typename T>
constexpr Flags<T> operator & (Flags<T> l, Flags<T> r) { return (T)(l.m_value & r.m_value); }

template <typename T>
constexpr Flags<T> operator ^ (Flags<T> l, Flags<T> r) { return (T)(l.m_value ^ r.m_value); }

} // namespace reshape

#define RESHAPE_FLAG8 constexpr static ::reshape::Flags<uint8_t>
