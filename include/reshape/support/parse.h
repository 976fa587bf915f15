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

#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>

#include <reshape/support/exception.h>

namespace reshape::parse {

/// Buffered character cursor over a std::istream.
/// peek() returns '\0' once the stream is exhausted.
template <typename StreamType>
class StreamAdapter
{
  public:
    StreamAdapter(StreamType& stream) : m_stream{stream} { fill(); }

    char peek() const { return done()? '\0': m_buf[m_buf_pos]; }

    void next() {
        if (done()) return;
        if (++m_buf_pos >= m_buf_size)
            fill();
    }

    size_t consumed() const { return m_pos + m_buf_pos; }
    bool done() const { return m_buf_pos >= m_buf_size; }
    bool error() const { return m_stream.bad(); }

  private:
    void fill() {
        m_pos += m_buf_size;
        m_buf_pos = 0;
        m_buf_size = 0;
        if (!m_stream.good()) return;
        m_stream.read(m_buf.data(), m_buf.size());
        m_buf_size = m_stream.gcount();
    }

  private:
    StreamType& m_stream;
    size_t m_pos = 0;
    std::array<char, 4096> m_buf;
    size_t m_buf_pos = 0;
    size_t m_buf_size = 0;
};


template <typename StringType>
class StringStreamAdapter
{
  public:
    StringStreamAdapter(const StringType& str) : m_str{str} {}

    char peek() const { return done()? '\0': m_str[m_pos]; }
    void next() { if (!done()) ++m_pos; }
    size_t consumed() const { return m_pos; }
    bool done() const { return m_pos == m_str.size(); }
    bool error() const { return false; }

  private:
    StringType m_str;
    size_t m_pos = 0;
};


constexpr int syntax_context = 72;

struct SyntaxError : public ReshapeException
{
    static std::string make_message(const std::string_view& text, std::ptrdiff_t offset, const std::string& message) {
        std::ptrdiff_t ctx_end = std::min(offset + syntax_context, (std::ptrdiff_t)text.size());
        std::ptrdiff_t ctx_begin = std::max(ctx_end - syntax_context, (std::ptrdiff_t)0);
        std::stringstream ss;
        ss << message << " at offset " << offset << std::endl;
        auto it = text.cbegin();
        auto end = it + ctx_end;
        it += ctx_begin;
        for (; it != end; ++it) ss << ((*it == '\n')? ' ': *it);
        ss << std::endl;
        ss << std::setfill('-') << std::setw(offset - ctx_begin + 1) << '^';
        return ss.str();
    }

    SyntaxError(const std::string_view& text, std::ptrdiff_t offset, const std::string& message)
      : ReshapeException(make_message(text, offset, message)), offset{offset} {}

    std::ptrdiff_t offset;
};

} // namespace reshape::parse
