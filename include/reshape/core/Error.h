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

#include <reshape/support/types.h>
#include <reshape/support/string.h>
#include <reshape/support/exception.h>

#include <fmt/format.h>
#include <string>
#include <vector>

namespace reshape {

enum class ErrorCode
{
    MISSING_FIELD,
    SPREAD_TYPE_MISMATCH,
    SPREAD_LENGTH_MISMATCH,
    NO_SPREAD_TARGET,
    TEMPLATE_SYNTAX,
    DEPTH_EXCEEDED,
};

inline
std::string_view error_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::MISSING_FIELD:          return "MissingField";
        case ErrorCode::SPREAD_TYPE_MISMATCH:   return "SpreadTypeMismatch";
        case ErrorCode::SPREAD_LENGTH_MISMATCH: return "SpreadLengthMismatch";
        case ErrorCode::NO_SPREAD_TARGET:       return "NoSpreadTarget";
        case ErrorCode::TEMPLATE_SYNTAX:        return "TemplateSyntaxError";
        case ErrorCode::DEPTH_EXCEEDED:         return "DepthExceeded";
        default:                                return "<undefined>";
    }
}

//////////////////////////////////////////////////////////////////////////////
/// @brief Position of the template node being rendered.
/// Steps are raw template keys (decorations included) or list indices. The
/// string form is only built when an error is reported, e.g.
/// `/[order]/sub_order/...item_ids`.
//////////////////////////////////////////////////////////////////////////////
class Location
{
  public:
    void push(const StringView& key) { m_steps.emplace_back(key); }
    void push(size_t index)          { m_steps.emplace_back(int_to_str((UInt)index)); }
    void pop()                       { m_steps.pop_back(); }

    size_t depth() const { return m_steps.size(); }

    String to_str() const {
        if (m_steps.size() == 0) return "/";
        String str;
        for (auto& step : m_steps) {
            str.push_back('/');
            str.append(step);
        }
        return str;
    }

  private:
    std::vector<String> m_steps;
};

/// Pushes a step for the lifetime of the guard.
class LocationStep
{
  public:
    template <typename Step>
    LocationStep(Location& location, Step&& step) : m_location{location} { m_location.push(std::forward<Step>(step)); }
    ~LocationStep() { m_location.pop(); }

    LocationStep(const LocationStep&) = delete;
    auto operator = (const LocationStep&) = delete;

  private:
    Location& m_location;
};


class TransformError : public ReshapeException
{
  public:
    TransformError(ErrorCode code, const Location& location, const std::string& message)
      : ReshapeException(make_message(code, location.to_str(), message))
      , m_code{code}
      , m_location{location.to_str()}
      , m_reason{message} {}

    ErrorCode code() const           { return m_code; }
    const String& location() const   { return m_location; }
    const String& reason() const     { return m_reason; }

  private:
    static std::string make_message(ErrorCode code, const String& location, const std::string& message) {
        return fmt::format("{} at {}: {}", error_name(code), location, message);
    }

    ErrorCode m_code;
    String m_location;
    String m_reason;
};

/// A path segment names an absent key outside any flattening fan-out.
struct PathError : public TransformError
{
    PathError(const Location& location, const std::string& message)
      : TransformError(ErrorCode::MISSING_FIELD, location, message) {}
};

struct SpreadTypeMismatch : public TransformError
{
    SpreadTypeMismatch(const Location& location, const std::string& message)
      : TransformError(ErrorCode::SPREAD_TYPE_MISMATCH, location, message) {}
};

struct SpreadLengthMismatch : public TransformError
{
    SpreadLengthMismatch(const Location& location, const std::string& message)
      : TransformError(ErrorCode::SPREAD_LENGTH_MISMATCH, location, message) {}
};

struct NoSpreadTarget : public TransformError
{
    NoSpreadTarget(const Location& location, const std::string& message)
      : TransformError(ErrorCode::NO_SPREAD_TARGET, location, message) {}
};

struct TemplateSyntaxError : public TransformError
{
    TemplateSyntaxError(const Location& location, const std::string& message)
      : TransformError(ErrorCode::TEMPLATE_SYNTAX, location, message) {}
};

struct DepthExceeded : public TransformError
{
    DepthExceeded(const Location& location, size_t max_depth)
      : TransformError(ErrorCode::DEPTH_EXCEEDED, location, fmt::format("maximum depth {} exceeded", max_depth)) {}
};

/// Non-throwing error report, see transform(const Value&, const Value&, std::optional<Error>&, const Options&).
struct Error
{
    ErrorCode code;
    String location;
    String message;

    std::string to_str() const {
        return fmt::format("{} at {}: {}", error_name(code), location, message);
    }
};

} // namespace reshape
