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

#include <fmt/format.h>
#include <reshape/core/Value.h>
#include <reshape/core/Path.h>
#include <reshape/core/Error.h>

namespace fmt {

template <>
struct formatter<reshape::Value> : formatter<std::string> {
  auto format(const reshape::Value& value, format_context& ctx) const {
    return formatter<std::string>::format(value.to_json(), ctx);
  }
};

template <>
struct formatter<reshape::Path> : formatter<std::string> {
  auto format(const reshape::Path& path, format_context& ctx) const {
    return formatter<std::string>::format(path.to_str(), ctx);
  }
};

template <>
struct formatter<reshape::Location> : formatter<std::string> {
  auto format(const reshape::Location& location, format_context& ctx) const {
    return formatter<std::string>::format(location.to_str(), ctx);
  }
};

} // namespace fmt
