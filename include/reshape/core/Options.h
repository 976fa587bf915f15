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

#include <cstddef>

namespace reshape {

/// Behavior when a path names an absent key outside a flattening fan-out.
enum class MissingField
{
    ERROR,  // raise PathError
    NIL,    // emit null
};

struct Options
{
    /// Limit on template nesting plus source sequence nesting visited during resolution.
    size_t max_depth = 256;
    MissingField missing_field = MissingField::ERROR;
};

} // namespace reshape
