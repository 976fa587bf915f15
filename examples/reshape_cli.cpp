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
#include <reshape/core.h>
#include <reshape/fmt_support.h>

#include <cpptrace/cpptrace.hpp>
#include <fmt/format.h>
#include <cstring>
#include <iostream>
#include <optional>

using namespace reshape;

static void usage() {
    std::cerr << "usage: reshape_cli <source.json> <template.json> [--each] [--null-missing]"
                 " [--max-depth N] [--indent N] [--verbose]" << std::endl;
}

int main(int argc, char** argv) {
    cpptrace::register_terminate_handler();

    std::vector<const char*> files;
    Options options;
    bool each = false;
    UInt indent = 2;

    for (int i = 1; i < argc; ++i) {
        StringView arg{argv[i]};
        if (arg == "--each") {
            each = true;
        } else if (arg == "--null-missing") {
            options.missing_field = MissingField::NIL;
        } else if (arg == "--verbose") {
            log::set_level(log::DEBUG);
        } else if (arg == "--max-depth" || arg == "--indent") {
            UInt value;
            if (i + 1 >= argc || !str_to_uint(argv[i + 1], value)) {
                usage();
                return 2;
            }
            if (arg == "--indent") indent = value; else options.max_depth = value;
            ++i;
        } else if (arg.starts_with("--")) {
            usage();
            return 2;
        } else {
            files.push_back(argv[i]);
        }
    }

    if (files.size() != 2) {
        usage();
        return 2;
    }

    std::string error;
    Value source = json::parse_file(files[0], error);
    if (!error.empty()) {
        RESHAPE_ERROR(error);
        return 1;
    }

    Value tmpl = json::parse_file(files[1], error);
    if (!error.empty()) {
        RESHAPE_ERROR(error);
        return 1;
    }

    std::optional<Error> transform_error;
    Value result = each? transform_each(source, tmpl, transform_error, options)
                       : transform(source, tmpl, transform_error, options);
    if (transform_error) {
        RESHAPE_ERROR(transform_error->to_str());
        return 1;
    }

    std::cout << result.to_json((int)indent) << std::endl;
    RESHAPE_DEBUG("wrote {}", each? "document list": "document");
    return 0;
}
