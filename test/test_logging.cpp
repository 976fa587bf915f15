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
#include <gtest/gtest.h>

#include "fixtures.h"

#include <sstream>

using namespace reshape;
using reshape::test::order_source;

namespace {

struct CaptureLog
{
    CaptureLog(log::Level level) : m_prev_buf{std::clog.rdbuf(m_stream.rdbuf())}, m_prev_level{log::level} {
        log::set_level(level);
    }

    ~CaptureLog() {
        std::clog.rdbuf(m_prev_buf);
        log::level = m_prev_level;
    }

    std::string str() const { return m_stream.str(); }

    std::stringstream m_stream;
    std::streambuf* m_prev_buf;
    int m_prev_level;
};

} // namespace

TEST(Logging, DefaultLevel) {
    EXPECT_TRUE(log::enabled(log::WARNING));
    EXPECT_FALSE(log::enabled(log::DEBUG));
}

TEST(Logging, QuietByDefault) {
    CaptureLog capture{log::WARNING};
    transform(order_source(), R"({"[order]": {"...id": "/ids"}})"_json);
    EXPECT_EQ(capture.str(), "");
}

TEST(Logging, DebugTracesResolution) {
    CaptureLog capture{log::DEBUG};
    transform(order_source(), R"({"[order]": {"...id": "/ids"}})"_json);
    auto text = capture.str();
    EXPECT_NE(text.find("[DEBUG]"), std::string::npos);
    EXPECT_NE(text.find("scalar resolved /ids at /[order]/...id"), std::string::npos);
    EXPECT_NE(text.find("array conversion /[order] with 1 spread fields of length 3"), std::string::npos);
}

TEST(Logging, DebugTracesNullSubstitution) {
    CaptureLog capture{log::DEBUG};
    Options options;
    options.missing_field = MissingField::NIL;
    transform(order_source(), R"({"name": "/user_name"})"_json, options);
    EXPECT_NE(capture.str().find("path /user_name has no field user_name, emitting null"), std::string::npos);
}
