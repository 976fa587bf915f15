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

using namespace reshape;
using reshape::test::order_source;

TEST(ArrayConversion, SpreadSequence) {
    auto tmpl = R"({"[order]": {"...item_ids": "/ids", "account_id": "/retailer/id"}})"_json;
    auto result = transform(order_source(), tmpl);
    EXPECT_EQ(result, R"({"order": [
        {"item_ids": "34554543", "account_id": "12342"},
        {"item_ids": "7643534", "account_id": "12342"},
        {"item_ids": "512342", "account_id": "12342"}
    ]})"_json);
}

TEST(ArrayConversion, SpreadFlattenedPath) {
    auto tmpl = R"({"[items]": {"...quantity": "/order/shipments/items/quantity"}})"_json;
    auto result = transform(order_source(), tmpl);
    EXPECT_EQ(result, R"({"items": [{"quantity": 4}, {"quantity": 3}, {"quantity": 1}, {"quantity": 1}]})"_json);
}

TEST(ArrayConversion, SpreadObjects) {
    auto tmpl = R"({"[lines]": {"...item": "/order/shipments/items"}})"_json;
    auto result = transform(order_source(), tmpl);
    ASSERT_EQ(result.at("lines").size(), 4UL);
    EXPECT_EQ(result.at("lines").at(2), R"({"item": {"sku": "SKU-1453", "quantity": 1}})"_json);
}

TEST(ArrayConversion, DeepSpread) {
    auto tmpl = R"({"[order]": {"sub_order": {"...item_ids": "/ids"}, "account_id": "/retailer/id"}})"_json;
    auto result = transform(order_source(), tmpl);
    EXPECT_EQ(result, R"({"order": [
        {"sub_order": {"item_ids": "34554543"}, "account_id": "12342"},
        {"sub_order": {"item_ids": "7643534"}, "account_id": "12342"},
        {"sub_order": {"item_ids": "512342"}, "account_id": "12342"}
    ]})"_json);
}

TEST(ArrayConversion, SpreadInsideList) {
    auto tmpl = R"({"[rows]": {"cells": [{"...v": "/order/shipments/tracking_number"}, "'end'"]}})"_json;
    auto result = transform(order_source(), tmpl);
    EXPECT_EQ(result, R"({"rows": [
        {"cells": [{"v": "1234567"}, "end"]},
        {"cells": [{"v": "98776"}, "end"]}
    ]})"_json);
}

TEST(ArrayConversion, MultipleSpreadsOfEqualLength) {
    auto tmpl = R"({"[items]": {
        "...sku": "/order/shipments/items/sku",
        "...quantity": "/order/shipments/items/quantity",
        "retailer": "/retailer/id"
    }})"_json;

    auto result = transform(order_source(), tmpl);
    EXPECT_EQ(result, R"({"items": [
        {"sku": "SKU-123", "quantity": 4, "retailer": "12342"},
        {"sku": "SKU-343", "quantity": 3, "retailer": "12342"},
        {"sku": "SKU-1453", "quantity": 1, "retailer": "12342"},
        {"sku": "SKU-543", "quantity": 1, "retailer": "12342"}
    ]})"_json);
}

TEST(ArrayConversion, NestedConversion) {
    auto tmpl = R"({"[order]": {"sub_order": {
        "...item_ids": "/ids",
        "account_id": "/retailer/id",
        "[details]": {
            "...trackings": "/order/shipments/tracking_number",
            "quantity": "/order/shipments/items/quantity"
        }
    }}})"_json;

    auto details = R"([
        {"trackings": "1234567", "quantity": [4, 3, 1, 1]},
        {"trackings": "98776", "quantity": [4, 3, 1, 1]}
    ])"_json;

    auto result = transform(order_source(), tmpl);
    auto& order = result.at("order");
    ASSERT_EQ(order.size(), 3UL);
    for (size_t i = 0; i < 3; ++i) {
        auto& sub_order = order.at(i).at("sub_order");
        EXPECT_EQ(sub_order.keys(), (KeyList{"item_ids", "account_id", "details"}));
        EXPECT_EQ(sub_order.at("item_ids"), order_source().at("ids").at(i));
        EXPECT_EQ(sub_order.at("account_id"), "12342");
        EXPECT_EQ(sub_order.at("details"), details);
    }
}

TEST(ArrayConversion, NestedConversionIsSeparateScope) {
    // the inner spread has length 2, the outer length 3
    auto tmpl = R"({"[outer]": {
        "...id": "/ids",
        "[inner]": {"...tracking": "/order/shipments/tracking_number"}
    }})"_json;

    auto result = transform(order_source(), tmpl);
    ASSERT_EQ(result.at("outer").size(), 3UL);
    EXPECT_EQ(result.at("outer").at(1).at("inner"), R"([{"tracking": "1234567"}, {"tracking": "98776"}])"_json);
}

TEST(ArrayConversion, SpreadConversion) {
    auto tmpl = R"({"[order]": {
        "...[lines]": {"...sku": "/order/shipments/items/sku", "kind": "'item'"},
        "id": "/order_id"
    }})"_json;

    auto result = transform(order_source(), tmpl);
    EXPECT_EQ(result, R"({"order": [
        {"lines": {"sku": "SKU-123", "kind": "item"}, "id": "34554543"},
        {"lines": {"sku": "SKU-343", "kind": "item"}, "id": "34554543"},
        {"lines": {"sku": "SKU-1453", "kind": "item"}, "id": "34554543"},
        {"lines": {"sku": "SKU-543", "kind": "item"}, "id": "34554543"}
    ]})"_json);
}

TEST(ArrayConversion, SpreadListTemplate) {
    auto tmpl = R"({"[pairs]": {"...v": ["/order_id", "/user_id", "'x'"]}})"_json;
    auto result = transform(order_source(), tmpl);
    EXPECT_EQ(result, R"({"pairs": [{"v": "34554543"}, {"v": 2331212}, {"v": "x"}]})"_json);
}

TEST(ArrayConversion, SiblingConversions) {
    auto tmpl = R"({
        "[shipments]": {"...tracking": "/order/shipments/tracking_number"},
        "[ids]": {"...id": "/ids"}
    })"_json;

    auto result = transform(order_source(), tmpl);
    EXPECT_EQ(result.at("shipments").size(), 2UL);
    EXPECT_EQ(result.at("ids").size(), 3UL);
}

TEST(ArrayConversion, ZeroLength) {
    auto source = R"({"ids": [], "name": "x"})"_json;
    auto tmpl = R"({"[rows]": {"...id": "/ids", "name": "/name"}})"_json;
    EXPECT_EQ(transform(source, tmpl), R"({"rows": []})"_json);

    auto empty_fan_out = R"({"[rows]": {"...color": "/order/shipments/color"}})"_json;
    EXPECT_EQ(transform(order_source(), empty_fan_out), R"({"rows": []})"_json);
}

TEST(ArrayConversion, SpreadLengthMismatch) {
    auto tmpl = R"({"[order]": {
        "...trackings": "/order/shipments/tracking_number",
        "...quantity": "/order/shipments/items/quantity"
    }})"_json;

    try {
        transform(order_source(), tmpl);
        FAIL();
    } catch (const SpreadLengthMismatch& e) {
        EXPECT_EQ(e.code(), ErrorCode::SPREAD_LENGTH_MISMATCH);
        EXPECT_EQ(e.location(), "/[order]");
        EXPECT_EQ(e.reason(), "spread field /[order]/...trackings has length 2, but /[order]/...quantity has length 4");
    }
}

TEST(ArrayConversion, NoSpreadTarget) {
    auto tmpl = R"({"[order]": {"account_id": "/retailer/id"}})"_json;
    try {
        transform(order_source(), tmpl);
        FAIL();
    } catch (const NoSpreadTarget& e) {
        EXPECT_EQ(e.location(), "/[order]");
        EXPECT_EQ(e.reason(), "array conversion [order] is detected but no spread field was found");
    }
}

TEST(ArrayConversion, NestedSpreadDoesNotSatisfyOuter) {
    auto tmpl = R"({"[outer]": {"[inner]": {"...id": "/ids"}}})"_json;
    std::optional<Error> error;
    transform(order_source(), tmpl, error);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code, ErrorCode::NO_SPREAD_TARGET);
    EXPECT_EQ(error->location, "/[outer]");
}

TEST(ArrayConversion, SpreadScalar) {
    auto tmpl = R"({"[order]": {"...id": "/retailer/id"}})"_json;
    try {
        transform(order_source(), tmpl);
        FAIL();
    } catch (const SpreadTypeMismatch& e) {
        EXPECT_EQ(e.location(), "/[order]/...id");
        EXPECT_EQ(e.reason(), "spread field \"id\" resolved to string, expected a sequence");
    }
}

TEST(ArrayConversion, SpreadLiteral) {
    std::optional<Error> error;
    transform(order_source(), R"({"[order]": {"...id": "'a,b'"}})"_json, error);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code, ErrorCode::SPREAD_TYPE_MISMATCH);
}

TEST(ArrayConversion, SpreadObjectTemplate) {
    std::optional<Error> error;
    transform(order_source(), R"({"[order]": {"...detail": {"ids": "/ids"}}})"_json, error);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code, ErrorCode::SPREAD_TYPE_MISMATCH);
    EXPECT_EQ(error->message, "spread field \"detail\" has an object template, expected a sequence");
}

TEST(ArrayConversion, ConvertNonObject) {
    std::optional<Error> error;
    transform(order_source(), R"({"[order]": "/ids"})"_json, error);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code, ErrorCode::TEMPLATE_SYNTAX);
    EXPECT_EQ(error->location, "/[order]");
    EXPECT_EQ(error->message, "array conversion [order] requires an object, found string");
}

TEST(ArrayConversion, MissingFieldInsideCopy) {
    std::optional<Error> error;
    transform(order_source(), R"({"[order]": {"...id": "/ids", "po": {"number": "/po_number"}}})"_json, error);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code, ErrorCode::MISSING_FIELD);
    EXPECT_EQ(error->location, "/[order]/po/number");
}
