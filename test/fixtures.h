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

#include <reshape/core.h>

namespace reshape::test {

/// Source document shared by the transformation tests.
inline
const Value& order_source() {
    static const Value source = R"({
        "retailer": {"id": "12342"},
        "order": {
            "po_number": "573832",
            "shipments": [
                {
                    "tracking_number": "1234567",
                    "items": [
                        {"sku": "SKU-123", "quantity": 4},
                        {"sku": "SKU-343", "quantity": 3}
                    ]
                },
                {
                    "tracking_number": "98776",
                    "items": [
                        {"sku": "SKU-1453", "quantity": 1},
                        {"sku": "SKU-543", "quantity": 1}
                    ]
                }
            ]
        },
        "user_id": 2331212,
        "order_id": "34554543",
        "product": {
            "id": "654654",
            "length": 50,
            "alternative_size": 33,
            "details": {"name": "Red Shoes", "manufacture": "company"}
        },
        "ids": ["34554543", "7643534", "512342"]
    })"_json;
    return source;
}

} // namespace reshape::test
