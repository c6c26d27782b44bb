// Copyright 2019-present MongoDB Inc.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <sstream>

#include <catch2/catch.hpp>

#include <bsonopts/InvalidConfigurationException.hpp>
#include <bsonopts/UuidRepresentation.hpp>

namespace bsonopts {
namespace {

TEST_CASE("UuidRepresentation membership") {
    for (auto rep : kAllUuidRepresentations) {
        REQUIRE(isValidUuidRepresentation(rep));
        REQUIRE(isValidUuidRepresentation(static_cast<int64_t>(rep)));
    }
    REQUIRE(isValidUuidRepresentation(int64_t{3}));
    REQUIRE(isValidUuidRepresentation(int64_t{6}));

    REQUIRE_FALSE(isValidUuidRepresentation(int64_t{0}));
    REQUIRE_FALSE(isValidUuidRepresentation(int64_t{2}));
    REQUIRE_FALSE(isValidUuidRepresentation(int64_t{7}));
    REQUIRE_FALSE(isValidUuidRepresentation(int64_t{-4}));
    REQUIRE_FALSE(isValidUuidRepresentation(static_cast<UuidRepresentation>(42)));

    REQUIRE(kDefaultUuidRepresentation == UuidRepresentation::kPythonLegacy);
}

TEST_CASE("UuidRepresentation names") {
    REQUIRE(toString(UuidRepresentation::kStandard) == "standard");
    REQUIRE(toString(UuidRepresentation::kPythonLegacy) == "pythonLegacy");
    REQUIRE(toString(UuidRepresentation::kJavaLegacy) == "javaLegacy");
    REQUIRE(toString(UuidRepresentation::kCSharpLegacy) == "csharpLegacy");
    REQUIRE(toString(static_cast<UuidRepresentation>(42)) == "unknown(42)");

    for (auto rep : kAllUuidRepresentations) {
        REQUIRE(uuidRepresentationFromName(toString(rep)) == rep);
    }
    REQUIRE_FALSE(uuidRepresentationFromName("Standard"));
    REQUIRE_FALSE(uuidRepresentationFromName("unknown(42)"));
    REQUIRE_FALSE(uuidRepresentationFromName(""));

    std::ostringstream out;
    out << UuidRepresentation::kJavaLegacy;
    REQUIRE(out.str() == "javaLegacy");
}

TEST_CASE("UuidRepresentation binary subtypes") {
    REQUIRE(binarySubType(UuidRepresentation::kStandard) == bsoncxx::binary_sub_type::k_uuid);
    REQUIRE(binarySubType(UuidRepresentation::kPythonLegacy) ==
            bsoncxx::binary_sub_type::k_uuid_deprecated);
    REQUIRE(binarySubType(UuidRepresentation::kJavaLegacy) ==
            bsoncxx::binary_sub_type::k_uuid_deprecated);
    REQUIRE(binarySubType(UuidRepresentation::kCSharpLegacy) ==
            bsoncxx::binary_sub_type::k_uuid_deprecated);

    REQUIRE_THROWS_AS(binarySubType(static_cast<UuidRepresentation>(42)), InvalidValueException);
}

}  // namespace
}  // namespace bsonopts
