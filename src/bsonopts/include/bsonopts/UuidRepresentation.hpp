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

#ifndef HEADER_4DCB6970_D558_469C_8CC5_2D30F1D10DF7_INCLUDED
#define HEADER_4DCB6970_D558_469C_8CC5_2D30F1D10DF7_INCLUDED

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <bsoncxx/types.hpp>

namespace bsonopts {

/**
 * How UUID values are laid out when encoded to (or decoded from) BSON binary.
 *
 * The numeric values match the constants used across the MongoDB drivers so they
 * can be round-tripped through integer-typed options.
 */
enum class UuidRepresentation : int32_t {
    kPythonLegacy = 3,
    kStandard = 4,
    kJavaLegacy = 5,
    kCSharpLegacy = 6,
};

constexpr std::array<UuidRepresentation, 4> kAllUuidRepresentations{
    UuidRepresentation::kStandard,
    UuidRepresentation::kPythonLegacy,
    UuidRepresentation::kJavaLegacy,
    UuidRepresentation::kCSharpLegacy,
};

constexpr UuidRepresentation kDefaultUuidRepresentation = UuidRepresentation::kPythonLegacy;

/**
 * @return whether `value` is the numeric value of one of `kAllUuidRepresentations`.
 */
bool isValidUuidRepresentation(int64_t value);

inline bool isValidUuidRepresentation(UuidRepresentation rep) {
    return isValidUuidRepresentation(static_cast<int64_t>(rep));
}

/**
 * Canonical names: "standard", "pythonLegacy", "javaLegacy", "csharpLegacy".
 * Values outside the enumeration are rendered as "unknown(<n>)".
 */
std::string toString(UuidRepresentation rep);

std::optional<UuidRepresentation> uuidRepresentationFromName(std::string_view name);

/**
 * The BSON binary subtype a UUID is tagged with under `rep`.
 * Only `kStandard` uses subtype 4; the legacy layouts all use subtype 3.
 *
 * @throws InvalidValueException if `rep` is not a member of the enumeration.
 */
bsoncxx::binary_sub_type binarySubType(UuidRepresentation rep);

std::ostream& operator<<(std::ostream& out, UuidRepresentation rep);

}  // namespace bsonopts

#endif  // HEADER_4DCB6970_D558_469C_8CC5_2D30F1D10DF7_INCLUDED
