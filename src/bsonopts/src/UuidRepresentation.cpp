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

#include <bsonopts/UuidRepresentation.hpp>

#include <algorithm>
#include <sstream>

#include <boost/log/trivial.hpp>
#include <boost/throw_exception.hpp>

#include <bsonopts/InvalidConfigurationException.hpp>

namespace bsonopts {

namespace {

struct NamedRepresentation {
    UuidRepresentation rep;
    std::string_view name;
};

constexpr std::array<NamedRepresentation, 4> kNames{{
    {UuidRepresentation::kStandard, "standard"},
    {UuidRepresentation::kPythonLegacy, "pythonLegacy"},
    {UuidRepresentation::kJavaLegacy, "javaLegacy"},
    {UuidRepresentation::kCSharpLegacy, "csharpLegacy"},
}};

}  // namespace

bool isValidUuidRepresentation(int64_t value) {
    return std::any_of(
        kAllUuidRepresentations.begin(), kAllUuidRepresentations.end(), [&](auto rep) {
            return static_cast<int64_t>(rep) == value;
        });
}

std::string toString(UuidRepresentation rep) {
    for (auto&& named : kNames) {
        if (named.rep == rep) {
            return std::string{named.name};
        }
    }
    std::ostringstream out;
    out << "unknown(" << static_cast<int64_t>(rep) << ")";
    return out.str();
}

std::optional<UuidRepresentation> uuidRepresentationFromName(std::string_view name) {
    for (auto&& named : kNames) {
        if (named.name == name) {
            return named.rep;
        }
    }
    return std::nullopt;
}

bsoncxx::binary_sub_type binarySubType(UuidRepresentation rep) {
    switch (rep) {
        case UuidRepresentation::kStandard:
            return bsoncxx::binary_sub_type::k_uuid;
        case UuidRepresentation::kPythonLegacy:
        case UuidRepresentation::kJavaLegacy:
        case UuidRepresentation::kCSharpLegacy:
            return bsoncxx::binary_sub_type::k_uuid_deprecated;
    }
    std::stringstream msg;
    msg << "No binary subtype for uuid_representation " << static_cast<int64_t>(rep);
    BOOST_LOG_TRIVIAL(warning) << msg.str();
    BOOST_THROW_EXCEPTION(InvalidValueException(msg.str()));
}

std::ostream& operator<<(std::ostream& out, UuidRepresentation rep) {
    return out << toString(rep);
}

}  // namespace bsonopts
