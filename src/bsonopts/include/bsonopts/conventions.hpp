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

#ifndef HEADER_7185242B_1DD5_4E51_88F4_539C0F393A69_INCLUDED
#define HEADER_7185242B_1DD5_4E51_88F4_539C0F393A69_INCLUDED

#include <yaml-cpp/yaml.h>

#include <bsonopts/CodecOptions.hpp>
#include <bsonopts/DocumentClassRegistry.hpp>

namespace bsonopts {

/**
 * Translate a YAML map into an option bag for `parseCodecOptions()`.
 *
 * - `document_class` is looked up by name in `registry`.
 * - `tz_aware` becomes a bool only if the scalar is a plain (unquoted, untagged) YAML boolean.
 * - `uuidrepresentation` may be a plain integer or a canonical name such as `standard`.
 *
 * Values that don't convert are carried as strings so that `parseCodecOptions()`
 * reports them the same way it would for a hand-built bag.
 *
 * @throws TypeMismatchException if `node` is not a map.
 * @throws InvalidValueException if `document_class` names an unregistered class.
 */
OptionBag optionBagFromYaml(const YAML::Node& node,
                            const DocumentClassRegistry& registry = globalDocumentClasses());

/**
 * The name `document_class` is written under: its registered name, or its demangled
 * type name (with a warning) if it isn't registered.
 */
std::string documentClassNameForYaml(
    const DocumentClass& documentClass,
    const DocumentClassRegistry& registry = globalDocumentClasses());

}  // namespace bsonopts

namespace YAML {

template <>
struct convert<bsonopts::CodecOptions> {
    using Config = bsonopts::CodecOptions;
    using Keys = typename Config::Keys;

    /**
     * Only options whose document class is registered in `globalDocumentClasses()` can be
     * decoded again; an unregistered class is written by its type name, which `decode`
     * rejects.
     */
    static Node encode(const Config& rhs) {
        Node node;

        node[Keys::kDocumentClass] = bsonopts::documentClassNameForYaml(rhs.documentClass());
        node[Keys::kTzAware] = rhs.tzAware();
        node[Keys::kUuidRepresentation] = bsonopts::toString(rhs.uuidRepresentation());

        return node;
    }

    static bool decode(const Node& node, Config& rhs) {
        if (!node.IsMap()) {
            return false;
        }
        rhs = bsonopts::parseCodecOptions(bsonopts::optionBagFromYaml(node));
        return true;
    }
};

}  // namespace YAML

#endif  // HEADER_7185242B_1DD5_4E51_88F4_539C0F393A69_INCLUDED
