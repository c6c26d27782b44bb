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

#include <bsonopts/conventions.hpp>

#include <sstream>

#include <boost/log/trivial.hpp>
#include <boost/throw_exception.hpp>

#include <bsonopts/InvalidConfigurationException.hpp>

namespace bsonopts {

namespace {

using Keys = CodecOptions::Keys;

std::string asText(const YAML::Node& node) {
    if (node.IsScalar()) {
        return node.Scalar();
    }
    return YAML::Dump(node);
}

// Quoted and !!str scalars are strings even when their text looks like a bool or a number.
bool isPlainScalar(const YAML::Node& node) {
    return node.IsScalar() && node.Tag() == "?";
}

OptionValue tzAwareFromYaml(const YAML::Node& node) {
    bool tzAware;
    if (isPlainScalar(node) && YAML::convert<bool>::decode(node, tzAware)) {
        return tzAware;
    }
    return asText(node);
}

OptionValue uuidRepresentationFromYaml(const YAML::Node& node) {
    if (!node.IsScalar()) {
        return asText(node);
    }
    int64_t number;
    if (isPlainScalar(node) && YAML::convert<int64_t>::decode(node, number)) {
        return number;
    }
    if (auto rep = uuidRepresentationFromName(node.Scalar())) {
        return *rep;
    }
    return node.Scalar();
}

}  // namespace

std::string documentClassNameForYaml(const DocumentClass& documentClass,
                                     const DocumentClassRegistry& registry) {
    if (auto name = registry.nameOf(documentClass)) {
        return *name;
    }
    BOOST_LOG_TRIVIAL(warning) << "Document class " << documentClass.name()
                               << " is not registered; the YAML written for it can't be read back";
    return documentClass.name();
}

OptionBag optionBagFromYaml(const YAML::Node& node, const DocumentClassRegistry& registry) {
    if (!node.IsMap()) {
        std::ostringstream msg;
        msg << "codec options must be a YAML map, got '" << asText(node) << "'";
        BOOST_LOG_TRIVIAL(warning) << msg.str();
        BOOST_THROW_EXCEPTION(TypeMismatchException(msg.str()));
    }

    OptionBag out;

    // The known keys are handled in the order parseCodecOptions checks them.
    if (auto documentClass = node[Keys::kDocumentClass]) {
        if (documentClass.IsScalar()) {
            out.emplace(Keys::kDocumentClass, registry.get(documentClass.Scalar()));
        } else {
            out.emplace(Keys::kDocumentClass, asText(documentClass));
        }
    }
    if (auto tzAware = node[Keys::kTzAware]) {
        out.emplace(Keys::kTzAware, tzAwareFromYaml(tzAware));
    }
    if (auto uuidRepresentation = node[Keys::kUuidRepresentation]) {
        out.emplace(Keys::kUuidRepresentation, uuidRepresentationFromYaml(uuidRepresentation));
    }

    for (auto&& kvp : node) {
        auto key = kvp.first.as<std::string>();
        if (out.find(key) == out.end()) {
            BOOST_LOG_TRIVIAL(trace) << "Carrying unrecognized codec option '" << key << "'";
            out.emplace(std::move(key), asText(kvp.second));
        }
    }
    return out;
}

}  // namespace bsonopts
