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

#include <bsonopts/CodecOptions.hpp>

#include <sstream>
#include <typeinfo>

#include <boost/container_hash/hash.hpp>
#include <boost/core/demangle.hpp>
#include <boost/log/trivial.hpp>
#include <boost/throw_exception.hpp>

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>

#include <bsonopts/DocumentClassRegistry.hpp>
#include <bsonopts/InvalidConfigurationException.hpp>

namespace bsonopts {

namespace {

using Keys = CodecOptions::Keys;

std::string typeName(const OptionValue& value) {
    return std::visit([](auto&& v) { return boost::core::demangle(typeid(v).name()); }, value);
}

template <typename E>
[[noreturn]] void fail(const std::string& msg) {
    BOOST_LOG_TRIVIAL(warning) << msg;
    BOOST_THROW_EXCEPTION(E(msg));
}

void validateDocumentClass(const DocumentClass& documentClass) {
    if (!documentClass.isDocumentContainer()) {
        std::ostringstream msg;
        msg << "document_class must be an ordered mutable mapping type with string keys, got '"
            << documentClass.name() << "'";
        fail<TypeMismatchException>(msg.str());
    }
}

void validateUuidRepresentation(UuidRepresentation rep) {
    if (!isValidUuidRepresentation(rep)) {
        std::ostringstream msg;
        msg << "uuid_representation must be one of standard(4), pythonLegacy(3), javaLegacy(5) "
            << "or csharpLegacy(6), got " << static_cast<int64_t>(rep);
        fail<InvalidValueException>(msg.str());
    }
}

DocumentClass resolveDocumentClass(const OptionBag& options, const DocumentClass& fallback) {
    auto it = options.find(Keys::kDocumentClass);
    if (it == options.end()) {
        return fallback;
    }
    if (auto documentClass = std::get_if<DocumentClass>(&it->second)) {
        return *documentClass;
    }
    std::ostringstream msg;
    msg << "document_class must be a document class, got a value of type '"
        << typeName(it->second) << "'";
    fail<TypeMismatchException>(msg.str());
}

bool resolveTzAware(const OptionBag& options, bool fallback) {
    auto it = options.find(Keys::kTzAware);
    if (it == options.end()) {
        return fallback;
    }
    if (auto tzAware = std::get_if<bool>(&it->second)) {
        return *tzAware;
    }
    std::ostringstream msg;
    msg << "tz_aware must be a boolean, got a value of type '" << typeName(it->second) << "'";
    fail<TypeMismatchException>(msg.str());
}

UuidRepresentation resolveUuidRepresentation(const OptionBag& options,
                                             UuidRepresentation fallback) {
    auto it = options.find(Keys::kUuidRepresentation);
    if (it == options.end()) {
        return fallback;
    }
    if (auto rep = std::get_if<UuidRepresentation>(&it->second)) {
        return *rep;
    }
    if (auto number = std::get_if<int64_t>(&it->second);
        number && isValidUuidRepresentation(*number)) {
        return static_cast<UuidRepresentation>(*number);
    }
    std::ostringstream msg;
    msg << "uuid_representation must be a value from kAllUuidRepresentations, got a value of "
        << "type '" << typeName(it->second) << "'";
    if (auto number = std::get_if<int64_t>(&it->second)) {
        msg << " (" << *number << ")";
    }
    fail<InvalidValueException>(msg.str());
}

void logIgnoredKeys(const OptionBag& options) {
    for (auto&& [key, value] : options) {
        if (key != Keys::kDocumentClass && key != Keys::kTzAware &&
            key != Keys::kUuidRepresentation) {
            BOOST_LOG_TRIVIAL(debug) << "Ignoring unrecognized codec option '" << key << "'";
        }
    }
}

// Checks run in the same order as in the ctor so the first bad option is the one reported.
CodecOptions resolve(const OptionBag& options, const CodecOptions& fallback) {
    logIgnoredKeys(options);

    auto documentClass = resolveDocumentClass(options, fallback.documentClass());
    validateDocumentClass(documentClass);

    auto tzAware = resolveTzAware(options, fallback.tzAware());

    auto uuidRepresentation =
        resolveUuidRepresentation(options, fallback.uuidRepresentation());

    return CodecOptions{std::move(documentClass), tzAware, uuidRepresentation};
}

}  // namespace

CodecOptions::CodecOptions()
    : CodecOptions{Defaults::documentClass(), Defaults::kTzAware, Defaults::kUuidRepresentation} {}

CodecOptions::CodecOptions(DocumentClass documentClass,
                           bool tzAware,
                           UuidRepresentation uuidRepresentation)
    : _documentClass{std::move(documentClass)},
      _tzAware{tzAware},
      _uuidRepresentation{uuidRepresentation} {
    validateDocumentClass(_documentClass);
    validateUuidRepresentation(_uuidRepresentation);
}

bsoncxx::binary_sub_type CodecOptions::binarySubType() const {
    return bsonopts::binarySubType(_uuidRepresentation);
}

CodecOptions CodecOptions::withOptions(const OptionBag& overrides) const {
    return resolve(overrides, *this);
}

bsoncxx::document::value CodecOptions::toBson() const {
    using bsoncxx::builder::basic::kvp;

    auto documentClassName =
        globalDocumentClasses().nameOf(_documentClass).value_or(_documentClass.name());

    bsoncxx::builder::basic::document doc{};
    doc.append(kvp(std::string{Keys::kDocumentClass}, documentClassName),
               kvp(std::string{Keys::kTzAware}, _tzAware),
               kvp(std::string{Keys::kUuidRepresentation},
                   static_cast<int32_t>(_uuidRepresentation)));
    return doc.extract();
}

std::ostream& operator<<(std::ostream& out, const CodecOptions& options) {
    out << "CodecOptions(document_class=" << options.documentClass()
        << ", tz_aware=" << (options.tzAware() ? "true" : "false")
        << ", uuid_representation=" << options.uuidRepresentation() << ")";
    return out;
}

CodecOptions parseCodecOptions(const OptionBag& options) {
    return resolve(options, CodecOptions{});
}

}  // namespace bsonopts

namespace std {

size_t hash<bsonopts::CodecOptions>::operator()(const bsonopts::CodecOptions& options) const {
    size_t seed = 0;
    boost::hash_combine(seed, hash<bsonopts::DocumentClass>{}(options.documentClass()));
    boost::hash_combine(seed, options.tzAware());
    boost::hash_combine(seed, static_cast<int32_t>(options.uuidRepresentation()));
    return seed;
}

}  // namespace std
