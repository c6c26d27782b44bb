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

#ifndef HEADER_DD74B107_8084_4932_BC6D_88592A97CBC9_INCLUDED
#define HEADER_DD74B107_8084_4932_BC6D_88592A97CBC9_INCLUDED

#include <cstdint>
#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <type_traits>
#include <variant>

#include <bsoncxx/document/value.hpp>
#include <bsoncxx/types.hpp>

#include <bsonopts/DocumentClass.hpp>
#include <bsonopts/UuidRepresentation.hpp>

namespace bsonopts {

/**
 * One entry of a loosely-typed option bag, e.g. keyword options handed down by a
 * client, database, or collection handle.
 */
using OptionValue =
    std::variant<DocumentClass, bool, int64_t, double, std::string, UuidRepresentation>;

using OptionBag = std::map<std::string, OptionValue, std::less<>>;

/**
 * Options controlling how BSON is decoded into (and encoded from) native values.
 *
 * - `documentClass`: the container type decoded documents are materialized as.
 *   Must be an ordered, mutable mapping with string keys.
 * - `tzAware`: if true, decoded datetimes carry an explicit UTC offset; otherwise
 *   they are naive.
 * - `uuidRepresentation`: the layout used when encoding and decoding UUIDs.
 *
 * Instances are validated once, when constructed, and have no mutators. To "change"
 * options construct a new instance, e.g. with `withOptions()`.
 */
class CodecOptions {
public:
    /** Default values for each of the options */
    struct Defaults {
        static DocumentClass documentClass() {
            return DocumentClass::of<DefaultDocument>();
        }
        static constexpr auto kTzAware = false;
        static constexpr auto kUuidRepresentation = kDefaultUuidRepresentation;
    };

    /** Option bag and YAML keys */
    struct Keys {
        static constexpr auto kDocumentClass = "document_class";
        static constexpr auto kTzAware = "tz_aware";
        static constexpr auto kUuidRepresentation = "uuidrepresentation";
    };

public:
    CodecOptions();

    /**
     * @throws TypeMismatchException if `documentClass` cannot hold decoded documents.
     * @throws InvalidValueException if `uuidRepresentation` is not one of
     *   `kAllUuidRepresentations`.
     */
    CodecOptions(DocumentClass documentClass, bool tzAware, UuidRepresentation uuidRepresentation);

    // tz_aware must be a real bool, not something that converts to one.
    template <typename B, typename = std::enable_if_t<!std::is_same_v<B, bool>>>
    CodecOptions(DocumentClass documentClass, B tzAware, UuidRepresentation uuidRepresentation) =
        delete;

    CodecOptions(const CodecOptions&) = default;
    CodecOptions(CodecOptions&&) = default;
    CodecOptions& operator=(const CodecOptions&) = default;
    CodecOptions& operator=(CodecOptions&&) = default;

    const DocumentClass& documentClass() const {
        return _documentClass;
    }

    bool tzAware() const {
        return _tzAware;
    }

    UuidRepresentation uuidRepresentation() const {
        return _uuidRepresentation;
    }

    /**
     * @return the binary subtype UUIDs are tagged with under these options.
     */
    bsoncxx::binary_sub_type binarySubType() const;

    /**
     * @return a copy of these options with the keys present in `overrides` replaced.
     * Uses the same keys and validation as `parseCodecOptions()`.
     */
    CodecOptions withOptions(const OptionBag& overrides) const;

    /**
     * @return `{document_class: <name>, tz_aware: <bool>, uuidrepresentation: <int>}`.
     */
    bsoncxx::document::value toBson() const;

    friend bool operator==(const CodecOptions& lhs, const CodecOptions& rhs) {
        return lhs._documentClass == rhs._documentClass && lhs._tzAware == rhs._tzAware &&
            lhs._uuidRepresentation == rhs._uuidRepresentation;
    }

    friend bool operator!=(const CodecOptions& lhs, const CodecOptions& rhs) {
        return !(lhs == rhs);
    }

private:
    DocumentClass _documentClass;
    bool _tzAware;
    UuidRepresentation _uuidRepresentation;
};

std::ostream& operator<<(std::ostream& out, const CodecOptions& options);

/**
 * Build CodecOptions from an option bag.
 *
 * Reads `document_class` (a `DocumentClass`), `tz_aware` (a `bool`) and
 * `uuidrepresentation` (a `UuidRepresentation` or its integer value), falling back to
 * `CodecOptions::Defaults` for absent keys. Other keys are ignored.
 *
 * @throws TypeMismatchException, InvalidValueException as `CodecOptions`'s ctor does,
 *   and when a key holds a value of the wrong kind.
 */
CodecOptions parseCodecOptions(const OptionBag& options);

}  // namespace bsonopts

namespace std {

template <>
struct hash<bsonopts::CodecOptions> {
    size_t operator()(const bsonopts::CodecOptions& options) const;
};

}  // namespace std

#endif  // HEADER_DD74B107_8084_4932_BC6D_88592A97CBC9_INCLUDED
