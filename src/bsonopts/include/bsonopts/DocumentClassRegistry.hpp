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

#ifndef HEADER_14006CAF_67DA_430B_9FBB_6B7C2E6601C4_INCLUDED
#define HEADER_14006CAF_67DA_430B_9FBB_6B7C2E6601C4_INCLUDED

#include <functional>
#include <initializer_list>
#include <map>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <bsonopts/DocumentClass.hpp>

namespace bsonopts {

/**
 * Names the document classes that textual configuration may refer to.
 *
 * There will always be a global registry available via `globalDocumentClasses()`, which
 * starts out knowing `"map"` (the `DefaultDocument`). Tests and embedders can build local
 * registries that behave identically.
 *
 * To register a container type with the global registry from a source file:
 * ```
 * auto registerMyDocument = bsonopts::DocumentClassRegistry::registerDefault<MyDocument>("mine");
 * ```
 *
 * Only types that can hold decoded documents are accepted; see `IsMutableMapping` and
 * `IsOrderedMapping`.
 */
class DocumentClassRegistry {
public:
    struct Registration;

    using ClassMap = std::map<std::string, DocumentClass, std::less<>>;
    using List = std::initializer_list<ClassMap::value_type>;

    static constexpr auto kDefaultName = "map";

public:
    DocumentClassRegistry();
    DocumentClassRegistry(List init);

    /**
     * @throws TypeMismatchException if `documentClass` cannot hold decoded documents.
     * @throws InvalidConfigurationException if `name` is already taken by a different class.
     */
    void add(std::string_view name, const DocumentClass& documentClass);

    template <typename T>
    void add(std::string_view name) {
        add(name, DocumentClass::of<T>());
    }

    std::optional<DocumentClass> find(std::string_view name) const;

    /**
     * @throws InvalidValueException if nothing is registered under `name`.
     */
    DocumentClass get(std::string_view name) const;

    /**
     * Reverse lookup: the first name (in name order) `documentClass` is registered under.
     */
    std::optional<std::string> nameOf(const DocumentClass& documentClass) const;

    std::ostream& streamClassesTo(std::ostream&) const;

public:
    template <typename T>
    static Registration registerDefault(std::string_view name);

private:
    mutable std::mutex _lock;
    ClassMap _classes;
};

inline DocumentClassRegistry& globalDocumentClasses() {
    static DocumentClassRegistry _registry;
    return _registry;
}

/**
 * Vehicle for its ctor, which adds a class to the global registry. Lets a registration
 * happen pre-main by way of a global variable.
 */
struct DocumentClassRegistry::Registration {
    Registration(std::string_view name, const DocumentClass& documentClass) {
        globalDocumentClasses().add(name, documentClass);
    }
};

template <typename T>
DocumentClassRegistry::Registration DocumentClassRegistry::registerDefault(std::string_view name) {
    return Registration(name, DocumentClass::of<T>());
}

}  // namespace bsonopts

#endif  // HEADER_14006CAF_67DA_430B_9FBB_6B7C2E6601C4_INCLUDED
