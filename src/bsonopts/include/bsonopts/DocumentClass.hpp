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

#ifndef HEADER_00221971_42BD_4092_AFB1_2F1E3052FAB0_INCLUDED
#define HEADER_00221971_42BD_4092_AFB1_2F1E3052FAB0_INCLUDED

#include <map>
#include <ostream>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include <boost/core/demangle.hpp>

#include <bsoncxx/types/bson_value/value.hpp>

namespace bsonopts {

/**
 * The container decoded documents are materialized into when no other
 * document class is configured.
 */
using DefaultDocument = std::map<std::string, bsoncxx::types::bson_value::value>;

namespace v1 {

template <typename T, typename = void>
struct HasMappingTypedefs : std::false_type {};

template <typename T>
struct HasMappingTypedefs<T, std::void_t<typename T::key_type, typename T::mapped_type>>
    : std::true_type {};

template <typename T, typename = void>
struct HasKeyedLookup : std::false_type {};

template <typename T>
struct HasKeyedLookup<
    T,
    std::void_t<decltype(
        std::declval<const T&>().find(std::declval<const typename T::key_type&>()))>>
    : std::true_type {};

template <typename T, typename = void>
struct HasSubscriptAssignment : std::false_type {};

template <typename T>
struct HasSubscriptAssignment<
    T,
    std::void_t<decltype(std::declval<T&>()[std::declval<const typename T::key_type&>()] =
                             std::declval<const typename T::mapped_type&>())>> : std::true_type {};

template <typename T, typename = void>
struct HasInsertOrAssign : std::false_type {};

template <typename T>
struct HasInsertOrAssign<
    T,
    std::void_t<decltype(std::declval<T&>().insert_or_assign(
        std::declval<const typename T::key_type&>(),
        std::declval<const typename T::mapped_type&>()))>> : std::true_type {};

template <typename T, typename = void>
struct HasKeyedErase : std::false_type {};

template <typename T>
struct HasKeyedErase<
    T,
    std::void_t<decltype(std::declval<T&>().erase(std::declval<const typename T::key_type&>()))>>
    : std::true_type {};

template <typename T, typename = void>
struct HasIteration : std::false_type {};

template <typename T>
struct HasIteration<
    T,
    std::void_t<decltype(std::declval<T&>().begin()), decltype(std::declval<T&>().end())>>
    : std::true_type {};

template <typename T, typename = void>
struct HasStringKeys : std::false_type {};

// Keys must own their text; decoded documents outlive the buffer they were read from.
template <typename T>
struct HasStringKeys<T, std::void_t<typename T::key_type>>
    : std::is_same<std::remove_cv_t<typename T::key_type>, std::string> {};

template <typename T, typename = void>
struct HasKeyCompare : std::false_type {};

template <typename T>
struct HasKeyCompare<T, std::void_t<typename T::key_compare>> : std::true_type {};

}  // namespace v1

/**
 * Mutable mapping from owned `std::string` keys: keyed lookup, keyed assignment (which rules out
 * multimaps), erasure by key, and iteration.
 */
template <typename T>
struct IsMutableMapping
    : std::bool_constant<v1::HasMappingTypedefs<T>::value && v1::HasStringKeys<T>::value &&
                         v1::HasKeyedLookup<T>::value &&
                         (v1::HasSubscriptAssignment<T>::value ||
                          v1::HasInsertOrAssign<T>::value) &&
                         v1::HasKeyedErase<T>::value && v1::HasIteration<T>::value> {};

/**
 * Whether iterating a T visits entries in a deterministic order.
 *
 * Sorted containers (anything with a `key_compare`) qualify automatically.
 * This *may* be specialized for insertion-ordered containers:
 *
 *     namespace bsonopts {
 *     template <> struct IsOrderedMapping<MyDocument> : std::true_type {};
 *     }  // namespace bsonopts
 */
template <typename T>
struct IsOrderedMapping : v1::HasKeyCompare<T> {};

/**
 * Runtime handle naming the concrete container type decoded documents are built as.
 *
 * The capability checks are evaluated at compile time in `of<T>()` and carried along
 * so that a non-conforming type can be rejected when options are constructed.
 */
class DocumentClass {
public:
    template <typename T>
    static DocumentClass of() {
        return DocumentClass{typeid(T),
                             boost::core::demangle(typeid(T).name()),
                             IsMutableMapping<T>::value,
                             IsOrderedMapping<T>::value};
    }

    const std::string& name() const {
        return _name;
    }

    std::type_index type() const {
        return _type;
    }

    bool isMutableMapping() const {
        return _mutableMapping;
    }

    bool isOrdered() const {
        return _ordered;
    }

    /**
     * @return whether documents can be decoded into this class.
     */
    bool isDocumentContainer() const {
        return _mutableMapping && _ordered;
    }

    template <typename T>
    bool is() const {
        return _type == std::type_index{typeid(T)};
    }

    friend bool operator==(const DocumentClass& lhs, const DocumentClass& rhs) {
        return lhs._type == rhs._type;
    }

    friend bool operator!=(const DocumentClass& lhs, const DocumentClass& rhs) {
        return !(lhs == rhs);
    }

private:
    DocumentClass(const std::type_info& type, std::string name, bool mutableMapping, bool ordered)
        : _type{type}, _name{std::move(name)}, _mutableMapping{mutableMapping}, _ordered{ordered} {}

    std::type_index _type;
    std::string _name;
    bool _mutableMapping;
    bool _ordered;
};

inline std::ostream& operator<<(std::ostream& out, const DocumentClass& documentClass) {
    return out << documentClass.name();
}

}  // namespace bsonopts

namespace std {

template <>
struct hash<bsonopts::DocumentClass> {
    size_t operator()(const bsonopts::DocumentClass& documentClass) const {
        return hash<type_index>{}(documentClass.type());
    }
};

}  // namespace std

#endif  // HEADER_00221971_42BD_4092_AFB1_2F1E3052FAB0_INCLUDED
