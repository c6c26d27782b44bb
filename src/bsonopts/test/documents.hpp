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

#ifndef HEADER_2B0C8F4E_5D63_4F0A_9C1E_7A3D6E41B8C2_INCLUDED
#define HEADER_2B0C8F4E_5D63_4F0A_9C1E_7A3D6E41B8C2_INCLUDED

#include <functional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include <bsonopts/DocumentClass.hpp>

namespace bsonopts::testing {

/**
 * Minimal mapping that remembers insertion order. Not sorted, so it needs an
 * `IsOrderedMapping` specialization to be usable as a document class.
 */
class InsertionOrderedDocument {
public:
    using key_type = std::string;
    using mapped_type = int;
    using value_type = std::pair<std::string, int>;
    using iterator = std::vector<value_type>::iterator;
    using const_iterator = std::vector<value_type>::const_iterator;

    const_iterator find(const key_type& key) const {
        for (auto it = _entries.begin(); it != _entries.end(); ++it) {
            if (it->first == key) {
                return it;
            }
        }
        return _entries.end();
    }

    mapped_type& operator[](const key_type& key) {
        for (auto&& entry : _entries) {
            if (entry.first == key) {
                return entry.second;
            }
        }
        return _entries.emplace_back(key, mapped_type{}).second;
    }

    size_t erase(const key_type& key) {
        auto it = find(key);
        if (it == _entries.end()) {
            return 0;
        }
        _entries.erase(it);
        return 1;
    }

    iterator begin() {
        return _entries.begin();
    }

    iterator end() {
        return _entries.end();
    }

private:
    std::vector<value_type> _entries;
};

/** Insertion-ordered but without a way to remove keys. */
struct AppendOnlyDocument {
    using key_type = std::string;
    using mapped_type = int;
    using key_compare = std::less<std::string>;

    std::vector<std::pair<std::string, int>>::const_iterator find(const key_type&) const;
    mapped_type& operator[](const key_type&);
    std::vector<std::pair<std::string, int>>::iterator begin();
    std::vector<std::pair<std::string, int>>::iterator end();
};

}  // namespace bsonopts::testing

namespace bsonopts {

template <>
struct IsOrderedMapping<testing::InsertionOrderedDocument> : std::true_type {};

}  // namespace bsonopts

#endif  // HEADER_2B0C8F4E_5D63_4F0A_9C1E_7A3D6E41B8C2_INCLUDED
