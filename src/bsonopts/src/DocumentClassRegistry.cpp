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

#include <bsonopts/DocumentClassRegistry.hpp>

#include <sstream>

#include <boost/log/trivial.hpp>
#include <boost/throw_exception.hpp>

#include <bsonopts/InvalidConfigurationException.hpp>

namespace bsonopts {

DocumentClassRegistry::DocumentClassRegistry() {
    add<DefaultDocument>(kDefaultName);
}

DocumentClassRegistry::DocumentClassRegistry(DocumentClassRegistry::List init)
    : DocumentClassRegistry() {
    for (const auto& [name, documentClass] : init) {
        add(name, documentClass);
    }
}

void DocumentClassRegistry::add(std::string_view name, const DocumentClass& documentClass) {
    if (!documentClass.isDocumentContainer()) {
        std::ostringstream msg;
        msg << "Cannot register '" << documentClass.name() << "' as '" << name
            << "': document classes must be ordered mutable mapping types with string keys.";
        BOOST_LOG_TRIVIAL(warning) << msg.str();
        BOOST_THROW_EXCEPTION(TypeMismatchException(msg.str()));
    }

    std::lock_guard<std::mutex> lk{_lock};
    const auto& [it, success] = _classes.emplace(std::string{name}, documentClass);

    if (!success && it->second != documentClass) {
        std::ostringstream msg;
        msg << "Failed to add '" << documentClass.name() << "' as '" << name
            << "', a document class named '" << it->second.name()
            << "' was already added instead.";
        BOOST_LOG_TRIVIAL(warning) << msg.str();
        BOOST_THROW_EXCEPTION(InvalidConfigurationException(msg.str()));
    }
    BOOST_LOG_TRIVIAL(trace) << "Registered document class '" << name << "' as "
                             << documentClass.name();
}

std::optional<DocumentClass> DocumentClassRegistry::find(std::string_view name) const {
    std::lock_guard<std::mutex> lk{_lock};
    if (auto it = _classes.find(name); it != _classes.end()) {
        return it->second;
    }
    return std::nullopt;
}

DocumentClass DocumentClassRegistry::get(std::string_view name) const {
    if (auto found = find(name)) {
        return *found;
    }
    std::ostringstream msg;
    msg << "Unknown document class '" << name << "'.";
    BOOST_LOG_TRIVIAL(warning) << msg.str();
    BOOST_THROW_EXCEPTION(InvalidValueException(msg.str()));
}

std::optional<std::string> DocumentClassRegistry::nameOf(const DocumentClass& documentClass) const {
    std::lock_guard<std::mutex> lk{_lock};
    for (const auto& [name, registered] : _classes) {
        if (registered == documentClass) {
            return name;
        }
    }
    return std::nullopt;
}

std::ostream& DocumentClassRegistry::streamClassesTo(std::ostream& out) const {
    std::lock_guard<std::mutex> lk{_lock};
    for (const auto& [name, documentClass] : _classes) {
        out << name << " is " << documentClass.name() << std::endl;
    }
    return out;
}

}  // namespace bsonopts
