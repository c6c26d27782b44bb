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

#ifndef HEADER_9EAC10BF_AA83_43E5_8F49_8C57FFAC1AA0_INCLUDED
#define HEADER_9EAC10BF_AA83_43E5_8F49_8C57FFAC1AA0_INCLUDED

#include <exception>
#include <stdexcept>

namespace bsonopts {

/**
 * Throw this to indicate bad codec configuration.
 */
class InvalidConfigurationException : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * A supplied value does not have the type an option requires,
 * e.g. a document class that is not a mapping or a non-boolean `tz_aware`.
 */
class TypeMismatchException : public InvalidConfigurationException {
public:
    using InvalidConfigurationException::InvalidConfigurationException;
};

/**
 * A supplied value has an acceptable type but is outside the closed
 * set of values an option allows.
 */
class InvalidValueException : public InvalidConfigurationException {
public:
    using InvalidConfigurationException::InvalidConfigurationException;
};

}  // namespace bsonopts


#endif  // HEADER_9EAC10BF_AA83_43E5_8F49_8C57FFAC1AA0_INCLUDED
