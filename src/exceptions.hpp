// Copyright 2018 Chia Network Inc

// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at

//    http://www.apache.org/licenses/LICENSE-2.0

// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SRC_CPP_EXCEPTIONS_HPP_
#define SRC_CPP_EXCEPTIONS_HPP_

#include <exception>
#include <string>

// Thrown when a caller hands the sorter arguments it cannot work with, such as
// a range that does not fit inside the array.
class InvalidValueException : public std::exception {
public:
    explicit InvalidValueException(const std::string &s) : s_(s) {}
    const char *what() const noexcept override { return s_.c_str(); }

private:
    std::string s_;
};

#endif  // SRC_CPP_EXCEPTIONS_HPP_
