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

#ifndef SRC_CPP_RANGE_HPP_
#define SRC_CPP_RANGE_HPP_

#include <cstdint>
#include <string>
#include <utility>

#include "exceptions.hpp"

// Half-open interval [begin, end) of indices into the array being sorted.
struct Range {
    uint64_t begin = 0;
    uint64_t end = 0;

    Range() = default;
    Range(uint64_t begin_, uint64_t end_) : begin(begin_), end(end_) {}

    // Whole array of the given length.
    static Range Full(uint64_t length) { return Range(0, length); }

    uint64_t Length() const { return end - begin; }
    bool Empty() const { return begin == end; }

    // The split point rounds up, so the lower half gets the extra element
    // of an odd-length range.
    uint64_t Middle() const { return begin + (Length() + 1) / 2; }

    std::pair<Range, Range> Split() const
    {
        uint64_t const middle = Middle();
        return std::make_pair(Range(begin, middle), Range(middle, end));
    }

    void Validate(uint64_t length) const
    {
        if (begin > end || end > length) {
            throw InvalidValueException(
                "Invalid range [" + std::to_string(begin) + ", " + std::to_string(end) +
                ") for array of length " + std::to_string(length));
        }
    }

    bool operator==(const Range &other) const { return begin == other.begin && end == other.end; }
};

#endif  // SRC_CPP_RANGE_HPP_
