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

#ifndef SRC_CPP_SEQUENTIAL_SORT_HPP_
#define SRC_CPP_SEQUENTIAL_SORT_HPP_

#include <cstdint>
#include <utility>
#include <vector>

#include "compare.hpp"
#include "merge.hpp"
#include "range.hpp"

// Single-threaded top-down merge sort. The input is only read; every call
// returns a freshly allocated, sorted copy of the requested range.
namespace SequentialSort {

    template <typename T, typename F>
    inline std::vector<T> Split(const T *array, Range const range, F &compare)
    {
        if (range.Length() <= 1) {
            return std::vector<T>(array + range.begin, array + range.end);
        }

        auto const halves = range.Split();
        std::vector<T> lower = Split(array, halves.first, compare);
        std::vector<T> upper = Split(array, halves.second, compare);

        return Merge::Merge(std::move(lower), std::move(upper), compare);
    }

    template <typename T, typename F>
    inline std::vector<T> SortRangeBy(
        const T *array,
        uint64_t const length,
        Range const range,
        F compare)
    {
        range.Validate(length);
        return Split(array, range, compare);
    }

    template <typename T, typename F>
    inline std::vector<T> SortRangeBy(const std::vector<T> &array, Range const range, F compare)
    {
        return SortRangeBy(array.data(), array.size(), range, std::move(compare));
    }

    template <typename T, typename F>
    inline std::vector<T> SortBy(const std::vector<T> &array, F compare)
    {
        return SortRangeBy(array, Range::Full(array.size()), std::move(compare));
    }

    template <typename T>
    inline std::vector<T> SortRange(const std::vector<T> &array, Range const range)
    {
        return SortRangeBy(array, range, Compare::NaturalOrder<T>());
    }

    template <typename T>
    inline std::vector<T> Sort(const std::vector<T> &array)
    {
        return SortBy(array, Compare::NaturalOrder<T>());
    }

}

#endif  // SRC_CPP_SEQUENTIAL_SORT_HPP_
