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

#ifndef SRC_CPP_MERGE_HPP_
#define SRC_CPP_MERGE_HPP_

#include <iterator>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

#include "compare.hpp"

// Merge step shared by the sequential and the parallel sorter.
//
// Instead of comparing the heads of both halves on every step, the merge
// carries a single pivot: the smallest element not yet written out. It then
// alternates between the two halves, draining each one while its elements go
// before the pivot. The first element that does not go before the pivot takes
// its place and the old pivot is written out.
namespace Merge {

    // Drains [it, end) into merged while before(element, pivot) holds. Returns
    // false if there was no pivot to begin with, in which case everything left
    // in the half has been appended and the merge is over.
    template <typename T, typename It, typename Before>
    inline bool MergeWhileBefore(
        It &it,
        It const end,
        boost::optional<T> &pivot,
        std::vector<T> &merged,
        Before const &before)
    {
        if (!pivot) {
            merged.insert(merged.end(), std::make_move_iterator(it), std::make_move_iterator(end));
            it = end;
            return false;
        }

        T pivot_elem = std::move(*pivot);
        pivot = boost::none;

        for (; it != end; ++it) {
            if (!before(*it, pivot_elem)) {
                pivot = std::move(*it);
                ++it;
                merged.push_back(std::move(pivot_elem));
                return true;
            }
            merged.push_back(std::move(*it));
        }

        // Half exhausted. The other half gets one more turn and, finding no
        // pivot, appends whatever it has left.
        merged.push_back(std::move(pivot_elem));
        return true;
    }

    // Merges two sorted halves into a new sorted vector. On ties, elements of
    // the lower half come first: the upper half only passes the pivot when it
    // is strictly less, the lower half passes it when it is not greater.
    template <typename T, typename F>
    inline std::vector<T> Merge(std::vector<T> lower, std::vector<T> upper, F &compare)
    {
        std::vector<T> merged;
        merged.reserve(lower.size() + upper.size());

        auto lower_it = lower.begin();
        auto upper_it = upper.begin();

        boost::optional<T> pivot;
        if (lower_it != lower.end()) {
            pivot = std::move(*lower_it);
            ++lower_it;
        }

        auto const upper_before = [&compare](const T &elem, const T &pivot_elem) {
            return Compare::IsLess(compare, elem, pivot_elem);
        };
        auto const lower_before = [&compare](const T &elem, const T &pivot_elem) {
            return !Compare::IsGreater(compare, elem, pivot_elem);
        };

        while (MergeWhileBefore(upper_it, upper.end(), pivot, merged, upper_before) &&
               MergeWhileBefore(lower_it, lower.end(), pivot, merged, lower_before)) {
        }

        return merged;
    }

}

#endif  // SRC_CPP_MERGE_HPP_
