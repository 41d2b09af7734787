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

#ifndef SRC_CPP_COMPARE_HPP_
#define SRC_CPP_COMPARE_HPP_

#include <functional>

// Comparators follow the memcmp convention: negative if the left operand
// goes first, zero if both are equivalent, positive if the right operand
// goes first. They must be pure, since the parallel sorter calls the same
// comparator object from several threads at once.
namespace Compare {

    template <typename T>
    using Function = std::function<int(const T &, const T &)>;

    template <typename T>
    struct NaturalOrder {
        int operator()(const T &left, const T &right) const
        {
            if (left < right) {
                return -1;
            }
            if (right < left) {
                return 1;
            }
            return 0;
        }
    };

    template <typename T>
    struct ReverseOrder {
        int operator()(const T &left, const T &right) const
        {
            return NaturalOrder<T>()(right, left);
        }
    };

    template <typename T, typename F>
    inline bool IsLess(F &compare, const T &left, const T &right)
    {
        return compare(left, right) < 0;
    }

    template <typename T, typename F>
    inline bool IsGreater(F &compare, const T &left, const T &right)
    {
        return compare(left, right) > 0;
    }

}

#endif  // SRC_CPP_COMPARE_HPP_
