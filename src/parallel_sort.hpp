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

#ifndef SRC_CPP_PARALLEL_SORT_HPP_
#define SRC_CPP_PARALLEL_SORT_HPP_

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

#include "compare.hpp"
#include "cpu_count.hpp"
#include "exceptions.hpp"
#include "merge.hpp"
#include "range.hpp"

#ifndef FORKMERGE_MIN_CHUNK
#define FORKMERGE_MIN_CHUNK 2048
#endif

// Fork-join merge sort. Each call carries a thread budget; while the budget is
// above one, the upper half is sorted on a new thread and both halves continue
// with half the budget. Once it reaches one, the recursion is the sequential
// one. A call with budget B therefore starts at most B - 1 threads.
//
// The input array and the comparator are shared read-only between all threads
// through reference counted handles. Each call builds and returns its own
// result vector, so nothing written is ever shared.
namespace ParallelSort {

    // Upper halves smaller than this are not worth a thread of their own.
    inline uint64_t const kDefaultMinChunk = FORKMERGE_MIN_CHUNK;

    template <typename T>
    using SharedArray = std::shared_ptr<const std::vector<T>>;

    template <typename T>
    inline SharedArray<T> Share(std::vector<T> array)
    {
        return std::make_shared<const std::vector<T>>(std::move(array));
    }

    // Counters filled in by a sort call when the caller asks for them.
    struct SortStats {
        std::atomic<uint64_t> threads_spawned{0};
        std::atomic<uint32_t> max_depth{0};

        void RecordDepth(uint32_t const depth)
        {
            uint32_t seen = max_depth.load();
            while (seen < depth && !max_depth.compare_exchange_weak(seen, depth)) {
            }
        }
    };

    template <typename T, typename F>
    inline std::vector<T> Split(
        const SharedArray<T> &array,
        Range const range,
        const std::shared_ptr<const F> &compare,
        uint32_t const threads,
        uint64_t const min_chunk,
        SortStats *const stats,
        uint32_t const depth)
    {
        if (stats != nullptr) {
            stats->RecordDepth(depth);
        }

        if (range.Length() <= 1) {
            return std::vector<T>(array->begin() + range.begin, array->begin() + range.end);
        }

        auto const halves = range.Split();
        Range const lower_range = halves.first;
        Range const upper_range = halves.second;

        if (threads <= 1 || upper_range.Length() < min_chunk) {
            std::vector<T> lower =
                Split(array, lower_range, compare, 1, min_chunk, stats, depth + 1);
            std::vector<T> upper =
                Split(array, upper_range, compare, 1, min_chunk, stats, depth + 1);
            return Merge::Merge(std::move(lower), std::move(upper), *compare);
        }

        uint32_t const half_threads = threads / 2;

        // The worker gets its own copies of the handles, so the array and the
        // comparator stay alive for as long as it runs.
        std::packaged_task<std::vector<T>()> upper_task(
            [array, upper_range, compare, half_threads, min_chunk, stats, depth]() {
                return Split(array, upper_range, compare, half_threads, min_chunk, stats, depth + 1);
            });
        std::future<std::vector<T>> upper_result = upper_task.get_future();
        std::thread upper_thread(std::move(upper_task));
        if (stats != nullptr) {
            stats->threads_spawned++;
        }

        std::vector<T> lower;
        try {
            lower = Split(array, lower_range, compare, half_threads, min_chunk, stats, depth + 1);
        } catch (...) {
            upper_thread.join();
            throw;
        }
        upper_thread.join();

        // Re-throws whatever the worker threw; the whole sort fails with it.
        std::vector<T> upper = upper_result.get();

        return Merge::Merge(std::move(lower), std::move(upper), *compare);
    }

    // Options for one or more parallel sorts. Setters chain; Run() only reads
    // the options, so the same object can sort any number of arrays.
    template <typename T, typename F>
    class SortOptions {
    public:
        explicit SortOptions(F compare)
            : compare_(std::make_shared<const F>(std::move(compare))),
              threads_(CpuCount::Logical()),
              min_chunk_(kDefaultMinChunk)
        {
        }

        // A budget of 0 is accepted and sorts on the calling thread only.
        SortOptions &Threads(uint32_t const threads)
        {
            threads_ = threads;
            return *this;
        }

        SortOptions &ThreadPerCpu() { return Threads(CpuCount::Logical()); }

        SortOptions &ThreadPerPhysicalCpu() { return Threads(CpuCount::Physical()); }

        SortOptions &SetRange(Range const range)
        {
            range_ = range;
            return *this;
        }

        SortOptions &SetRange(uint64_t const begin, uint64_t const end)
        {
            return SetRange(Range(begin, end));
        }

        SortOptions &FullRange()
        {
            range_ = boost::none;
            return *this;
        }

        SortOptions &MinChunkSize(uint64_t const min_chunk)
        {
            min_chunk_ = min_chunk;
            return *this;
        }

        const F &GetComparator() const { return *compare_; }
        uint32_t GetThreads() const { return threads_; }
        boost::optional<Range> GetRange() const { return range_; }
        uint64_t GetMinChunkSize() const { return min_chunk_; }

        std::vector<T> Run(const SharedArray<T> &array, SortStats *const stats = nullptr) const
        {
            if (!array) {
                throw InvalidValueException("Cannot sort a null array");
            }
            Range const range = range_ ? *range_ : Range::Full(array->size());
            range.Validate(array->size());

            uint32_t const threads = std::max<uint32_t>(threads_, 1);
            return Split(array, range, compare_, threads, min_chunk_, stats, 0);
        }

    private:
        std::shared_ptr<const F> compare_;
        uint32_t threads_;
        uint64_t min_chunk_;
        boost::optional<Range> range_;
    };

    template <typename T>
    inline SortOptions<T, Compare::NaturalOrder<T>> DefaultOrder()
    {
        return SortOptions<T, Compare::NaturalOrder<T>>(Compare::NaturalOrder<T>());
    }

    template <typename T>
    inline SortOptions<T, Compare::ReverseOrder<T>> ReverseOrder()
    {
        return SortOptions<T, Compare::ReverseOrder<T>>(Compare::ReverseOrder<T>());
    }

    template <typename T, typename F>
    inline SortOptions<T, F> CustomOrder(F compare)
    {
        return SortOptions<T, F>(std::move(compare));
    }

    // Natural order, whole array, one thread per logical CPU.
    template <typename T>
    inline std::vector<T> Sort(const SharedArray<T> &array)
    {
        return DefaultOrder<T>().Run(array);
    }

    template <typename T, typename F>
    inline std::vector<T> SortBy(const SharedArray<T> &array, F compare)
    {
        return CustomOrder<T>(std::move(compare)).Run(array);
    }

    template <typename T>
    inline std::vector<T> SortRange(const SharedArray<T> &array, Range const range)
    {
        return DefaultOrder<T>().SetRange(range).Run(array);
    }

    template <typename T, typename F>
    inline std::vector<T> SortRangeBy(const SharedArray<T> &array, Range const range, F compare)
    {
        return CustomOrder<T>(std::move(compare)).SetRange(range).Run(array);
    }

}

#endif  // SRC_CPP_PARALLEL_SORT_HPP_
