#include <algorithm>
#include <exception>
#include <vector>

#include "wrapper.h"
#include "../src/compare.hpp"
#include "../src/parallel_sort.hpp"

using Comparator = Compare::Function<int64_t>;

extern "C" {
    bool forkmerge_sort_int64(const int64_t* data, size_t len, size_t begin, size_t end, uint32_t threads, bool reverse, int64_t* out, uint64_t* threads_spawned) {
        if (begin > end || end > len || (len > 0 && data == nullptr) || (end > begin && out == nullptr)) {
            return false;
        }
        try {
            auto array = ParallelSort::Share(std::vector<int64_t>(data, data + len));
            auto options = ParallelSort::CustomOrder<int64_t>(
                reverse ? Comparator(Compare::ReverseOrder<int64_t>())
                        : Comparator(Compare::NaturalOrder<int64_t>()));
            if (threads != FORKMERGE_DEFAULT_THREADS) {
                options.Threads(threads);
            }
            ParallelSort::SortStats stats;
            std::vector<int64_t> sorted = options.SetRange(begin, end).Run(array, &stats);
            std::copy(sorted.begin(), sorted.end(), out);
            if (threads_spawned != nullptr) {
                *threads_spawned = stats.threads_spawned.load();
            }
            return true;
        } catch (const std::exception&) {
            return false;
        }
    }
}
