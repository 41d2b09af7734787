#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

// Pass as threads to get one thread per logical CPU.
#define FORKMERGE_DEFAULT_THREADS UINT32_MAX

#ifdef __cplusplus
extern "C" {
#endif
    // Sorts data[begin, end) into out, which must hold end - begin values.
    // threads == 0 is treated as 1, so the sort stays on the calling thread.
    // If threads_spawned is not null it receives the number of worker threads
    // started. Returns false if the range does not fit the array or the sort
    // failed.
    bool forkmerge_sort_int64(const int64_t* data, size_t len, size_t begin, size_t end, uint32_t threads, bool reverse, int64_t* out, uint64_t* threads_spawned);
#ifdef __cplusplus
}
#endif
