#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "restor/core/errors.hpp"
#include "restor/core/types.hpp"
#include "restor/restore/file_ops.hpp"

namespace restor::restore {
    using u32 = restor::core::u32;

    // Bounded store of idle write handles keyed by destination path.
    //
    // The first open of a path creates or truncates the file; every later open
    // appends. A path counts as "in progress" from its first open until
    // teardown(). Idle handles are kept first come first served up to
    // `capacity`; when the cache is full a released handle is closed instead,
    // so at most (writes in flight + capacity) descriptors are open at once.
    //
    // One mutex guards the map, the in-progress set and the open(2) call
    // itself. Content I/O never happens under it.
    class HandleCache {
    public:
        HandleCache(u32 capacity, FileOps& ops) noexcept;
        ~HandleCache() noexcept;

        HandleCache(const HandleCache&) = delete;
        HandleCache& operator=(const HandleCache&) = delete;

        // Hands out an exclusively owned handle for `path`: a cached idle one
        // if present, otherwise a freshly opened one.
        [[nodiscard]] restor::core::Status acquire(const char* path, int* out_fd) noexcept;

        // Caches `fd` if there is room, closes it otherwise. Never fails.
        void release(const char* path, int fd) noexcept;

        // Closes any cached handle for `path` and forgets that it was opened.
        // No write for `path` may be in flight.
        void teardown(const char* path) noexcept;

        [[nodiscard]] u32 capacity() const noexcept { return capacity_; }
        [[nodiscard]] u32 cached_count() const noexcept;
        [[nodiscard]] u32 in_progress_count() const noexcept;
        [[nodiscard]] bool is_cached(const char* path) const noexcept;
        [[nodiscard]] bool is_in_progress(const char* path) const noexcept;

    private:
        void close_handle(const char* path, int fd) noexcept;

        FileOps& ops_;
        const u32 capacity_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, int> idle_;
        std::unordered_set<std::string> in_progress_;
    };
} // namespace restor::restore
