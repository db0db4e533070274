#include "restor/restore/handle_cache.hpp"

#include <cstring>
#include <new>

#include "restor/core/log.hpp"

namespace restor::restore {

using namespace restor::core;

HandleCache::HandleCache(u32 capacity, FileOps& ops) noexcept
    : ops_(ops), capacity_(capacity) {}

HandleCache::~HandleCache() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [path, fd] : idle_) {
        close_handle(path.c_str(), fd);
    }
    idle_.clear();
    in_progress_.clear();
}

Status HandleCache::acquire(const char* path, int* out_fd) noexcept {
    if (path == nullptr || out_fd == nullptr) {
        return make_status(StatusDomain::Restore, StatusCode::Invalid);
    }
    *out_fd = -1;

    std::lock_guard<std::mutex> lock(mutex_);

    try {
        const std::string key(path);

        auto it = idle_.find(key);
        if (it != idle_.end()) {
            *out_fd = it->second;
            idle_.erase(it);
            log_debug("used cached writer for %s", path);
            return ok_status();
        }

        OpenMode mode = OpenMode::Append;
        const bool first_open = in_progress_.insert(key).second;
        if (first_open) {
            mode = OpenMode::CreateTruncate;
        }

        // Opening under the lock keeps the "first open truncates" decision
        // atomic with the open itself.
        int fd = -1;
        const Status s = ops_.open(path, mode, &fd);
        if (!is_ok(s)) {
            // The file was never created; a retry must truncate again, not append.
            if (first_open) {
                in_progress_.erase(key);
            }
            return s;
        }

        log_debug("opened writer for %s (%s)", path, first_open ? "create" : "append");
        *out_fd = fd;
        return ok_status();
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Restore, StatusCode::Unavailable);
    }
}

void HandleCache::release(const char* path, int fd) noexcept {
    if (fd < 0) {
        return;
    }
    if (path == nullptr) {
        close_handle("(null)", fd);
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (idle_.size() < capacity_) {
        try {
            if (idle_.emplace(path, fd).second) {
                return;
            }
            // Another handle for the same path is already idle.
        } catch (const std::bad_alloc&) {
            log_debug("no memory to cache writer for %s, closing it", path);
        }
    }
    close_handle(path, fd);
}

void HandleCache::teardown(const char* path) noexcept {
    if (path == nullptr) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        const std::string key(path);
        auto it = idle_.find(key);
        if (it != idle_.end()) {
            close_handle(path, it->second);
            idle_.erase(it);
        }
        in_progress_.erase(key);
    } catch (const std::bad_alloc&) {
        log_error("teardown of %s failed: out of memory", path);
    }
}

u32 HandleCache::cached_count() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<u32>(idle_.size());
}

u32 HandleCache::in_progress_count() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<u32>(in_progress_.size());
}

bool HandleCache::is_cached(const char* path) const noexcept {
    if (path == nullptr) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        return idle_.find(std::string(path)) != idle_.end();
    } catch (const std::bad_alloc&) {
        return false;
    }
}

bool HandleCache::is_in_progress(const char* path) const noexcept {
    if (path == nullptr) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        return in_progress_.find(std::string(path)) != in_progress_.end();
    } catch (const std::bad_alloc&) {
        return false;
    }
}

void HandleCache::close_handle(const char* path, int fd) noexcept {
    const Status s = ops_.close(fd);
    if (!is_ok(s)) {
        // Nothing useful can be done with a failed close on a write handle here.
        log_debug("closing writer for %s failed: %s", path, std::strerror(static_cast<int>(s.aux)));
    }
}

} // namespace restor::restore
