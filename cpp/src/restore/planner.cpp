#include "restor/restore/planner.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <mutex>
#include <new>
#include <set>
#include <string>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

#include "restor/core/log.hpp"
#include "restor/restore/zero_block.hpp"
#include "restor/storage/hashing.hpp"

namespace restor::restore {

using namespace restor::core;

namespace {
    // Fills `buf` unless EOF comes first; *got is the number of bytes read.
    [[nodiscard]] Status read_chunk(int fd, u8* buf, u32 cap, u32* got) noexcept {
        *got = 0;
        while (*got < cap) {
            ssize_t n = ::read(fd, buf + *got, cap - *got);
            if (n < 0) {
                if (errno == EINTR) continue;
                return make_status(StatusDomain::Restore, StatusCode::Io, static_cast<u32>(errno));
            }
            if (n == 0) break;  // EOF
            *got += static_cast<u32>(n);
        }
        return ok_status();
    }

    void add_stats(RestoreStats* into, const RestoreStats& from) noexcept {
        into->files += from.files;
        into->bytes += from.bytes;
        into->data_chunks += from.data_chunks;
        into->sparse_blocks += from.sparse_blocks;
    }

    [[nodiscard]] Status copy_chunks(FilesWriter& writer, int src_fd, const char* dst_path, RestoreStats* stats) noexcept {
        std::vector<u8> buf;
        try {
            buf.resize(kZeroBlockSize);
        } catch (const std::bad_alloc&) {
            return make_status(StatusDomain::Restore, StatusCode::Unavailable);
        }

        bool wrote_any = false;
        while (true) {
            u32 got = 0;
            Status s = read_chunk(src_fd, buf.data(), static_cast<u32>(buf.size()), &got);
            if (!is_ok(s)) {
                return s;
            }
            if (got == 0) {
                break;
            }

            const restor::storage::BufferView chunk{buf.data(), got};
            bool sparse = false;
            if (got == kZeroBlockSize) {
                Hash256 id{};
                s = restor::storage::hash_compute(chunk, &id);
                if (!is_ok(s)) {
                    return s;
                }
                sparse = is_zero_block_id(id);
            }

            WriteReport report{};
            if (sparse) {
                s = writer.write_zeros(dst_path, &report);
                ++stats->sparse_blocks;
            } else {
                s = writer.write_to_file(dst_path, chunk, &report);
                ++stats->data_chunks;
            }
            if (!is_ok(s)) {
                if (s.code == StatusCode::ShortWrite) {
                    char msg[1200];
                    format_write_report(report, msg, sizeof(msg));
                    log_error("%s", msg);
                }
                return s;
            }
            stats->bytes += got;
            wrote_any = true;

            if (got < kZeroBlockSize) {
                break;
            }
        }

        if (!wrote_any) {
            // An empty source still produces an (empty) destination file.
            return writer.write_to_file(dst_path, restor::storage::BufferView{});
        }
        return ok_status();
    }

    // Index of the first task whose destination repeats an earlier one, or
    // `count` when all destinations are distinct.
    [[nodiscard]] Status find_shared_destination(const RestoreTask* tasks, u32 count, u32* dup) noexcept {
        *dup = count;
        try {
            std::set<std::string> seen;
            for (u32 i = 0; i < count; ++i) {
                if (tasks[i].dst_path == nullptr) {
                    continue;
                }
                const std::string key = std::filesystem::path(tasks[i].dst_path).lexically_normal().string();
                if (!seen.insert(key).second) {
                    *dup = i;
                    return ok_status();
                }
            }
        } catch (const std::bad_alloc&) {
            return make_status(StatusDomain::Restore, StatusCode::Unavailable);
        }
        return ok_status();
    }
} // namespace

Status restore_file(FilesWriter& writer, const char* src_path, const char* dst_path, RestoreStats* stats) noexcept {
    if (src_path == nullptr || dst_path == nullptr) {
        return make_status(StatusDomain::Restore, StatusCode::Invalid);
    }

    int src_fd = -1;
    do {
        src_fd = ::open(src_path, O_RDONLY | O_CLOEXEC);
    } while (src_fd < 0 && errno == EINTR);
    if (src_fd < 0) {
        const StatusCode code = (errno == ENOENT) ? StatusCode::NotFound : StatusCode::Io;
        return make_status(StatusDomain::Restore, code, static_cast<u32>(errno));
    }

    RestoreStats local{};
    const Status s = copy_chunks(writer, src_fd, dst_path, &local);
    if (::close(src_fd) != 0) {
        log_debug("closing %s failed: %s", src_path, std::strerror(errno));
    }
    writer.close(dst_path);

    if (!is_ok(s)) {
        return s;
    }
    local.files = 1;
    if (stats != nullptr) {
        add_stats(stats, local);
    }
    log_debug("restored %s -> %s", src_path, dst_path);
    return ok_status();
}

Status plan_destinations(const char* dest_dir,
    const char* const* srcs,
    u32 count,
    std::vector<std::string>* dst_paths,
    u32* bad) noexcept {
    if (dest_dir == nullptr || dst_paths == nullptr || (count > 0 && srcs == nullptr)) {
        return make_status(StatusDomain::Restore, StatusCode::Invalid);
    }
    namespace fs = std::filesystem;

    dst_paths->clear();
    try {
        dst_paths->reserve(count);
        std::set<std::string> seen;
        for (u32 i = 0; i < count; ++i) {
            const fs::path src(srcs[i] != nullptr ? srcs[i] : "");
            if (!src.has_filename()) {
                if (bad != nullptr) {
                    *bad = i;
                }
                dst_paths->clear();
                return make_status(StatusDomain::Restore, StatusCode::Invalid);
            }
            std::string dst = (fs::path(dest_dir) / src.filename()).lexically_normal().string();
            if (!seen.insert(dst).second) {
                if (bad != nullptr) {
                    *bad = i;
                }
                dst_paths->clear();
                return make_status(StatusDomain::Restore, StatusCode::Invalid);
            }
            dst_paths->push_back(std::move(dst));
        }
    } catch (const std::bad_alloc&) {
        dst_paths->clear();
        return make_status(StatusDomain::Restore, StatusCode::Unavailable);
    }
    return ok_status();
}

Status restore_files(FilesWriter& writer,
    u32 jobs,
    const RestoreTask* tasks,
    u32 count,
    RestoreStats* stats,
    u32* failed) noexcept {
    if (count > 0 && tasks == nullptr) {
        return make_status(StatusDomain::Restore, StatusCode::Invalid);
    }

    // Two workers on one destination would interleave writes and tear down
    // each other's handles.
    u32 dup = count;
    const Status checked = find_shared_destination(tasks, count, &dup);
    if (!is_ok(checked)) {
        return checked;
    }
    if (dup < count) {
        log_error("restore: %s is the destination of more than one task", tasks[dup].dst_path);
        if (failed != nullptr) {
            *failed = dup;
        }
        return make_status(StatusDomain::Restore, StatusCode::Invalid);
    }

    if (jobs == 0) {
        jobs = 1;
    }
    if (jobs > count) {
        jobs = count;
    }

    std::atomic<u32> next{0};
    std::mutex mu;  // guards first_error, failed_index and totals
    Status first_error{};
    u32 failed_index = count;
    RestoreStats totals{};

    auto worker = [&]() noexcept {
        while (true) {
            const u32 i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= count) {
                return;
            }
            RestoreStats local{};
            const Status s = restore_file(writer, tasks[i].src_path, tasks[i].dst_path, &local);

            std::lock_guard<std::mutex> lock(mu);
            add_stats(&totals, local);
            if (!is_ok(s) && is_ok(first_error)) {
                first_error = s;
                failed_index = i;
            }
        }
    };

    std::vector<std::thread> threads;
    try {
        threads.reserve(jobs > 0 ? jobs - 1 : 0);
        for (u32 t = 1; t < jobs; ++t) {
            threads.emplace_back(worker);
        }
    } catch (const std::system_error& e) {
        log_info("restore: could not start more workers (%s), continuing with %zu", e.what(), threads.size() + 1);
    } catch (const std::bad_alloc&) {
        log_info("restore: could not start more workers, continuing with %zu", threads.size() + 1);
    }

    worker();
    for (std::thread& t : threads) {
        t.join();
    }

    if (stats != nullptr) {
        add_stats(stats, totals);
    }
    if (failed != nullptr) {
        *failed = failed_index;
    }
    return first_error;
}

} // namespace restor::restore
