#include "restor/restore/files_writer.hpp"

#include <cinttypes>
#include <cstdio>
#include <limits>

#include "restor/core/log.hpp"
#include "restor/restore/platform.hpp"
#include "restor/restore/zero_block.hpp"

namespace restor::restore {

using namespace restor::core;

namespace {
    // Returns the handle to the cache on every exit path.
    class ReleaseOnExit {
    public:
        ReleaseOnExit(HandleCache& cache, const char* path, int fd) noexcept
            : cache_(cache), path_(path), fd_(fd) {}
        ~ReleaseOnExit() noexcept { cache_.release(path_, fd_); }

        ReleaseOnExit(const ReleaseOnExit&) = delete;
        ReleaseOnExit& operator=(const ReleaseOnExit&) = delete;

    private:
        HandleCache& cache_;
        const char* path_;
        int fd_;
    };

    void begin_report(WriteReport* report, const char* path, u64 expected) noexcept {
        if (report == nullptr) {
            return;
        }
        report->expected_bytes = expected;
        report->written_bytes = 0;
        std::snprintf(report->path, sizeof(report->path), "%s", path != nullptr ? path : "");
    }

    [[nodiscard]] Status short_write_status(u64 written) noexcept {
        const u64 max_aux = std::numeric_limits<u32>::max();
        return make_status(StatusDomain::Restore, StatusCode::ShortWrite,
            static_cast<u32>(written < max_aux ? written : max_aux));
    }

    enum class ExtensionOutcome : u8 {
        Extended = 0,
        SafeToFallback = 1,
        Fatal = 2,
    };

    [[nodiscard]] ExtensionOutcome extend_file(FileOps& ops, int fd, Status* fatal) noexcept {
        if (!sparse_files_supported()) {
            return ExtensionOutcome::SafeToFallback;
        }

        // The current size, read by moving the offset to the end. A handle freshly
        // opened for append still has its offset at 0; parked at the end, an
        // unchanged offset after a failed truncate means the file was left alone.
        u64 size = 0;
        Status s = ops.seek(fd, 0, SeekWhence::End, &size);
        if (!is_ok(s)) {
            *fatal = s;
            return ExtensionOutcome::Fatal;
        }

        const Status truncated = ops.truncate(fd, size + zero_block().size);
        if (is_ok(truncated)) {
            // Where the file offset ends up after ftruncate is not portable.
            s = ops.seek(fd, 0, SeekWhence::End, nullptr);
            if (!is_ok(s)) {
                *fatal = s;
                return ExtensionOutcome::Fatal;
            }
            return ExtensionOutcome::Extended;
        }

        u64 pos = 0;
        s = ops.seek(fd, 0, SeekWhence::Current, &pos);
        if (is_ok(s) && pos == size) {
            log_debug("sparse extension refused (errno=%u), writing zeros", truncated.aux);
            return ExtensionOutcome::SafeToFallback;
        }
        *fatal = truncated;
        return ExtensionOutcome::Fatal;
    }
} // namespace

void format_write_report(const WriteReport& r, char* out, std::size_t out_size) noexcept {
    if (out == nullptr || out_size == 0) {
        return;
    }
    std::snprintf(out, out_size, "error writing file %s: wrong length written, want %" PRIu64 ", got %" PRIu64,
        r.path, r.expected_bytes, r.written_bytes);
}

FilesWriter::FilesWriter(const FilesWriterConfig& cfg, FileOps* ops) noexcept
    : ops_(ops != nullptr ? *ops : default_file_ops()), cache_(cfg.cache_capacity, ops_) {}

Status FilesWriter::write_checked(const char* path, int fd, restor::storage::BufferView data, WriteReport* report) noexcept {
    u64 written = 0;
    const Status s = ops_.write(fd, data, &written);
    if (report != nullptr) {
        report->written_bytes = written;
    }
    if (!is_ok(s)) {
        return s;
    }
    if (written != data.len) {
        log_debug("error writing file %s: wrong length written, want %u, got %" PRIu64, path, data.len, written);
        return short_write_status(written);
    }
    return ok_status();
}

Status FilesWriter::write_to_file(const char* path, restor::storage::BufferView data, WriteReport* report) noexcept {
    // The first call for a path creates the file; later calls reuse the cached
    // handle or reopen for append. Handles are never shared between calls,
    // so the only coordination is inside the cache.
    begin_report(report, path, data.len);
    if (data.len > 0 && data.data == nullptr) {
        return make_status(StatusDomain::Restore, StatusCode::Invalid);
    }

    int fd = -1;
    Status s = cache_.acquire(path, &fd);
    if (!is_ok(s)) {
        return s;
    }

    s = write_checked(path, fd, data, report);
    cache_.release(path, fd);
    return s;
}

Status FilesWriter::write_zeros(const char* path, WriteReport* report) noexcept {
    const ZeroBlock& zeros = zero_block();
    begin_report(report, path, zeros.size);

    int fd = -1;
    Status s = cache_.acquire(path, &fd);
    if (!is_ok(s)) {
        return s;
    }
    ReleaseOnExit release(cache_, path, fd);

    Status fatal{};
    switch (extend_file(ops_, fd, &fatal)) {
        case ExtensionOutcome::Extended:
            if (report != nullptr) {
                report->written_bytes = zeros.size;
            }
            return ok_status();
        case ExtensionOutcome::SafeToFallback:
            return write_checked(path, fd, zeros.view(), report);
        case ExtensionOutcome::Fatal:
            return fatal;
    }
    return make_status(StatusDomain::Restore, StatusCode::Unknown);
}

void FilesWriter::close(const char* path) noexcept {
    cache_.teardown(path);
}

} // namespace restor::restore
