#include "restor/restore/file_ops.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

namespace restor::restore {

using namespace restor::core;

namespace {
    [[nodiscard]] Status io_error(int err) noexcept {
        return make_status(StatusDomain::Restore, StatusCode::Io, static_cast<u32>(err));
    }
} // namespace

Status PosixFileOps::open(const char* path, OpenMode mode, int* out_fd) noexcept {
    if (path == nullptr || out_fd == nullptr) {
        return make_status(StatusDomain::Restore, StatusCode::Invalid);
    }
    *out_fd = -1;

    const int flags = (mode == OpenMode::Append) ? (O_APPEND | O_WRONLY)
                                                 : (O_CREAT | O_TRUNC | O_WRONLY);
    int fd = -1;
    do {
        fd = ::open(path, flags | O_CLOEXEC, 0600);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        if (errno == ENOENT) {
            return make_status(StatusDomain::Restore, StatusCode::NotFound, static_cast<u32>(errno));
        }
        if (errno == EACCES || errno == EPERM) {
            return make_status(StatusDomain::Restore, StatusCode::PermissionDenied, static_cast<u32>(errno));
        }
        return io_error(errno);
    }
    *out_fd = fd;
    return ok_status();
}

Status PosixFileOps::write(int fd, restor::storage::BufferView data, u64* written) noexcept {
    if (written == nullptr || (data.len > 0 && data.data == nullptr)) {
        return make_status(StatusDomain::Restore, StatusCode::Invalid);
    }
    *written = 0;

    ssize_t n = 0;
    do {
        n = ::write(fd, data.data, data.len);
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        return io_error(errno);
    }
    *written = static_cast<u64>(n);
    return ok_status();
}

Status PosixFileOps::truncate(int fd, u64 len) noexcept {
    int rc = 0;
    do {
        rc = ::ftruncate(fd, static_cast<off_t>(len));
    } while (rc != 0 && errno == EINTR);

    if (rc != 0) {
        return io_error(errno);
    }
    return ok_status();
}

Status PosixFileOps::seek(int fd, i64 offset, SeekWhence whence, u64* pos) noexcept {
    int w = SEEK_SET;
    if (whence == SeekWhence::Current) {
        w = SEEK_CUR;
    } else if (whence == SeekWhence::End) {
        w = SEEK_END;
    }
    const off_t r = ::lseek(fd, static_cast<off_t>(offset), w);
    if (r < 0) {
        return io_error(errno);
    }
    if (pos != nullptr) {
        *pos = static_cast<u64>(r);
    }
    return ok_status();
}

Status PosixFileOps::close(int fd) noexcept {
    // The descriptor is released even when close reports an error; never retry.
    if (::close(fd) != 0) {
        return io_error(errno);
    }
    return ok_status();
}

FileOps& default_file_ops() noexcept {
    static PosixFileOps ops;
    return ops;
}

} // namespace restor::restore
