#pragma once

#include "restor/core/errors.hpp"
#include "restor/core/types.hpp"
#include "restor/storage/buffer.hpp"

namespace restor::restore {
    using u8 = restor::core::u8;
    using u64 = restor::core::u64;
    using i64 = restor::core::i64;

    enum class OpenMode : u8 {
        CreateTruncate = 0, // O_CREAT | O_TRUNC | O_WRONLY, 0600
        Append = 1,         // O_APPEND | O_WRONLY
    };

    enum class SeekWhence : u8 {
        Set = 0,
        Current = 1,
        End = 2,
    };

    // Filesystem primitives used by the writers. Failures carry errno in Status::aux.
    class FileOps {
    public:
        virtual ~FileOps() = default;

        [[nodiscard]] virtual restor::core::Status open(const char* path, OpenMode mode, int* out_fd) noexcept = 0;

        // One write call. *written may be less than data.len without an error.
        [[nodiscard]] virtual restor::core::Status write(int fd, restor::storage::BufferView data, u64* written) noexcept = 0;

        [[nodiscard]] virtual restor::core::Status truncate(int fd, u64 len) noexcept = 0;
        [[nodiscard]] virtual restor::core::Status seek(int fd, i64 offset, SeekWhence whence, u64* pos) noexcept = 0;
        [[nodiscard]] virtual restor::core::Status close(int fd) noexcept = 0;
    };

    class PosixFileOps : public FileOps {
    public:
        [[nodiscard]] restor::core::Status open(const char* path, OpenMode mode, int* out_fd) noexcept override;
        [[nodiscard]] restor::core::Status write(int fd, restor::storage::BufferView data, u64* written) noexcept override;
        [[nodiscard]] restor::core::Status truncate(int fd, u64 len) noexcept override;
        [[nodiscard]] restor::core::Status seek(int fd, i64 offset, SeekWhence whence, u64* pos) noexcept override;
        [[nodiscard]] restor::core::Status close(int fd) noexcept override;
    };

    [[nodiscard]] FileOps& default_file_ops() noexcept;
} // namespace restor::restore
