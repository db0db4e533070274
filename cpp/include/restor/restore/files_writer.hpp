#pragma once

#include <cstddef>
#include <type_traits>

#include "restor/core/errors.hpp"
#include "restor/core/types.hpp"
#include "restor/restore/file_ops.hpp"
#include "restor/restore/handle_cache.hpp"
#include "restor/storage/buffer.hpp"

namespace restor::restore {
    using u32 = restor::core::u32;
    using u64 = restor::core::u64;

    inline constexpr u32 kDefaultCacheCapacity = 16;

    struct FilesWriterConfig {
        u32 cache_capacity{kDefaultCacheCapacity}; // 0 = open and close on every write
    };

    // Filled by the write calls when non-null.
    struct WriteReport {
        u64 expected_bytes{0};
        u64 written_bytes{0};
        char path[1024]{};
    };

    // "error writing file <path>: wrong length written, want <n>, got <m>"
    void format_write_report(const WriteReport& r, char* out, std::size_t out_size) noexcept;

    // Writes restored content to destination files. Each file is written
    // sequentially from start to finish, but any number of files may be
    // written concurrently; calls for one path must not overlap.
    class FilesWriter {
    public:
        // `ops` must outlive the writer; null selects the POSIX implementation.
        explicit FilesWriter(const FilesWriterConfig& cfg, FileOps* ops = nullptr) noexcept;

        FilesWriter(const FilesWriter&) = delete;
        FilesWriter& operator=(const FilesWriter&) = delete;

        // Appends `data` to `path`, creating or truncating the file on the
        // first call for that path. A write that stores fewer bytes than
        // requested fails with StatusCode::ShortWrite.
        [[nodiscard]] restor::core::Status write_to_file(const char* path,
            restor::storage::BufferView data,
            WriteReport* report = nullptr) noexcept;

        // Appends kZeroBlockSize zero bytes to `path`, as a hole where the
        // platform and filesystem allow it.
        [[nodiscard]] restor::core::Status write_zeros(const char* path, WriteReport* report = nullptr) noexcept;

        // Ends the write sequence for `path`. A later write starts the file over.
        void close(const char* path) noexcept;

        [[nodiscard]] const HandleCache& cache() const noexcept { return cache_; }

    private:
        [[nodiscard]] restor::core::Status write_checked(const char* path,
            int fd,
            restor::storage::BufferView data,
            WriteReport* report) noexcept;

        FileOps& ops_;
        HandleCache cache_;
    };

    static_assert(std::is_trivially_copyable_v<FilesWriterConfig>);
    static_assert(std::is_trivially_copyable_v<WriteReport>);
} // namespace restor::restore
