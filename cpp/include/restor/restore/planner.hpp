#pragma once

#include <string>
#include <type_traits>
#include <vector>

#include "restor/core/errors.hpp"
#include "restor/core/types.hpp"
#include "restor/restore/files_writer.hpp"

namespace restor::restore {
    using u32 = restor::core::u32;
    using u64 = restor::core::u64;

    struct RestoreTask {
        const char* src_path{nullptr};
        const char* dst_path{nullptr};
    };

    struct RestoreStats {
        u64 files{0};
        u64 bytes{0};         // logical bytes restored, holes included
        u64 data_chunks{0};   // chunks passed to write_to_file
        u64 sparse_blocks{0}; // chunks passed to write_zeros
    };

    // Copies `src_path` to `dst_path` through `writer` in kZeroBlockSize
    // chunks. Chunks whose identity matches the zero block are written with
    // write_zeros. The destination is closed in the writer when done.
    [[nodiscard]] restor::core::Status restore_file(FilesWriter& writer,
        const char* src_path,
        const char* dst_path,
        RestoreStats* stats) noexcept;

    // Maps each source to `dest_dir/<file name of source>`. Fails with Invalid
    // when a source has no file name or two sources share one destination;
    // `bad` then receives the index of the offending source.
    [[nodiscard]] restor::core::Status plan_destinations(const char* dest_dir,
        const char* const* srcs,
        u32 count,
        std::vector<std::string>* dst_paths,
        u32* bad = nullptr) noexcept;

    // Restores `count` tasks on `jobs` threads, one file per thread at a time.
    // All tasks are attempted; the first failure is returned and, when
    // `failed` is non-null, its task index is stored there. Tasks sharing a
    // destination are rejected with Invalid before anything is written.
    [[nodiscard]] restor::core::Status restore_files(FilesWriter& writer,
        u32 jobs,
        const RestoreTask* tasks,
        u32 count,
        RestoreStats* stats,
        u32* failed = nullptr) noexcept;

    static_assert(std::is_trivially_copyable_v<RestoreTask>);
    static_assert(std::is_trivially_copyable_v<RestoreStats>);
} // namespace restor::restore
