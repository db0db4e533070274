#pragma once

#include "restor/core/types.hpp"
#include "restor/storage/buffer.hpp"

namespace restor::restore {
    using u32 = restor::core::u32;

    // Minimum chunk size of the content-defined chunker (512 KiB). No chunk
    // shorter than this can be all zeros and still be written sparsely.
    inline constexpr u32 kZeroBlockSize = 512u * 1024u;

    struct ZeroBlock {
        const restor::core::u8* data{nullptr};
        u32 size{0};
        // BLAKE3 of `size` zero bytes; the null identity when sparse files
        // are not supported, so that nothing ever matches it.
        restor::core::Hash256 id{};

        [[nodiscard]] restor::storage::BufferView view() const noexcept {
            return restor::storage::BufferView{data, size};
        }
    };

    // Process-wide, computed on first use and immutable afterwards.
    [[nodiscard]] const ZeroBlock& zero_block() noexcept;

    // True when a chunk with identity `id` may be restored with write_zeros.
    [[nodiscard]] bool is_zero_block_id(const restor::core::Hash256& id) noexcept;
} // namespace restor::restore
