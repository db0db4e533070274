#pragma once

#include <cstddef>

#include "restor/core/errors.hpp"
#include "restor/core/types.hpp"
#include "restor/storage/buffer.hpp"

namespace restor::storage {
    [[nodiscard]] constexpr bool hash_is_zero(const restor::core::Hash256& h) noexcept {
        for (u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    restor::core::Status hash_compute(BufferView data, restor::core::Hash256* out) noexcept;

    // Writes 64 lowercase hex digits and a terminator; truncates when out_size is smaller.
    void hash_to_hex(const restor::core::Hash256& h, char* out, std::size_t out_size) noexcept;

} // namespace restor::storage
