#pragma once

#include <type_traits>

#include "restor/core/types.hpp"

namespace restor::storage {
    using u8 = restor::core::u8;
    using u32 = restor::core::u32;

    struct BufferView {
        const u8* data{nullptr};
        u32 len{0};
    };

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
} // namespace restor::storage
