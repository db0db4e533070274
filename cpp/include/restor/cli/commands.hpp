#pragma once

#include <type_traits>

#include "restor/cli/options.hpp"
#include "restor/core/errors.hpp"

namespace restor::cli {
    using u32 = restor::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Restore = 2,
        ZeroId = 3,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    restor::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace restor::cli
