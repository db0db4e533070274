#include "restor/cli/commands.hpp"

#include <cstring>

namespace restor::cli {
    restor::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        const restor::core::Status invalid =
            restor::core::make_status(restor::core::StatusDomain::Cli, restor::core::StatusCode::Invalid);
        if (out == nullptr || consumed == nullptr) {
            return invalid;
        }
        *consumed = 0;
        *out = CommandInvocation{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return invalid;
        }
        if (spec_count > 0 && specs == nullptr) {
            return invalid;
        }

        const char* name = args.argv[0];
        if (name[0] == '-') {
            return invalid;
        }

        for (u32 i = 0; i < spec_count; ++i) {
            if (specs[i].name != nullptr && std::strcmp(specs[i].name, name) == 0) {
                out->id = specs[i].id;
                out->args = CliArgs{args.argv + 1, args.argc - 1};
                *consumed = 1;
                return restor::core::ok_status();
            }
        }
        return invalid;
    }
} // namespace restor::cli
