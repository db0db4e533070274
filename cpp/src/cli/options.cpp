#include "restor/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace restor::cli {
    namespace {
        [[nodiscard]] restor::core::Status invalid() noexcept {
            return restor::core::make_status(restor::core::StatusDomain::Cli, restor::core::StatusCode::Invalid);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count, const char* name, size_t name_len) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strlen(s.long_name) == name_len &&
                    std::strncmp(s.long_name, name, name_len) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            if (out == nullptr || s == nullptr || *s == '\0') {
                return false;
            }
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] restor::core::Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->data == nullptr || out->len >= out->cap) {
                return invalid();
            }
            out->data[out->len++] = opt;
            return restor::core::ok_status();
        }

        // Parses `value` according to spec->type and appends the option.
        [[nodiscard]] restor::core::Status push_valued(ParsedOptions* out, const OptionSpec& spec, const char* value) noexcept {
            ParsedOption opt{};
            opt.id = spec.id;
            opt.type = spec.type;
            switch (spec.type) {
                case OptionType::String:
                    opt.value.str = value;
                    break;
                case OptionType::I64:
                    if (!parse_i64(value, &opt.value.i64v)) {
                        return invalid();
                    }
                    break;
                case OptionType::Flag:
                    return invalid();
            }
            return push_option(out, opt);
        }

        [[nodiscard]] restor::core::Status push_flag(ParsedOptions* out, const OptionSpec& spec) noexcept {
            ParsedOption opt{};
            opt.id = spec.id;
            opt.type = OptionType::Flag;
            opt.value.boolv = 1;
            return push_option(out, opt);
        }
    } // namespace

    restor::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return invalid();
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return invalid();
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const OptionSpec* spec = nullptr;
            const char* inline_value = nullptr;
            if (tok[1] == '-') {
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                const size_t name_len = eq != nullptr ? static_cast<size_t>(eq - name) : std::strlen(name);
                if (name_len == 0) {
                    return invalid();
                }
                spec = find_long(specs, spec_count, name, name_len);
                if (eq != nullptr) {
                    inline_value = eq + 1;
                }
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (tok[2] != '\0') {
                    inline_value = tok + 2;
                }
            }
            if (spec == nullptr) {
                return invalid();
            }

            restor::core::Status s{};
            if (spec->type == OptionType::Flag) {
                if (inline_value != nullptr) {
                    return invalid();
                }
                s = push_flag(out, *spec);
                ++i;
            } else if (inline_value != nullptr) {
                s = push_valued(out, *spec, inline_value);
                ++i;
            } else {
                if (i + 1 >= args.argc || args.argv[i + 1] == nullptr) {
                    return invalid();
                }
                s = push_valued(out, *spec, args.argv[i + 1]);
                i += 2;
            }
            if (!restor::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return restor::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (u32 i = 0; i < opts.len; ++i) {
            if (opts.data[i].id == id) {
                found = &opts.data[i];
            }
        }
        return found;
    }
} // namespace restor::cli
