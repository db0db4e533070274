#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "restor/cli/commands.hpp"
#include "restor/cli/options.hpp"
#include "restor/core/errors.hpp"
#include "restor/core/log.hpp"
#include "restor/restore/files_writer.hpp"
#include "restor/restore/planner.hpp"
#include "restor/restore/platform.hpp"
#include "restor/restore/zero_block.hpp"
#include "restor/storage/hashing.hpp"

// ========================================================================
// Exit Codes
// ========================================================================

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

// ========================================================================
// Configuration
// ========================================================================

struct CliConfig {
    restor::restore::FilesWriterConfig writer{};
    restor::core::u32 jobs{4};
    std::string dest{"."};
    bool verbose{false};
};

static const restor::cli::CommandSpec g_commands[] = {
    {restor::cli::CommandId::Help, "help"},
    {restor::cli::CommandId::Restore, "restore"},
    {restor::cli::CommandId::ZeroId, "zero-id"},
};

static const restor::cli::OptionSpec g_restore_options[] = {
    {restor::cli::OptionId::Cache, restor::cli::OptionType::I64, "cache", 'c'},
    {restor::cli::OptionId::Jobs, restor::cli::OptionType::I64, "jobs", 'j'},
    {restor::cli::OptionId::Dest, restor::cli::OptionType::String, "dest", 'd'},
    {restor::cli::OptionId::Verbose, restor::cli::OptionType::Flag, "verbose", 'v'},
};

// ========================================================================
// Error Handling
// ========================================================================

void print_status_error(const char* context, restor::core::Status s) {
    restor::core::log_error("%s failed (code=%s/%u, domain=%s/%u, aux=%u)",
        context,
        restor::core::status_code_name(s.code),
        static_cast<unsigned>(s.code),
        restor::core::status_domain_name(s.domain),
        static_cast<unsigned>(s.domain),
        s.aux);
    if (s.code == restor::core::StatusCode::Io && s.aux != 0) {
        restor::core::log_error("%s: %s", context, std::strerror(static_cast<int>(s.aux)));
    }
}

// Values outside [min, max] are rejected.
static bool to_u32(restor::core::i64 v, restor::core::u32 min, restor::core::u32 max, restor::core::u32* out) {
    if (v < static_cast<restor::core::i64>(min) || v > static_cast<restor::core::i64>(max)) {
        return false;
    }
    *out = static_cast<restor::core::u32>(v);
    return true;
}

static void load_env(CliConfig* cfg) {
    const char* cap = std::getenv("RESTOR_CACHE_CAPACITY");
    if (cap == nullptr || cap[0] == '\0') {
        return;
    }
    char* end = nullptr;
    const long v = std::strtol(cap, &end, 10);
    if (end == nullptr || *end != '\0' || v < 0 || v > 65536) {
        restor::core::log_info("ignoring invalid RESTOR_CACHE_CAPACITY=%s", cap);
        return;
    }
    cfg->writer.cache_capacity = static_cast<restor::core::u32>(v);
}

// ========================================================================
// Command Handlers
// ========================================================================

void handle_help() {
    printf("Usage: restor <command> [options] [args]\n");
    printf("\n");
    printf("Commands:\n");
    printf("  help              Show this help\n");
    printf("  zero-id           Show the zero block size and identity\n");
    printf("  restore [opts] <src..>\n");
    printf("                    Restore files into the destination directory\n");
    printf("                    Options: -d/--dest <dir>   destination (default .)\n");
    printf("                             -c/--cache <n>    idle handle cache size (default %u)\n",
        restor::restore::kDefaultCacheCapacity);
    printf("                             -j/--jobs <n>     concurrent files (default 4)\n");
    printf("                             -v/--verbose      print per-run statistics\n");
    printf("\n");
    printf("Environment: RESTOR_CACHE_CAPACITY, RESTOR_DEBUG\n");
}

int handle_zero_id() {
    const restor::restore::ZeroBlock& z = restor::restore::zero_block();
    char hex[65];
    restor::storage::hash_to_hex(z.id, hex, sizeof(hex));
    printf("size:   %u\n", z.size);
    printf("sparse: %s\n", restor::restore::sparse_files_supported() ? "yes" : "no");
    printf("id:     %s\n", restor::storage::hash_is_zero(z.id) ? "(none)" : hex);
    return kExitOk;
}

int handle_restore(CliConfig cfg, const restor::cli::CliArgs& args) {
    restor::cli::ParsedOption buf[16]{};
    restor::cli::ParsedOptions opts{buf, 0, 16};
    restor::core::u32 consumed = 0;
    restor::core::Status s = restor::cli::parse_options(args,
        g_restore_options,
        sizeof(g_restore_options) / sizeof(g_restore_options[0]),
        &opts,
        &consumed);
    if (!restor::core::is_ok(s)) {
        restor::core::log_error("restore: invalid options (see 'restor help')");
        return kExitUsage;
    }

    if (const restor::cli::ParsedOption* o = restor::cli::find_option(opts, restor::cli::OptionId::Cache)) {
        if (!to_u32(o->value.i64v, 0, 65536, &cfg.writer.cache_capacity)) {
            restor::core::log_error("restore: --cache must be between 0 and 65536");
            return kExitUsage;
        }
    }
    if (const restor::cli::ParsedOption* o = restor::cli::find_option(opts, restor::cli::OptionId::Jobs)) {
        if (!to_u32(o->value.i64v, 1, 1024, &cfg.jobs)) {
            restor::core::log_error("restore: --jobs must be between 1 and 1024");
            return kExitUsage;
        }
    }
    if (const restor::cli::ParsedOption* o = restor::cli::find_option(opts, restor::cli::OptionId::Dest)) {
        cfg.dest = o->value.str;
    }
    cfg.verbose = restor::cli::find_option(opts, restor::cli::OptionId::Verbose) != nullptr;

    if (consumed >= args.argc) {
        restor::core::log_error("restore: missing source path");
        return kExitUsage;
    }

    namespace fs = std::filesystem;

    const restor::core::u32 count = args.argc - consumed;
    std::vector<std::string> dst_paths;
    restor::core::u32 bad = 0;
    s = restor::restore::plan_destinations(cfg.dest.c_str(), args.argv + consumed, count, &dst_paths, &bad);
    if (s.code == restor::core::StatusCode::Invalid) {
        const char* src = args.argv[consumed + bad];
        if (!fs::path(src).has_filename()) {
            restor::core::log_error("restore: %s does not name a file", src);
        } else {
            restor::core::log_error("restore: %s would overwrite the restore of an earlier source with the same name", src);
        }
        return kExitUsage;
    }
    if (!restor::core::is_ok(s)) {
        print_status_error("restore", s);
        return kExitFailure;
    }

    std::error_code ec;
    fs::create_directories(cfg.dest, ec);
    if (ec) {
        restor::core::log_error("restore: cannot create %s: %s", cfg.dest.c_str(), ec.message().c_str());
        return kExitFailure;
    }

    std::vector<restor::restore::RestoreTask> tasks;
    tasks.reserve(count);
    for (restor::core::u32 i = 0; i < count; ++i) {
        tasks.push_back({args.argv[consumed + i], dst_paths[i].c_str()});
    }

    restor::restore::FilesWriter writer(cfg.writer);
    restor::restore::RestoreStats stats{};
    restor::core::u32 failed = 0;
    s = restor::restore::restore_files(writer,
        cfg.jobs,
        tasks.data(),
        static_cast<restor::core::u32>(tasks.size()),
        &stats,
        &failed);
    if (!restor::core::is_ok(s)) {
        const char* what = failed < tasks.size() ? tasks[failed].src_path : "restore";
        print_status_error(what, s);
        return kExitFailure;
    }

    if (cfg.verbose) {
        restor::core::log_info("restored %llu files, %llu bytes (%llu data chunks, %llu sparse blocks)",
            static_cast<unsigned long long>(stats.files),
            static_cast<unsigned long long>(stats.bytes),
            static_cast<unsigned long long>(stats.data_chunks),
            static_cast<unsigned long long>(stats.sparse_blocks));
    }
    return kExitOk;
}

// ========================================================================
// Main
// ========================================================================

int main(int argc, char** argv) {
    CliConfig cfg{};
    load_env(&cfg);

    if (argc < 2) {
        handle_help();
        return kExitUsage;
    }

    restor::cli::CommandInvocation cmd{};
    restor::core::u32 consumed = 0;
    const restor::cli::CliArgs args{argv + 1, static_cast<restor::core::u32>(argc - 1)};
    const restor::core::Status s = restor::cli::parse_command(args,
        g_commands,
        sizeof(g_commands) / sizeof(g_commands[0]),
        &cmd,
        &consumed);
    if (!restor::core::is_ok(s)) {
        restor::core::log_error("unknown command %s (see 'restor help')", argv[1]);
        return kExitUsage;
    }

    switch (cmd.id) {
        case restor::cli::CommandId::Help:
            handle_help();
            return kExitOk;
        case restor::cli::CommandId::ZeroId:
            return handle_zero_id();
        case restor::cli::CommandId::Restore:
            return handle_restore(cfg, cmd.args);
        case restor::cli::CommandId::None:
            break;
    }
    return kExitUsage;
}
