#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "stash/cli/commands.hpp"
#include "stash/cli/options.hpp"
#include "stash/core/errors.hpp"
#include "stash/storage/hashing.hpp"
#include "stash/storage/object_store.hpp"

// ========================================================================
// Exit codes
// ========================================================================

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitStore = 2;

constexpr stash::core::u32 kMaxOptions = 16;

// ========================================================================
// Option tables
// ========================================================================

static const stash::cli::OptionSpec kGlobalOptions[] = {
    {stash::cli::OptionId::Data, stash::cli::OptionType::String, "data", 'd'},
    {stash::cli::OptionId::Db, stash::cli::OptionType::String, "db", '\0'},
    {stash::cli::OptionId::User, stash::cli::OptionType::I64, "user", 'u'},
    {stash::cli::OptionId::Verbose, stash::cli::OptionType::Flag, "verbose", 'v'},
};

static const stash::cli::OptionSpec kCommandOptions[] = {
    {stash::cli::OptionId::Visibility, stash::cli::OptionType::String, "visibility", '\0'},
    {stash::cli::OptionId::Group, stash::cli::OptionType::I64, "group", 'g'},
    {stash::cli::OptionId::Output, stash::cli::OptionType::String, "output", 'o'},
};

struct CliContext {
    stash::storage::ObjectStore* store{nullptr};
    stash::core::OwnerId user{stash::core::OwnerId::invalid()};
    const char* const* positional{nullptr};
    stash::cli::ParsedOptions options{};
};

// ========================================================================
// Error Handling
// ========================================================================

static void print_usage_error(const char* msg) {
    fprintf(stderr, "error: %s\n", msg);
    fprintf(stderr, "run 'stash help' for usage\n");
}

static int report(const char* context, stash::core::Status s) {
    fprintf(stderr, "error: %s: %s\n", context, stash::core::status_message(s));
    if (s.code == stash::core::StatusCode::Io && s.aux != 0) {
        spdlog::debug("{}: {}", context, std::strerror(static_cast<int>(s.aux)));
    }
    return kExitStore;
}

static bool parse_id(const char* text, stash::core::u64* out) {
    stash::core::u64 v = 0;
    if (!stash::storage::config_parse_u64(text ? text : "", &v) || v == 0) {
        return false;
    }
    *out = v;
    return true;
}

// ========================================================================
// Command Handlers
// ========================================================================

static void handle_help() {
    printf("usage: stash [--data DIR] [--db PATH] [--user ID] [--verbose] <command> ...\n");
    printf("\n");
    printf("Commands:\n");
    printf("  put FILE [--visibility V] [--group ID]  Store a file (V: private, public, unlisted)\n");
    printf("  get ID [-o PATH]                        Retrieve an object (stdout by default)\n");
    printf("  rm ID                                   Delete an object and its file\n");
    printf("  ls                                      List your objects\n");
    printf("  usage                                   Show stored bytes against the quota\n");
    printf("  verify ID                               Re-check an object's checksum\n");
    printf("  rename ID NAME                          Change an object's name\n");
    printf("  group-create TITLE [--visibility V]     Create a group (note)\n");
    printf("  group-rm ID                             Delete a group and its objects\n");
    printf("  help                                    Show this help\n");
    printf("\n");
    printf("Configuration is read from STASH_* environment variables.\n");
}

static int handle_put(const CliContext& ctx) {
    const char* path = ctx.positional[0];

    stash::storage::FileSource source;
    stash::core::Status s = source.open(path);
    if (!stash::core::is_ok(s)) {
        return report("put", s);
    }

    stash::storage::ObjectPutParams params;
    params.owner = ctx.user;
    params.source = &source;
    const char* slash = std::strrchr(path, '/');
    params.logical_name = slash ? slash + 1 : path;

    if (const auto* v = stash::cli::find_option(ctx.options, stash::cli::OptionId::Visibility)) {
        params.visibility = stash::core::parse_visibility(v->value.str);
    }
    if (const auto* g = stash::cli::find_option(ctx.options, stash::cli::OptionId::Group)) {
        if (g->value.i64v <= 0) {
            print_usage_error("put: --group must be a positive id");
            return kExitUsage;
        }
        params.group = stash::core::GroupId{static_cast<stash::core::u64>(g->value.i64v)};
    }

    stash::storage::ObjectPutResult result;
    s = ctx.store->put(params, &result);
    if (!stash::core::is_ok(s)) {
        return report("put", s);
    }

    const stash::core::StoredObject& obj = result.object;
    printf("%llu\t%s\t%llu\t%s\t%s\n",
        static_cast<unsigned long long>(obj.id.v),
        obj.logical_name.c_str(),
        static_cast<unsigned long long>(obj.size),
        obj.content_type.c_str(),
        stash::storage::hash_to_hex(obj.checksum).c_str());
    return kExitOk;
}

static int handle_get(const CliContext& ctx) {
    stash::core::u64 id = 0;
    if (!parse_id(ctx.positional[0], &id)) {
        print_usage_error("get: invalid object id");
        return kExitUsage;
    }

    const auto* out_opt = stash::cli::find_option(ctx.options, stash::cli::OptionId::Output);
    FILE* out = stdout;
    if (out_opt != nullptr) {
        out = fopen(out_opt->value.str, "wb");
        if (!out) {
            fprintf(stderr, "error: get: cannot open %s: %s\n", out_opt->value.str, std::strerror(errno));
            return kExitStore;
        }
    }

    const stash::storage::ChunkSink sink = [out](stash::storage::BufferView chunk) {
        if (fwrite(chunk.data, 1, chunk.len, out) != chunk.len) {
            return stash::core::make_status(stash::core::StatusDomain::Cli, stash::core::StatusCode::Io,
                static_cast<stash::core::u32>(errno));
        }
        return stash::core::ok_status();
    };

    stash::storage::ObjectGetResult result;
    stash::core::Status s = ctx.store->get_stream(ctx.user, stash::core::ObjectId{id}, sink, &result);

    if (out != stdout) {
        if (fclose(out) != 0 && stash::core::is_ok(s)) {
            s = stash::core::make_status(stash::core::StatusDomain::Cli, stash::core::StatusCode::Io,
                static_cast<stash::core::u32>(errno));
        }
        if (!stash::core::is_ok(s)) {
            std::remove(out_opt->value.str);
        }
    } else {
        fflush(stdout);
    }
    if (!stash::core::is_ok(s)) {
        return report("get", s);
    }

    FILE* meta = out == stdout ? stderr : stdout;
    fprintf(meta, "%s: %s\n", stash::storage::kDispositionHeader, result.content_disposition.c_str());
    fprintf(meta, "%s: %s\n", stash::storage::kChecksumHeader, result.checksum_hex.c_str());
    fprintf(meta, "Content-Type: %s\n", result.content_type.c_str());
    return kExitOk;
}

static int handle_remove(const CliContext& ctx) {
    stash::core::u64 id = 0;
    if (!parse_id(ctx.positional[0], &id)) {
        print_usage_error("rm: invalid object id");
        return kExitUsage;
    }
    const stash::core::Status s = ctx.store->remove(ctx.user, stash::core::ObjectId{id});
    if (!stash::core::is_ok(s)) {
        return report("rm", s);
    }
    return kExitOk;
}

static int handle_list(const CliContext& ctx) {
    std::vector<stash::core::StoredObject> objects;
    const stash::core::Status s = ctx.store->list(ctx.user, &objects);
    if (!stash::core::is_ok(s)) {
        return report("ls", s);
    }
    for (const stash::core::StoredObject& obj : objects) {
        printf("%llu\t%s\t%llu\t%s\t%s\n",
            static_cast<unsigned long long>(obj.id.v),
            obj.logical_name.c_str(),
            static_cast<unsigned long long>(obj.size),
            obj.content_type.c_str(),
            stash::core::visibility_name(obj.visibility));
    }
    return kExitOk;
}

static int handle_usage(const CliContext& ctx) {
    stash::core::u64 used = 0;
    const stash::core::Status s = ctx.store->usage(ctx.user, &used);
    if (!stash::core::is_ok(s)) {
        return report("usage", s);
    }
    printf("%llu / %llu bytes\n",
        static_cast<unsigned long long>(used),
        static_cast<unsigned long long>(ctx.store->config().max_owner_bytes));
    return kExitOk;
}

static int handle_verify(const CliContext& ctx) {
    stash::core::u64 id = 0;
    if (!parse_id(ctx.positional[0], &id)) {
        print_usage_error("verify: invalid object id");
        return kExitUsage;
    }
    bool valid = false;
    const stash::core::Status s = ctx.store->verify(ctx.user, stash::core::ObjectId{id}, &valid);
    if (!stash::core::is_ok(s)) {
        return report("verify", s);
    }
    printf("%s\n", valid ? "ok" : "corrupt");
    return valid ? kExitOk : kExitStore;
}

static int handle_rename(const CliContext& ctx) {
    stash::core::u64 id = 0;
    if (!parse_id(ctx.positional[0], &id)) {
        print_usage_error("rename: invalid object id");
        return kExitUsage;
    }
    const stash::core::Status s = ctx.store->rename(ctx.user, stash::core::ObjectId{id}, ctx.positional[1]);
    if (!stash::core::is_ok(s)) {
        return report("rename", s);
    }
    return kExitOk;
}

static int handle_group_create(const CliContext& ctx) {
    stash::core::Visibility visibility = stash::core::Visibility::Private;
    if (const auto* v = stash::cli::find_option(ctx.options, stash::cli::OptionId::Visibility)) {
        visibility = stash::core::parse_visibility(v->value.str);
    }
    stash::core::GroupId id = stash::core::GroupId::invalid();
    const stash::core::Status s = ctx.store->create_group(ctx.user, ctx.positional[0], visibility, &id);
    if (!stash::core::is_ok(s)) {
        return report("group-create", s);
    }
    printf("%llu\n", static_cast<unsigned long long>(id.v));
    return kExitOk;
}

static int handle_group_remove(const CliContext& ctx) {
    stash::core::u64 id = 0;
    if (!parse_id(ctx.positional[0], &id)) {
        print_usage_error("group-rm: invalid group id");
        return kExitUsage;
    }
    const stash::core::Status s = ctx.store->remove_group(ctx.user, stash::core::GroupId{id});
    if (!stash::core::is_ok(s)) {
        return report("group-rm", s);
    }
    return kExitOk;
}

// ========================================================================
// Entry point
// ========================================================================

int main(int argc, char** argv) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("stash"));
    spdlog::set_level(spdlog::level::warn);
    spdlog::cfg::load_env_levels();

    const stash::cli::CliArgs all{argv + 1, argc > 0 ? static_cast<stash::core::u32>(argc - 1) : 0};

    // Global options
    stash::cli::ParsedOption global_buf[kMaxOptions];
    stash::cli::ParsedOptions globals{global_buf, 0, kMaxOptions};
    stash::core::u32 consumed = 0;
    stash::core::Status s = stash::cli::parse_options(all, kGlobalOptions,
        sizeof(kGlobalOptions) / sizeof(kGlobalOptions[0]), &globals, &consumed);
    if (!stash::core::is_ok(s)) {
        print_usage_error("invalid global option");
        return kExitUsage;
    }
    if (stash::cli::find_option(globals, stash::cli::OptionId::Verbose)) {
        spdlog::set_level(spdlog::level::debug);
    }

    // Command
    stash::core::u32 command_count = 0;
    const stash::cli::CommandSpec* commands = stash::cli::default_commands(&command_count);
    const stash::cli::CliArgs rest{all.argv + consumed, all.argc - consumed};
    if (rest.argc == 0) {
        handle_help();
        return kExitUsage;
    }

    stash::cli::CommandInvocation cmd;
    s = stash::cli::parse_command(rest, commands, command_count, &cmd, &consumed);
    if (!stash::core::is_ok(s)) {
        print_usage_error(s.code == stash::core::StatusCode::NotFound ? "unknown command" : "missing arguments");
        return kExitUsage;
    }
    if (cmd.id == stash::cli::CommandId::Help) {
        handle_help();
        return kExitOk;
    }

    stash::core::u32 positional = 0;
    for (stash::core::u32 i = 0; i < command_count; ++i) {
        if (commands[i].id == cmd.id) {
            positional = commands[i].positional;
        }
    }

    // Command options follow the positionals
    CliContext ctx;
    stash::cli::ParsedOption command_buf[kMaxOptions];
    ctx.options = stash::cli::ParsedOptions{command_buf, 0, kMaxOptions};
    ctx.positional = cmd.args.argv;
    const stash::cli::CliArgs tail{cmd.args.argv + positional, cmd.args.argc - positional};
    s = stash::cli::parse_options(tail, kCommandOptions,
        sizeof(kCommandOptions) / sizeof(kCommandOptions[0]), &ctx.options, &consumed);
    if (!stash::core::is_ok(s) || consumed != tail.argc) {
        print_usage_error("unexpected arguments");
        return kExitUsage;
    }

    const auto* user = stash::cli::find_option(globals, stash::cli::OptionId::User);
    if (user == nullptr || user->value.i64v < 0) {
        print_usage_error("--user is required");
        return kExitUsage;
    }
    ctx.user = stash::core::OwnerId{static_cast<stash::core::u64>(user->value.i64v)};

    // Configuration: defaults, then environment, then flags
    stash::storage::ObjectStoreConfig cfg;
    s = stash::storage::config_from_env(&cfg);
    if (!stash::core::is_ok(s)) {
        fprintf(stderr, "error: invalid STASH_* configuration\n");
        return kExitUsage;
    }
    if (const auto* d = stash::cli::find_option(globals, stash::cli::OptionId::Data)) {
        cfg.data_root = d->value.str;
    }
    if (const auto* d = stash::cli::find_option(globals, stash::cli::OptionId::Db)) {
        cfg.db_path = d->value.str;
    }

    stash::storage::ObjectStore store;
    s = store.open(cfg);
    if (!stash::core::is_ok(s)) {
        return report("open", s);
    }
    ctx.store = &store;

    int rc = kExitUsage;
    switch (cmd.id) {
        case stash::cli::CommandId::Put:
            rc = handle_put(ctx);
            break;
        case stash::cli::CommandId::Get:
            rc = handle_get(ctx);
            break;
        case stash::cli::CommandId::Remove:
            rc = handle_remove(ctx);
            break;
        case stash::cli::CommandId::List:
            rc = handle_list(ctx);
            break;
        case stash::cli::CommandId::Usage:
            rc = handle_usage(ctx);
            break;
        case stash::cli::CommandId::Verify:
            rc = handle_verify(ctx);
            break;
        case stash::cli::CommandId::Rename:
            rc = handle_rename(ctx);
            break;
        case stash::cli::CommandId::GroupCreate:
            rc = handle_group_create(ctx);
            break;
        case stash::cli::CommandId::GroupRemove:
            rc = handle_group_remove(ctx);
            break;
        case stash::cli::CommandId::Help:
        case stash::cli::CommandId::None:
            break;
    }

    s = store.close();
    if (!stash::core::is_ok(s) && rc == kExitOk) {
        return report("close", s);
    }
    return rc;
}
