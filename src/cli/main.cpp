// uidkit: command-line front end for the identifier generators.
//
//     uidkit v3 dns www.example.com
//     uidkit v4 5
//     uidkit --config ids.toml prefixed orders
//     uidkit inspect 65f1c3a2a1b2c3004d000001
//
// Errors are printed in the UidError format and exit with status 1.

#include <uidkit/config.hpp>
#include <uidkit/generator.hpp>
#include <uidkit/log.hpp>
#include <uidkit/result.hpp>

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace uidkit;

static const char* USAGE =
    "usage: uidkit [--config FILE] [--verbose] <command> [args]\n"
    "\n"
    "commands:\n"
    "  v3 <namespace> <name>   name-based UUID (MD5)\n"
    "  v4 [count]              random UUID\n"
    "  v5 <namespace> <name>   name-based UUID (SHA-1)\n"
    "  valid <candidate>       check UUID shape\n"
    "  oid [count]             object id\n"
    "  prefixed <namespace>    checksum-prefixed object id\n"
    "  inspect <object-id>     decode object id fields\n"
    "\n"
    "<namespace> for v3/v5 is a UUID or one of: dns, url, oid, x500\n";

struct Invocation {
    std::string config_path;
    bool verbose = false;
    std::string command;
    std::vector<std::string> args;
};

Result<Invocation> parse_args(int argc, char** argv) {
    Invocation inv;
    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                return UidError{UidError::InvalidArg,
                    "--config requires a file argument", "usage: uidkit --config FILE <command>"};
            }
            inv.config_path = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            inv.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            inv.command = "help";
            return Result<Invocation>::ok(inv);
        } else {
            break;
        }
    }

    if (i >= argc) {
        return UidError{UidError::InvalidArg, "no command given", "run 'uidkit --help'"};
    }
    inv.command = argv[i++];
    for (; i < argc; ++i) {
        inv.args.emplace_back(argv[i]);
    }
    return Result<Invocation>::ok(inv);
}

Result<Config> load_config(const Invocation& inv) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    if (!global_path.empty() && fs::exists(global_path)) {
        auto cfg = Config::load(global_path);
        UIDKIT_TRY(cfg);
        log::debug("loaded %s", global_path.c_str());
        global = std::move(cfg).value();
    }

    std::optional<Config> local;
    if (!inv.config_path.empty()) {
        auto cfg = Config::load(inv.config_path);
        UIDKIT_TRY(cfg);
        log::debug("loaded %s", inv.config_path.c_str());
        local = std::move(cfg).value();
    }

    return Result<Config>::ok(Config::effective(global, local));
}

Status expect_args(const Invocation& inv, size_t min, size_t max, const char* usage) {
    if (inv.args.size() < min || inv.args.size() > max) {
        return UidError{UidError::InvalidArg,
            "wrong number of arguments for '" + inv.command + "'",
            std::string("usage: uidkit ") + usage};
    }
    return ok_status();
}

Result<int> parse_count(const Invocation& inv) {
    if (inv.args.empty()) return Result<int>::ok(1);

    const std::string& raw = inv.args[0];
    int count = 0;
    for (char c : raw) {
        if (c < '0' || c > '9' || count > 1000000) {
            return UidError{UidError::InvalidArg,
                "invalid count: '" + raw + "'", "expected a positive integer up to 1000000"};
        }
        count = count * 10 + (c - '0');
    }
    if (count < 1 || count > 1000000) {
        return UidError{UidError::InvalidArg,
            "invalid count: '" + raw + "'", "expected a positive integer up to 1000000"};
    }
    return Result<int>::ok(count);
}

std::string resolve_namespace(const std::string& ns) {
    if (auto known = well_known_namespace(ns)) {
        return *known;
    }
    return ns;
}

Result<int> run(const Invocation& inv, IdGenerator& gen) {
    const std::string& cmd = inv.command;

    if (cmd == "v3" || cmd == "v5") {
        UIDKIT_TRY(expect_args(inv, 2, 2, "v3|v5 <namespace> <name>"));
        std::string ns = resolve_namespace(inv.args[0]);
        auto id = cmd == "v3" ? gen.uuid_v3(ns, inv.args[1]) : gen.uuid_v5(ns, inv.args[1]);
        UIDKIT_TRY(id);
        std::cout << id.value() << "\n";
        return Result<int>::ok(0);
    }

    if (cmd == "v4" || cmd == "oid") {
        UIDKIT_TRY(expect_args(inv, 0, 1, "v4|oid [count]"));
        auto count = parse_count(inv);
        UIDKIT_TRY(count);
        for (int i = 0; i < count.value(); ++i) {
            std::cout << (cmd == "v4" ? gen.uuid_v4() : gen.object_id()) << "\n";
        }
        return Result<int>::ok(0);
    }

    if (cmd == "valid") {
        UIDKIT_TRY(expect_args(inv, 1, 1, "valid <candidate>"));
        bool ok = IdGenerator::is_valid_uuid(inv.args[0]);
        std::cout << (ok ? "valid" : "invalid") << "\n";
        return Result<int>::ok(ok ? 0 : 1);
    }

    if (cmd == "prefixed") {
        UIDKIT_TRY(expect_args(inv, 1, 1, "prefixed <namespace>"));
        std::cout << gen.prefixed_id(inv.args[0]) << "\n";
        return Result<int>::ok(0);
    }

    if (cmd == "inspect") {
        UIDKIT_TRY(expect_args(inv, 1, 1, "inspect <object-id>"));
        auto oid = ObjectId::from_string(inv.args[0]);
        UIDKIT_TRY(oid);

        std::time_t ts = static_cast<std::time_t>(oid.value().timestamp);
        char when[32] = "";
        if (const std::tm* utc = std::gmtime(&ts)) {
            std::strftime(when, sizeof(when), "%Y-%m-%dT%H:%M:%SZ", utc);
        }

        std::printf("timestamp  %u (%s)\n", oid.value().timestamp, when);
        std::printf("machine    %06x\n", oid.value().machine_id);
        std::printf("pid        %u\n", static_cast<unsigned>(oid.value().process_id));
        std::printf("counter    %06x\n", oid.value().counter);
        return Result<int>::ok(0);
    }

    return UidError{UidError::InvalidArg, "unknown command: '" + cmd + "'", "run 'uidkit --help'"};
}

int main(int argc, char** argv) {
    auto inv = parse_args(argc, argv);
    if (inv.is_err()) {
        std::cerr << inv.error().format() << "\n";
        return 1;
    }
    if (inv.value().command == "help") {
        std::cout << USAGE;
        return 0;
    }

    auto cfg = load_config(inv.value());
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 1;
    }
    cfg.value().apply_logging();
    if (inv.value().verbose) {
        log::set_level(log::Debug);
    }

    IdGenerator gen(cfg.value().generator_options());

    auto result = run(inv.value(), gen);
    if (result.is_err()) {
        log::error("%s failed", inv.value().command.c_str());
        std::cerr << result.error().format() << "\n";
        return 1;
    }
    return result.value();
}
