#include "commands/commands.hh"

#include <exception>
#include <optional>
#include <solrank/config.hh>
#include <solrank/errors.hh>
#include <solranklib/file_manip.hh>
#include <solranklib/logger.hh>
#include <string>
#include <string_view>
#include <unistd.h>
#include <utility>
#include <vector>

namespace {

constexpr const char DEFAULT_CONFIG_FILE[] = "solrank.conf";

struct Options {
    std::optional<std::string> config_file;
    // (config option name, value) in the order of appearance
    std::vector<std::pair<std::string, std::string>> overrides;
    bool verbose = false;
};

// Command-line option => config file option taking a value
constexpr std::pair<const char*, const char*> VALUE_OPTIONS[] = {
    {"--dataset", "dataset"},
    {"--timeout", "timeout"},
    {"--workers", "workers"},
    {"--python", "python_executable"},
    {"--memory-limit", "memory_limit_mib"},
    {"--time-ratio-threshold", "time_ratio_threshold"},
    {"--target-pool-size", "target_pool_size"},
    {"--soft-floor", "soft_floor_upper_bound"},
    {"--run-file-pattern", "run_file_pattern"},
};

/**
 * Parses options passed to solrank via arguments
 * @param argc like in main (will be modified to hold the number of non-option
 * parameters)
 * @param argv like in main (holds arguments)
 */
Options parse_options(int& argc, char** argv) {
    Options opts;
    int new_argc = 1;

    for (int i = 1; i < argc; ++i) {
        if (argv[i][0] != '-') {
            argv[new_argc++] = argv[i];
            continue;
        }

        std::string_view arg = argv[i];
        if ((arg == "-c" or arg == "--config") and i + 1 < argc) {
            opts.config_file = argv[++i];

        } else if (arg == "-h" or arg == "--help") {
            commands::help(argv[0]); // argv[0] is valid (argc > 1)
            _exit(0);

        } else if (arg == "-V" or arg == "--version") {
            commands::version();
            _exit(0);

        } else if (arg == "-v" or arg == "--verbose") {
            opts.verbose = true;

        } else if (arg == "-q" or arg == "--quiet") {
            stdlog.use(nullptr);

        } else if (arg == "--timeouts-from-record") {
            opts.overrides.emplace_back("timeouts_from_record", "true");

        } else if (arg == "--no-prompt") {
            opts.overrides.emplace_back("add_prompt", "false");

        } else {
            auto eq = arg.find('=');
            auto name = arg.substr(0, eq);
            bool known = false;
            for (auto [cli_name, option] : VALUE_OPTIONS) {
                if (name == cli_name) {
                    if (eq == std::string_view::npos) {
                        throw solrank::UsageError("option ", name, " requires a value: ", name, "=<value>");
                    }
                    opts.overrides.emplace_back(option, arg.substr(eq + 1));
                    known = true;
                    break;
                }
            }
            if (not known) {
                throw solrank::UsageError("unknown option: '", arg, '\'');
            }
        }
    }

    argc = new_argc;
    argv[argc] = nullptr;
    return opts;
}

solrank::Config load_config(const Options& opts) {
    solrank::Config config;
    if (opts.config_file) {
        config.load_from_file(*opts.config_file);
    } else if (is_regular_file(DEFAULT_CONFIG_FILE)) {
        config.load_from_file(DEFAULT_CONFIG_FILE);
    }
    for (const auto& [name, value] : opts.overrides) {
        config.set_option(name, value);
    }
    return config;
}

void run_command(const solrank::Config& config, int argc, char** argv) {
    ArgvParser args(argc - 1, argv + 1);
    auto command = args.extract_next();

    if (command == "combine") {
        return commands::combine(config, args);
    }
    if (command == "execute") {
        return commands::execute(config, args);
    }
    if (command == "filter") {
        return commands::filter(config, args);
    }
    if (command == "help") {
        return commands::help(argv[0]);
    }
    if (command == "version") {
        return commands::version();
    }

    throw solrank::UsageError("unknown command: ", command);
}

int real_main(int argc, char** argv) {
    stdlog.use(stdout);

    try {
        auto opts = parse_options(argc, argv);
        if (opts.verbose) {
            debuglog.use(stderr);
            commands::version();
        }
        if (argc < 2) {
            commands::help(argv[0]);
            return 1;
        }

        auto config = load_config(opts);
        debuglog(
            "Config: dataset=",
            solrank::to_str(config.dataset),
            " workers=",
            config.workers,
            " python=",
            config.python_executable,
            " run_file_pattern=",
            config.run_file_pattern
        );
        run_command(config, argc, argv);
    } catch (const solrank::UsageError& e) {
        errlog("\033[1;31mError\033[m: ", e.what());
        return 1;
    } catch (const solrank::InvariantViolation& e) {
        errlog("\033[1;31mInvariant violation\033[m: ", e.what());
        return 1;
    } catch (const std::exception& e) {
        errlog("\033[1;31mError\033[m: ", e.what());
        return 1;
    }

    return 0;
}

} // namespace

int main(int argc, char** argv) { return real_main(argc, argv); }
