#ifndef _GNU_SOURCE
#define _GNU_SOURCE
#endif

#include <algorithm>
#include <getopt.h>
#include <iomanip>
#include <iostream>
#include <string>
#include <unistd.h>
#include <vector>

#include "bantubox/config.h"
#include "bantubox/errors.h"
#include "bantubox/filesystem.h"
#include "bantubox/kernel.h"
#include "bantubox/options.h"
#include "bantubox/state.h"
#include "bantubox/supervisor.h"

enum GlobalOptionValue {
    OPT_DEBUG = 1000,
    OPT_LOG,
    OPT_CONFIG,
    OPT_ROOT,
    OPT_CGROUP_ROOT,
    OPT_VERSION,
    OPT_HELP
};

enum RunOptionValue {
    OPT_CPU_SHARES = 2000,
    OPT_MEMORY,
    OPT_MEMORY_SWAP,
    OPT_HANDSHAKE_TIMEOUT
};

struct RunCommandOptions {
    std::string image;
    bool has_cpu_shares = false;
    long long cpu_shares = 0;
    bool has_memory = false;
    long long memory = 0;
    bool has_memory_swap = false;
    long long memory_swap = 0;
    int handshake_timeout_ms = 0;
    std::vector<std::string> command;
};

struct StopOptions {
    std::string id;
    int timeout_sec = 10;
};

RuntimeConfig g_runtime_config;

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [global options] <command> [arguments]\n"
              << "\n"
              << "Global options:\n"
              << "  --debug                 Enable verbose debug logging\n"
              << "  --log <path>            Write logs to the given file\n"
              << "  --config <path>         Read settings from a JSON file (default: <root>/bantubox.json)\n"
              << "  --root <path>           Directory holding images/ and containers/ (default: /bantubox)\n"
              << "  --cgroup-root <path>    cgroup filesystem mount point (default: /sys/fs/cgroup)\n"
              << "  --help                  Show this help message\n"
              << "  --version               Show version information\n"
              << "\n"
              << "Commands:\n"
              << "  run [options] <command> [args...]  Run a command in a new container\n"
              << "  list                               List registered containers\n"
              << "  stop [-t seconds] <id>             Stop a running container\n"
              << "  delete <id>                        Release what a dead container left behind\n"
              << "\n"
              << "run options:\n"
              << "  -i, --image <name>        Base image under <root>/images (default: " << DEFAULT_IMAGE << ")\n"
              << "  --cpu-shares <n>          CPU shares (relative weight)\n"
              << "  --memory <size>           Memory limit, bytes or with k/m/g suffix\n"
              << "  --memory-swap <size>      Memory plus swap limit, -1 for unlimited swap\n"
              << "  --handshake-timeout <ms>  Bound on each setup handshake wait\n"
              << std::endl;
}

bool parse_run_options(int argc, char* const argv[], RunCommandOptions& options) {
    static struct option run_long_options[] = {
            {"image", required_argument, nullptr, 'i'},
            {"image-name", required_argument, nullptr, 'i'},
            {"cpu-shares", required_argument, nullptr, OPT_CPU_SHARES},
            {"memory", required_argument, nullptr, OPT_MEMORY},
            {"memory-swap", required_argument, nullptr, OPT_MEMORY_SWAP},
            {"handshake-timeout", required_argument, nullptr, OPT_HANDSHAKE_TIMEOUT},
            {nullptr, 0, nullptr, 0}
    };

    opterr = 0;
    optind = 1;

    int option;
    while ((option = getopt_long(argc, argv, "+i:", run_long_options, nullptr)) != -1) {
        switch (option) {
            case 'i':
                options.image = optarg;
                if (options.image.empty()) {
                    std::cerr << "Error: image name must not be empty." << std::endl;
                    optind = 1;
                    return false;
                }
                break;
            case OPT_CPU_SHARES:
                try {
                    options.cpu_shares = std::stoll(optarg);
                    options.has_cpu_shares = true;
                } catch (const std::exception&) {
                    std::cerr << "Invalid value for --cpu-shares: " << optarg << std::endl;
                    optind = 1;
                    return false;
                }
                if (options.cpu_shares < 0) {
                    std::cerr << "Invalid value for --cpu-shares: " << optarg << std::endl;
                    optind = 1;
                    return false;
                }
                break;
            case OPT_MEMORY:
            case OPT_MEMORY_SWAP:
                try {
                    long long size = parse_memory_size(optarg);
                    if (option == OPT_MEMORY) {
                        options.memory = size;
                        options.has_memory = true;
                    } else {
                        options.memory_swap = size;
                        options.has_memory_swap = true;
                    }
                } catch (const std::exception& e) {
                    std::cerr << "Error: " << e.what() << std::endl;
                    optind = 1;
                    return false;
                }
                break;
            case OPT_HANDSHAKE_TIMEOUT:
                try {
                    options.handshake_timeout_ms = std::stoi(optarg);
                } catch (const std::exception&) {
                    options.handshake_timeout_ms = 0;
                }
                if (options.handshake_timeout_ms <= 0) {
                    std::cerr << "Invalid value for --handshake-timeout: " << optarg << std::endl;
                    optind = 1;
                    return false;
                }
                break;
            case '?': {
                int idx = std::max(0, optind - 1);
                std::cerr << "Unknown run option: " << argv[idx] << std::endl;
                optind = 1;
                return false;
            }
            default:
                std::cerr << "Unknown run option encountered." << std::endl;
                optind = 1;
                return false;
        }
    }

    if (optind >= argc) {
        std::cerr << "Error: a command to run is required." << std::endl;
        optind = 1;
        return false;
    }
    for (int i = optind; i < argc; ++i) {
        options.command.emplace_back(argv[i]);
    }

    optind = 1;
    return true;
}

bool parse_stop_options(int argc, char* const argv[], StopOptions& options) {
    static struct option stop_long_options[] = {
            {"time", required_argument, nullptr, 't'},
            {nullptr, 0, nullptr, 0}
    };

    opterr = 0;
    optind = 1;

    int option;
    while ((option = getopt_long(argc, argv, "+t:", stop_long_options, nullptr)) != -1) {
        switch (option) {
            case 't':
                try {
                    options.timeout_sec = std::stoi(optarg);
                } catch (const std::exception&) {
                    options.timeout_sec = -1;
                }
                if (options.timeout_sec < 0) {
                    std::cerr << "Invalid value for --time: " << optarg << std::endl;
                    optind = 1;
                    return false;
                }
                break;
            case '?': {
                int idx = std::max(0, optind - 1);
                std::cerr << "Unknown stop option: " << argv[idx] << std::endl;
                optind = 1;
                return false;
            }
            default:
                std::cerr << "Unknown stop option encountered." << std::endl;
                optind = 1;
                return false;
        }
    }

    if (optind >= argc) {
        std::cerr << "Error: Container id is required." << std::endl;
        optind = 1;
        return false;
    }
    options.id = argv[optind];
    if (optind + 1 < argc) {
        std::cerr << "Error: Unexpected argument: " << argv[optind + 1] << std::endl;
        optind = 1;
        return false;
    }

    optind = 1;
    return true;
}

RunOptions build_run_options(const RunCommandOptions& command_options, const RuntimeConfig& config) {
    RunOptions options;
    options.image = command_options.image.empty() ? config.default_image : command_options.image;
    options.command = command_options.command;
    options.limits = config.resources;
    if (command_options.has_cpu_shares) {
        options.limits.cpu_shares = command_options.cpu_shares;
    }
    if (command_options.has_memory) {
        options.limits.memory_limit = command_options.memory;
    }
    if (command_options.has_memory_swap) {
        options.limits.memory_swap = command_options.memory_swap;
    }
    options.handshake_timeout_ms = command_options.handshake_timeout_ms > 0
            ? command_options.handshake_timeout_ms
            : config.handshake_timeout_ms;
    options.images_dir = images_dir();
    options.containers_dir = containers_dir();
    options.cgroup_root = g_global_options.cgroup_root;
    return options;
}

// Loads the JSON config (explicit --config, or <root>/bantubox.json when
// present). Flags given on the command line win over the file.
bool load_global_config(bool root_from_flag, bool cgroup_root_from_flag) {
    std::string path = g_global_options.config_path;
    if (path.empty()) {
        std::string candidate = path_join(g_global_options.root_path, CONFIG_FILE_NAME);
        if (access(candidate.c_str(), F_OK) != 0) {
            return true;
        }
        path = candidate;
    }
    try {
        g_runtime_config = load_runtime_config(path);
    } catch (const std::exception& e) {
        std::cerr << "Error processing config file " << path << ": " << e.what() << std::endl;
        return false;
    }
    log_debug("Loaded configuration from " + path);
    if (!root_from_flag && !g_runtime_config.root_path.empty()) {
        g_global_options.root_path = trim_trailing_slashes(g_runtime_config.root_path);
    }
    if (!cgroup_root_from_flag && !g_runtime_config.cgroup_root.empty()) {
        g_global_options.cgroup_root = trim_trailing_slashes(g_runtime_config.cgroup_root);
    }
    return true;
}

int run_command(int argc, char* const argv[]) {
    RunCommandOptions command_options;
    if (!parse_run_options(argc, argv, command_options)) {
        return kUsageExitCode;
    }
    RunOptions options = build_run_options(command_options, g_runtime_config);

    LinuxKernelOps kernel;
    try {
        return run_container(kernel, options);
    } catch (const ContainerError& e) {
        std::cerr << "Error: " << e.describe() << std::endl;
        return setup_failure_exit_code(e.kind());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return setup_failure_exit_code(ErrorKind::Generic);
    }
}

int list_command() {
    ContainerRegistry registry(containers_dir());
    std::vector<ContainerRecord> records = registry.list();
    if (records.empty()) {
        std::cout << "No containers available." << std::endl;
        return 0;
    }
    std::cout << std::left << std::setw(38) << "ID" << std::setw(18) << "STATUS" << std::setw(8) << "PID"
              << std::setw(16) << "IMAGE" << "COMMAND" << std::endl;
    for (const auto& record : records) {
        std::cout << std::left << std::setw(38) << record.id << std::setw(18) << record.status
                  << std::setw(8) << (record.pid > 0 ? std::to_string(record.pid) : "-")
                  << std::setw(16) << record.image << join_strings(record.command, " ") << std::endl;
    }
    return 0;
}

int stop_command(int argc, char* const argv[]) {
    StopOptions options;
    if (!parse_stop_options(argc, argv, options)) {
        return kUsageExitCode;
    }
    ContainerRegistry registry(containers_dir());
    try {
        if (!stop_container(registry, options.id, options.timeout_sec)) {
            std::cerr << "Container " << options.id << " is not running" << std::endl;
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    std::cout << options.id << std::endl;
    return 0;
}

int delete_command(int argc, char* const argv[]) {
    if (argc != 2) {
        std::cerr << "Error: delete takes exactly one container id." << std::endl;
        return kUsageExitCode;
    }
    const std::string id = argv[1];
    ContainerRegistry registry(containers_dir());
    LinuxKernelOps kernel;
    std::vector<std::string> errors;
    try {
        errors = delete_container(kernel, registry, containers_dir(), g_global_options.cgroup_root, id);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    if (!errors.empty()) {
        for (const auto& error : errors) {
            std::cerr << "Error: " << error << std::endl;
        }
        return 1;
    }
    std::cout << "Container " << id << " deleted." << std::endl;
    return 0;
}

int main(int argc, char* argv[]) {
    opterr = 0;
    optind = 1;

    static struct option global_long_options[] = {
            {"debug", no_argument, nullptr, OPT_DEBUG},
            {"log", required_argument, nullptr, OPT_LOG},
            {"config", required_argument, nullptr, OPT_CONFIG},
            {"root", required_argument, nullptr, OPT_ROOT},
            {"cgroup-root", required_argument, nullptr, OPT_CGROUP_ROOT},
            {"version", no_argument, nullptr, OPT_VERSION},
            {"help", no_argument, nullptr, OPT_HELP},
            {nullptr, 0, nullptr, 0}
    };

    bool root_from_flag = false;
    bool cgroup_root_from_flag = false;
    int global_opt;
    while ((global_opt = getopt_long(argc, argv, "+", global_long_options, nullptr)) != -1) {
        switch (global_opt) {
            case OPT_DEBUG:
                g_global_options.debug = true;
                break;
            case OPT_LOG:
                g_global_options.log_path = optarg;
                if (!configure_log_destination(g_global_options.log_path)) {
                    return 1;
                }
                break;
            case OPT_CONFIG:
                g_global_options.config_path = optarg;
                break;
            case OPT_ROOT:
                g_global_options.root_path = trim_trailing_slashes(optarg ? optarg : "");
                if (g_global_options.root_path.empty()) {
                    g_global_options.root_path = "/";
                }
                root_from_flag = true;
                break;
            case OPT_CGROUP_ROOT:
                g_global_options.cgroup_root = trim_trailing_slashes(optarg ? optarg : "");
                if (g_global_options.cgroup_root.empty()) {
                    std::cerr << "Error: --cgroup-root must not be empty." << std::endl;
                    return kUsageExitCode;
                }
                cgroup_root_from_flag = true;
                break;
            case OPT_VERSION:
                std::cout << "BantuBox version " << BANTUBOX_VERSION << std::endl;
                return 0;
            case OPT_HELP:
                print_usage(argv[0]);
                return 0;
            case '?': {
                int idx = std::max(0, optind - 1);
                std::cerr << "Unknown global option: " << argv[idx] << std::endl;
                print_usage(argv[0]);
                return kUsageExitCode;
            }
            default:
                std::cerr << "Unknown option encountered." << std::endl;
                return kUsageExitCode;
        }
    }

    if (optind >= argc) {
        print_usage(argv[0]);
        return kUsageExitCode;
    }

    char** command_argv = argv + optind;
    int command_argc = argc - optind;
    std::string command = command_argv[0];

    if (!load_global_config(root_from_flag, cgroup_root_from_flag)) {
        return kUsageExitCode;
    }

    if (command == "run") {
        return run_command(command_argc, command_argv);
    } else if (command == "list") {
        if (command_argc != 1) {
            print_usage(argv[0]);
            return kUsageExitCode;
        }
        return list_command();
    } else if (command == "stop") {
        return stop_command(command_argc, command_argv);
    } else if (command == "delete") {
        return delete_command(command_argc, command_argv);
    }

    std::cerr << "Error: Unknown command '" << command << "'" << std::endl;
    print_usage(argv[0]);
    return kUsageExitCode;
}
