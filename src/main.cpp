#include "cancel.hpp"
#include "duplicates.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "oplog.hpp"
#include "plan.hpp"
#include "report.hpp"
#include "transfer.hpp"

#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// The signal handler can only reach the token through a static.
xfer::CancellationToken interrupt_token;

void handle_interrupt(int) {
    interrupt_token.cancel();
}

void print_usage(const char* program) {
    std::cout << "Usage:\n"
              << "  " << program << " copy [options] <source>... <destination>\n"
              << "    --verify           Compare content fingerprints of every copied file.\n"
              << "    --jobs N           Number of concurrent copies (default: 2 x cores, 2..8).\n"
              << "    --pattern P        Copy only names ending in P (case-insensitive, repeatable; '*' = all).\n"
              << "    --chunk-size N     Bytes per read/write chunk (default: 1048576).\n"
              << "    --log FILE         Append an operation log to FILE.\n"
              << "    --retries N        Re-run failed files up to N more times.\n"
              << "    --quiet            Do not print per-file lines.\n"
              << "  " << program << " dups [options] <root>\n"
              << "    --min-size N       Ignore files smaller than N bytes (default: 1).\n"
              << "    --ext EXT          Only consider this extension (repeatable).\n"
              << "    --jobs N           Number of hashing threads.\n"
              << std::endl;
}

std::size_t parse_count(const std::string& option, const std::string& value) {
    std::size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(option + " expects a number, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument(option + " expects a number, got '" + value + "'");
    }
    return static_cast<std::size_t>(parsed);
}

std::string next_value(int& i, int argc, char** argv) {
    const std::string option = argv[i];
    if (i + 1 >= argc) {
        throw std::invalid_argument(option + " requires a value");
    }
    return argv[++i];
}

int run_copy(int argc, char** argv) {
    xfer::TransferOptions options;
    std::vector<std::string> patterns;
    std::string log_file;
    std::size_t retries = 0;
    std::vector<std::string> positional_args;

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--verify") {
            options.verify = true;
        } else if (arg == "--jobs") {
            options.concurrency = parse_count(arg, next_value(i, argc, argv));
        } else if (arg == "--pattern") {
            patterns.push_back(next_value(i, argc, argv));
        } else if (arg == "--chunk-size") {
            options.chunk_size = parse_count(arg, next_value(i, argc, argv));
        } else if (arg == "--log") {
            log_file = next_value(i, argc, argv);
        } else if (arg == "--retries") {
            retries = parse_count(arg, next_value(i, argc, argv));
        } else if (arg == "--quiet") {
            xfer::set_quiet(true);
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            positional_args.push_back(arg);
        }
    }

    if (positional_args.size() < 2) {
        std::cerr << "Error: expected at least one source and a destination.\n" << std::endl;
        print_usage(argv[0]);
        return 1;
    }
    if (patterns.empty()) {
        patterns.push_back("*");
    }

    const std::filesystem::path destination = positional_args.back();
    const std::vector<std::filesystem::path> sources(positional_args.begin(), positional_args.end() - 1);

    std::cout << "[1/2] Planning transfer..." << std::endl;
    const xfer::CopyPlan plan = xfer::plan_transfer(sources, destination, patterns);
    xfer::print_plan_summary(plan);

    std::unique_ptr<xfer::OperationLog> log;
    if (!log_file.empty()) {
        log = std::make_unique<xfer::OperationLog>(log_file);
    }

    std::cout << "[2/2] Copying files..." << std::endl;
    xfer::ConsoleProgressReporter reporter(std::cout);
    xfer::TransferCoordinator coordinator(options, &reporter, log.get());
    xfer::TransferResult result = coordinator.execute(plan, interrupt_token);

    for (std::size_t attempt = 1; attempt <= retries && !result.ok() && !result.cancelled; ++attempt) {
        const xfer::CopyPlan retry_plan = xfer::build_retry_plan(plan, result);
        std::cout << "    Retry " << attempt << "/" << retries << ": " << retry_plan.total_files << " failed files"
                  << std::endl;
        xfer::merge_retry(result, coordinator.execute(retry_plan, interrupt_token));
    }

    xfer::print_report(result);
    return result.ok() ? 0 : 1;
}

int run_dups(int argc, char** argv) {
    xfer::ScanOptions options;
    std::vector<std::string> positional_args;

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--min-size") {
            options.min_size = parse_count(arg, next_value(i, argc, argv));
        } else if (arg == "--ext") {
            options.extensions.push_back(next_value(i, argc, argv));
        } else if (arg == "--jobs") {
            options.threads = parse_count(arg, next_value(i, argc, argv));
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            positional_args.push_back(arg);
        }
    }

    if (positional_args.size() != 1) {
        std::cerr << "Error: expected exactly one directory to scan.\n" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    std::cout << "Scanning " << positional_args.front() << " for duplicate files..." << std::endl;
    xfer::ConsoleScanReporter reporter(std::cout);
    xfer::DuplicateScanner scanner(options, &reporter, &interrupt_token);
    const xfer::FingerprintIndex index = scanner.scan(positional_args.front());
    xfer::print_duplicates(index);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::signal(SIGINT, handle_interrupt);
    std::signal(SIGTERM, handle_interrupt);

    const std::string command = argv[1];
    try {
        if (command == "copy") {
            return run_copy(argc, argv);
        }
        if (command == "dups") {
            return run_dups(argc, argv);
        }
        if (command == "--help" || command == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        std::cerr << "Error: unknown command '" << command << "'.\n" << std::endl;
        print_usage(argv[0]);
        return 1;
    } catch (const std::invalid_argument& ex) {
        std::cerr << "Error: " << ex.what() << "\n" << std::endl;
        print_usage(argv[0]);
        return 1;
    } catch (const xfer::TransferError& ex) {
        std::cerr << (command == "copy" ? "Transfer" : "Scan") << " failed [" << xfer::to_string(ex.kind())
                  << "]: " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Operation failed: " << ex.what() << std::endl;
        return 1;
    }
}
