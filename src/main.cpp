#include "beast_transport.hpp"
#include "client.hpp"
#include "config.hpp"
#include "memory_client.hpp"

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

struct Config {
    std::string              baseUrl   = "http://localhost:8080";
    std::string              apiKey;
    std::string              ns        = "default";
    int                      timeoutMs = 30000;
    int                      attempts  = 3;
    int                      delayMs   = 200;
    int                      limit     = 10;
    bool                     verbose   = false;
    std::string              command;
    std::vector<std::string> args;
};

static void printUsage() {
    std::cout
        << "Usage: memclient [options] <command> [args]\n\n"
        << "Commands:\n"
        << "  get KEY                 Print the value stored under KEY\n"
        << "  put KEY VALUE           Store VALUE under KEY\n"
        << "  delete KEY              Delete KEY (succeeds if already gone)\n"
        << "  exists KEY              Print true/false\n"
        << "  keys                    Stream every key in the namespace\n"
        << "  search QUERY [--limit N]  Stream search results\n\n"
        << "Options:\n"
        << "  --base-url URL   API base URL               (default: http://localhost:8080)\n"
        << "  --api-key KEY    API key                    (required)\n"
        << "  --namespace NS   Memory namespace           (default: default)\n"
        << "  --timeout-ms N   Per-request timeout in ms  (default: 30000)\n"
        << "  --attempts N     Total tries per request    (default: 3)\n"
        << "  --delay-ms N     Delay between tries in ms  (default: 200)\n"
        << "  --verbose        Enable verbose diagnostics\n"
        << "  --help, -h       Show this message\n";
}

static Config parseArgs(int argc, char* argv[]) {
    Config cfg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if ((arg == "--base-url") && i + 1 < argc) {
            cfg.baseUrl = argv[++i];
        } else if ((arg == "--api-key") && i + 1 < argc) {
            cfg.apiKey = argv[++i];
        } else if ((arg == "--namespace") && i + 1 < argc) {
            cfg.ns = argv[++i];
        } else if ((arg == "--timeout-ms") && i + 1 < argc) {
            cfg.timeoutMs = std::stoi(argv[++i]);
        } else if ((arg == "--attempts") && i + 1 < argc) {
            cfg.attempts = std::stoi(argv[++i]);
        } else if ((arg == "--delay-ms") && i + 1 < argc) {
            cfg.delayMs = std::stoi(argv[++i]);
        } else if ((arg == "--limit") && i + 1 < argc) {
            cfg.limit = std::stoi(argv[++i]);
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        } else if (cfg.command.empty()) {
            cfg.command = arg;
        } else {
            cfg.args.push_back(arg);
        }
    }

    if (cfg.apiKey.empty() || cfg.command.empty()) {
        printUsage();
        std::exit(1);
    }
    return cfg;
}

static void requireArgs(const Config& cfg, std::size_t count) {
    if (cfg.args.size() != count) {
        std::cerr << "'" << cfg.command << "' expects " << count << " argument(s)\n\n";
        printUsage();
        std::exit(1);
    }
}

static int fail(const memclient::ClientError& error) {
    std::cerr << "Error: " << memclient::describe(error) << "\n";
    return 1;
}

static int fail(const memclient::StreamError& error) {
    std::cerr << "Error: " << memclient::describe(error) << "\n";
    return 1;
}

template <typename T, typename Print>
static int drain(memclient::RecordStream<T>& stream, Print print) {
    std::size_t count = 0;
    for (;;) {
        auto step = stream.next();
        if (!step.ok()) {
            return fail(step.error());
        }
        if (!step.value()) {
            break;
        }
        print(*step.value());
        ++count;
    }
    std::cerr << count << " record(s)\n";
    return 0;
}

static int runCommand(const Config& cfg, const memclient::MemoryClient& memory) {
    using namespace memclient;

    if (cfg.command == "get") {
        requireArgs(cfg, 1);
        auto result = memory.get(cfg.args[0]);
        if (!result.ok()) {
            return fail(result.error());
        }
        if (!result.value()) {
            std::cerr << "Not found: " << cfg.args[0] << "\n";
            return 1;
        }
        std::cout << *result.value() << "\n";
        return 0;
    }

    if (cfg.command == "put") {
        requireArgs(cfg, 2);
        auto result = memory.put(cfg.args[0], cfg.args[1]);
        if (!result.ok()) {
            return fail(result.error());
        }
        std::cout << "stored " << cfg.args[0] << "\n";
        return 0;
    }

    if (cfg.command == "delete") {
        requireArgs(cfg, 1);
        auto result = memory.remove(cfg.args[0]);
        if (!result.ok()) {
            return fail(result.error());
        }
        std::cout << toString(result.value()) << "\n";
        return 0;
    }

    if (cfg.command == "exists") {
        requireArgs(cfg, 1);
        auto result = memory.exists(cfg.args[0]);
        if (!result.ok()) {
            return fail(result.error());
        }
        std::cout << (result.value() ? "true" : "false") << "\n";
        return 0;
    }

    if (cfg.command == "keys") {
        requireArgs(cfg, 0);
        auto opened = memory.listKeys();
        if (!opened.ok()) {
            return fail(opened.error());
        }
        auto stream = std::move(opened).value();
        return drain(stream, [](const std::string& key) { std::cout << key << "\n"; });
    }

    if (cfg.command == "search") {
        requireArgs(cfg, 1);
        SearchOptions options;
        options.limit = cfg.limit;
        auto opened = memory.streamSearch(cfg.args[0], options);
        if (!opened.ok()) {
            return fail(opened.error());
        }
        auto stream = std::move(opened).value();
        return drain(stream, [](const SearchResult& r) {
            std::cout << std::fixed << std::setprecision(3) << r.relevanceScore << "  "
                      << std::left << std::setw(32) << r.memory.key << "  "
                      << r.memory.value << "\n";
        });
    }

    std::cerr << "Unknown command: " << cfg.command << "\n\n";
    printUsage();
    return 1;
}

int main(int argc, char* argv[]) {
    try {
        Config cfg = parseArgs(argc, argv);

        if (cfg.verbose) {
            std::cerr
                << "=== memclient ===\n"
                << "Base URL:   " << cfg.baseUrl   << "\n"
                << "Namespace:  " << cfg.ns        << "\n"
                << "Timeout:    " << cfg.timeoutMs << " ms\n"
                << "Attempts:   " << cfg.attempts  << "\n"
                << "Delay:      " << cfg.delayMs   << " ms\n"
                << "=================\n";
        }

        memclient::ClientConfig config(memclient::BaseUrl(cfg.baseUrl),
                                       memclient::ApiKey(cfg.apiKey));
        config.timeout        = std::chrono::milliseconds(cfg.timeoutMs);
        config.retry.attempts = cfg.attempts;
        config.retry.delay    = std::chrono::milliseconds(cfg.delayMs);
        config.verbose        = cfg.verbose;

        auto transport = std::make_shared<memclient::BeastTransport>();
        transport->setVerbose(cfg.verbose);

        memclient::MemoryClient memory(memclient::Client(config, transport),
                                       memclient::Namespace(cfg.ns));

        return runCommand(cfg, memory);

    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
