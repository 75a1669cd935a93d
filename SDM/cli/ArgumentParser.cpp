#include "ArgumentParser.h"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace {
std::size_t parseCount(const char* text, const char* what) {
    // stoull accepts a sign and wraps "-1" around
    if (std::string(text).find('-') != std::string::npos)
        throw std::invalid_argument(std::string("invalid ") + what + ": " + text);

    std::size_t used = 0;
    const unsigned long long value = std::stoull(text, &used);
    if (text[used] != '\0')
        throw std::invalid_argument(std::string("invalid ") + what + ": " + text);
    return static_cast<std::size_t>(value);
}
}

std::string ArgumentParser::deriveOutputFromUrl(const std::string& url) {
    std::string name = url;

    auto special = name.find_first_of("?#");
    if (special != std::string::npos)
        name = name.substr(0, special);

    // Get file name from url
    auto slash = name.find_last_of('/');
    if (slash != std::string::npos)
        name = name.substr(slash + 1);

    if (name.empty())
        name = "download";

    return name;
}

bool ArgumentParser::parse(int argc, char* argv[], TransferConfig& out) {
    if (argc < 2) {
        printUsage();
        return false;
    }

    out = TransferConfig{};
    out.url = argv[1];

    try {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-o" && i + 1 < argc) {
                out.outputPath = argv[++i];
            }
            else if (arg == "-n" && i + 1 < argc) {
                out.parallelism = std::min(parseCount(argv[++i], "block count"), TransferConfig::maxParallelism);
            }
            else if (arg == "-c" && i + 1 < argc) {
                out.chunkSize = parseCount(argv[++i], "chunk size");
            }
            else if (arg == "-r" && i + 1 < argc) {
                out.retry.maxAttempts = parseCount(argv[++i], "retry count");
            }
            else if (arg == "-b" && i + 1 < argc) {
                const auto base = std::chrono::milliseconds(parseCount(argv[++i], "backoff"));
                out.retry.backoff = RetryPolicy::exponential(base, std::chrono::milliseconds(30000));
            }
            else if (arg == "-t" && i + 1 < argc) {
                out.connectTimeout = std::chrono::seconds(parseCount(argv[++i], "timeout"));
            }
            else if (arg == "-v") {
                out.verbose = true;
            }
            else {
                printUsage();
                return false;
            }
        }
    }
    catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        printUsage();
        return false;
    }

    if (out.outputPath.empty())
        out.outputPath = deriveOutputFromUrl(out.url);

    if (out.parallelism == 0 || out.chunkSize == 0) {
        printUsage();
        return false;
    }

    return true;
}

void ArgumentParser::printUsage() const {
    std::cout <<
        "Usage:\n"
        "  sdm <url> [-o <output>] [options]\n\n"
        "Options:\n"
        "  -o <file>        Output file path (default: name from url)\n"
        "  -n <blocks>      Parallel blocks, at most 32 (default: 5)\n"
        "  -c <bytes>       Write chunk size (default: 1024)\n"
        "  -r <attempts>    Attempts per block before giving up (default: unlimited)\n"
        "  -b <ms>          Exponential retry backoff base (default: none)\n"
        "  -t <seconds>     Connect timeout (default: 15)\n"
        "  -v               Verbose logging\n\n"
        "Signals:\n"
        "  SIGUSR1          Toggle pause/resume\n"
        "  SIGINT/SIGTERM   Pause and exit\n";
}
