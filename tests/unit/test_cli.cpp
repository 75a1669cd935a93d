#include <catch2/catch.hpp>

#include <sstream>
#include <thread>

#include "cli/ArgumentParser.h"
#include "cli/ConsoleObserver.h"

namespace {
bool parseArgs(std::vector<std::string> args, TransferConfig& config) {
    std::vector<char*> argv;
    for (auto& arg : args)
        argv.push_back(&arg[0]);
    ArgumentParser parser;
    return parser.parse(static_cast<int>(argv.size()), argv.data(), config);
}
}

TEST_CASE("ArgumentParser fills the transfer config") {
    TransferConfig config;

    SECTION("defaults") {
        REQUIRE(parseArgs({ "sdm", "http://host/dir/archive.tar.gz?token=1" }, config));
        REQUIRE(config.url == "http://host/dir/archive.tar.gz?token=1");
        REQUIRE(config.outputPath == "archive.tar.gz");
        REQUIRE(config.parallelism == 5);
        REQUIRE(config.chunkSize == 1024);
        REQUIRE(config.retry.maxAttempts == 0);
        REQUIRE_FALSE(config.verbose);
    }

    SECTION("options") {
        REQUIRE(parseArgs({ "sdm", "http://host/f", "-o", "out.bin", "-n", "8", "-c", "4096",
            "-r", "5", "-b", "250", "-t", "3", "-v" }, config));
        REQUIRE(config.outputPath == "out.bin");
        REQUIRE(config.parallelism == 8);
        REQUIRE(config.chunkSize == 4096);
        REQUIRE(config.retry.maxAttempts == 5);
        REQUIRE(config.retry.delayBefore(1) == std::chrono::milliseconds(250));
        REQUIRE(config.connectTimeout == std::chrono::seconds(3));
        REQUIRE(config.verbose);
    }
}

TEST_CASE("ArgumentParser rejects bad input") {
    TransferConfig config;
    REQUIRE_FALSE(parseArgs({ "sdm" }, config));
    REQUIRE_FALSE(parseArgs({ "sdm", "http://host/f", "-n", "0" }, config));
    REQUIRE_FALSE(parseArgs({ "sdm", "http://host/f", "-n", "four" }, config));
    REQUIRE_FALSE(parseArgs({ "sdm", "http://host/f", "-c", "12k" }, config));
    REQUIRE_FALSE(parseArgs({ "sdm", "http://host/f", "--bogus" }, config));
    REQUIRE_FALSE(parseArgs({ "sdm", "http://host/f", "-n", "-1" }, config));
    REQUIRE_FALSE(parseArgs({ "sdm", "http://host/f", "-c", " -4" }, config));
    REQUIRE_FALSE(parseArgs({ "sdm", "http://host/f", "-n", "99999999999999999999999" }, config));
}

TEST_CASE("ArgumentParser caps the block count") {
    TransferConfig config;
    REQUIRE(parseArgs({ "sdm", "http://host/f", "-n", "50000" }, config));
    REQUIRE(config.parallelism == TransferConfig::maxParallelism);
}

TEST_CASE("deriveOutputFromUrl falls back to a default name") {
    REQUIRE(ArgumentParser::deriveOutputFromUrl("http://host/") == "download");
    REQUIRE(ArgumentParser::deriveOutputFromUrl("http://host/a/b.iso#frag") == "b.iso");
}

TEST_CASE("ConsoleObserver draws until the transfer finishes") {
    std::ostringstream out;
    TransferStatus status(100);
    ConsoleObserver console(out);
    console.attach(status);

    std::thread drawer([&]() { console.onStart(); });
    status.add(100);
    console.onError(TransferError::Network, "block 0 attempt 1: timeout");
    console.onFinish();
    drawer.join();

    const std::string text = out.str();
    REQUIRE(text.find("download started") != std::string::npos);
    REQUIRE(text.find("network error: block 0 attempt 1: timeout") != std::string::npos);
    REQUIRE(text.find("100/100") != std::string::npos);
    REQUIRE(text.find("[FINISH]") != std::string::npos);
}
