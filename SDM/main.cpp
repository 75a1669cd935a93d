#include <iostream>
#include <chrono>
#include <thread>
#include <csignal>

#include <curl/curl.h>

#include "cli/ArgumentParser.h"
#include "cli/ConsoleObserver.h"
#include "core/TransferController.h"
#include "io/FileWriter.h"

namespace {
volatile std::sig_atomic_t gStopRequested = 0;
volatile std::sig_atomic_t gToggleRequested = 0;

void handleStop(int) {
    gStopRequested = 1;
}

void handleToggle(int) {
    gToggleRequested = 1;
}

int runTransfer(const TransferConfig& config) {
    FileWriter writer(config.outputPath);
    ConsoleObserver console(std::cout);
    TransferController controller(config, writer, console);
    console.attach(controller.status());

    // failure already printed through the observer
    if (!controller.probe())
        return 1;
    if (!writer.open(controller.totalSize())) {
        std::cerr << "cannot open " << config.outputPath << " for writing\n";
        return 1;
    }
    if (!controller.start()) {
        std::cerr << controller.lastError() << "\n";
        return 1;
    }

    int exitCode = 1;
    for (;;) {
        if (gStopRequested) {
            controller.pause();
            controller.waitForSettled(std::chrono::seconds(5));
            std::cerr << "\ninterrupted, partial file left at " << config.outputPath << "\n";
            break;
        }

        if (gToggleRequested) {
            gToggleRequested = 0;
            if (controller.state() == TransferState::Paused)
                controller.resume();
            else
                controller.pause();
        }

        const TransferState state = controller.state();
        if (state == TransferState::Finished) {
            exitCode = writer.flush() ? 0 : 1;
            break;
        }
        if (state == TransferState::Failed) {
            std::cerr << "\n" << controller.lastError() << "\n";
            break;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    console.close();
    return exitCode;
}
}

int main(int argc, char* argv[]) {
    TransferConfig config;
    ArgumentParser parser;

    if (!parser.parse(argc, argv, config))
        return 1;

    std::signal(SIGINT, handleStop);
    std::signal(SIGTERM, handleStop);
#ifdef SIGUSR1
    std::signal(SIGUSR1, handleToggle);
#endif

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "curl_global_init failed\n";
        return 1;
    }

    const int rc = runTransfer(config);

    curl_global_cleanup();
    return rc;
}
