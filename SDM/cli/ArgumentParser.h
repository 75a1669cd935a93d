#pragma once
#include <string>
#include "../core/utils.h"

class ArgumentParser {
public:
    bool parse(int argc, char* argv[], TransferConfig& out);

    static std::string deriveOutputFromUrl(const std::string& url);

private:
    void printUsage() const;
};
