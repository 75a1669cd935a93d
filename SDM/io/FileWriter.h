#pragma once
#include <string>
#include <cstdint>
#include <mutex>

#include "ByteSink.h"

class FileWriter : public ByteSink
{
public:
    explicit FileWriter(const std::string& path);
    ~FileWriter() override;

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    // Creates or truncates the file; fileSize > 0 pre-sizes it
    bool open(std::int64_t fileSize = -1);
    bool writeAt(std::uint64_t offset, const char* data, std::size_t size) override;
    bool flush();
    void close();

private:
    std::string filePath;

#ifdef _WIN32
    std::mutex writeMutex;
#endif
    int fileHandle = -1;
};
