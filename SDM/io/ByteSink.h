#pragma once
#include <cstdint>
#include <cstddef>

// Destination of a transfer. Writes to disjoint ranges may come from
// several threads at once.
class ByteSink {
public:
    virtual ~ByteSink() = default;

    virtual bool writeAt(std::uint64_t offset, const char* data, std::size_t size) = 0;
};
