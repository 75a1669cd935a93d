#include "BlockPlanner.h"

#include <algorithm>

std::vector<Block> planBlocks(std::int64_t totalSize, std::size_t parallelism) {
    std::vector<Block> blocks;

    if (totalSize <= 0) {
        blocks.push_back({ 0, -1 });
        return blocks;
    }

    // Never plan empty blocks. Clamp before narrowing, SIZE_MAX does not fit int64
    parallelism = std::max<std::size_t>(parallelism, 1);
    if (static_cast<std::uint64_t>(parallelism) > static_cast<std::uint64_t>(totalSize))
        parallelism = static_cast<std::size_t>(totalSize);
    const std::int64_t count = static_cast<std::int64_t>(parallelism);

    const std::int64_t blockSize = totalSize / count;
    blocks.reserve(static_cast<std::size_t>(count));

    std::int64_t begin = 0;
    for (std::int64_t i = 0; i < count; ++i) {
        const std::int64_t end = (i == count - 1) ? totalSize - 1 : begin + blockSize - 1;
        blocks.push_back({ begin, end });
        begin = end + 1;
    }

    return blocks;
}
