#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>

#include "utils.h"

// Splits [0, totalSize) into `parallelism` contiguous blocks, the last one
// taking the remainder. Unknown size (<= 0) gives the single block {0, -1}.
std::vector<Block> planBlocks(std::int64_t totalSize, std::size_t parallelism);
