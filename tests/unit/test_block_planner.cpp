#include <catch2/catch.hpp>

#include <cstdint>

#include "core/BlockPlanner.h"

TEST_CASE("planBlocks covers [0, size) with contiguous disjoint blocks") {
    for (std::int64_t size : { 1, 2, 7, 100, 1023, 1024, 99999, 100000, 1234567 }) {
        for (std::size_t parallelism : { 1u, 2u, 3u, 4u, 5u, 8u, 16u }) {
            const auto blocks = planBlocks(size, parallelism);

            INFO("size " << size << " parallelism " << parallelism);
            REQUIRE_FALSE(blocks.empty());
            REQUIRE(blocks.size() == std::min<std::size_t>(parallelism, static_cast<std::size_t>(size)));
            REQUIRE(blocks.front().begin == 0);
            REQUIRE(blocks.back().end == size - 1);

            std::int64_t covered = 0;
            for (std::size_t i = 0; i < blocks.size(); ++i) {
                REQUIRE(blocks[i].begin <= blocks[i].end);
                if (i > 0)
                    REQUIRE(blocks[i].begin == blocks[i - 1].end + 1);
                covered += blocks[i].end + 1 - blocks[i].begin;
            }
            REQUIRE(covered == size);
        }
    }
}

TEST_CASE("planBlocks gives equal floor spans and the remainder to the last block") {
    SECTION("even split") {
        const auto blocks = planBlocks(100000, 4);
        REQUIRE(blocks.size() == 4);
        for (const auto& block : blocks)
            REQUIRE(block.end + 1 - block.begin == 25000);
        REQUIRE(blocks[3].end == 99999);
    }

    SECTION("remainder") {
        const auto blocks = planBlocks(10, 3);
        REQUIRE(blocks.size() == 3);
        REQUIRE(blocks[0].begin == 0);
        REQUIRE(blocks[0].end == 2);
        REQUIRE(blocks[1].begin == 3);
        REQUIRE(blocks[1].end == 5);
        REQUIRE(blocks[2].begin == 6);
        REQUIRE(blocks[2].end == 9);
    }
}

TEST_CASE("planBlocks returns one open-ended block when the size is unknown") {
    for (std::int64_t size : { -1, 0 }) {
        const auto blocks = planBlocks(size, 5);
        REQUIRE(blocks.size() == 1);
        REQUIRE(blocks[0].begin == 0);
        REQUIRE(blocks[0].end == -1);
        REQUIRE(blocks[0].openEnded());
        REQUIRE_FALSE(blocks[0].complete());
    }
}

TEST_CASE("planBlocks never plans empty blocks") {
    SECTION("more parallelism than bytes") {
        const auto blocks = planBlocks(3, 8);
        REQUIRE(blocks.size() == 3);
        for (const auto& block : blocks)
            REQUIRE(block.remaining() == 1);
    }

    SECTION("a parallelism wider than int64 is clamped to the size") {
        const auto blocks = planBlocks(100, SIZE_MAX);
        REQUIRE(blocks.size() == 100);
        REQUIRE(blocks.front().begin == 0);
        REQUIRE(blocks.back().end == 99);
    }

    SECTION("zero parallelism means one block") {
        const auto blocks = planBlocks(500, 0);
        REQUIRE(blocks.size() == 1);
        REQUIRE(blocks[0].begin == 0);
        REQUIRE(blocks[0].end == 499);
    }
}

TEST_CASE("Block completion follows the cursor") {
    Block block{ 10, 19 };
    REQUIRE(block.remaining() == 10);
    REQUIRE_FALSE(block.complete());

    block.begin = 20;
    REQUIRE(block.remaining() == 0);
    REQUIRE(block.complete());
}
