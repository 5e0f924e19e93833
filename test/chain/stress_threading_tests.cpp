// Chain threading stress tests

#include <catch2/catch_test_macros.hpp>
#include "chain/header_chain.hpp"
#include "chain/validation.hpp"
#include <atomic>
#include <span>
#include <thread>
#include <vector>

using namespace headerchain;
using namespace headerchain::chain;

TEST_CASE("Stress test: concurrent verification", "[stress][threading]") {
    const auto valid = BuildValidChain(64);
    const auto broken = *BuildInvalidChain(64, 31, Corruption::PARENT);
    std::span<const BlockHeader> valid_tail = std::span<const BlockHeader>(valid).subspan(1);
    std::span<const BlockHeader> broken_tail = std::span<const BlockHeader>(broken).subspan(1);

    SECTION("Hammer VerifySubChain from many threads") {
        constexpr int NUM_THREADS = 16; constexpr int RUNS_PER_THREAD = 50;
        std::atomic<int> agree{0}, disagree{0}; std::vector<std::thread> ts;
        for (int i=0;i<NUM_THREADS;i++) ts.emplace_back([&]{ for(int j=0;j<RUNS_PER_THREAD;j++){ bool ok = validation::VerifySubChain(valid[0], valid_tail) && !validation::VerifySubChain(broken[0], broken_tail); if(ok) agree++; else disagree++; } });
        for(auto& t:ts) t.join(); REQUIRE(agree == NUM_THREADS*RUNS_PER_THREAD); REQUIRE(disagree==0);
    }

    SECTION("Concurrent builders produce identical chains") {
        constexpr int NUM_THREADS = 8;
        std::vector<std::vector<BlockHeader>> results(NUM_THREADS); std::vector<std::thread> ts;
        for (int i=0;i<NUM_THREADS;i++) ts.emplace_back([&results, i]{ results[i] = BuildValidChain(64); });
        for(auto& t:ts) t.join();
        for (const auto& chain : results) REQUIRE(chain == valid);
    }
}
