// Copyright (c) 2025 The Unicity Foundation
// Test suite for genesis, child derivation and chain builders

#include <catch2/catch_test_macros.hpp>
#include "chain/header_chain.hpp"
#include "chain/validation.hpp"
#include "chain_fixtures.hpp"
#include <limits>

using namespace headerchain;
using namespace headerchain::chain;

TEST_CASE("Genesis header", "[header_chain][genesis]") {
    BlockHeader g = Genesis();

    SECTION("Height is zero") {
        REQUIRE(g.nHeight == 0);
    }

    SECTION("Parent is the sentinel") {
        REQUIRE(g.hashParent == NULL_PARENT_HASH);
        REQUIRE(g.hashParent.IsNull());
    }

    SECTION("Genesis is deterministic") {
        REQUIRE(Genesis() == g);
        REQUIRE(Genesis().GetHash() == g.GetHash());
    }

    SECTION("IsGenesis recognises only genesis") {
        REQUIRE(IsGenesis(g));
        REQUIRE_FALSE(IsGenesis(ChildOf(g)));

        BlockHeader wrong_height = g;
        wrong_height.nHeight = 1;
        REQUIRE_FALSE(IsGenesis(wrong_height));

        BlockHeader wrong_parent = g;
        wrong_parent.hashParent = uint256(1);
        REQUIRE_FALSE(IsGenesis(wrong_parent));
    }
}

TEST_CASE("ChildOf derivation", "[header_chain][child]") {
    BlockHeader g = Genesis();

    SECTION("Child of genesis has height 1") {
        REQUIRE(ChildOf(g).nHeight == 1);
    }

    SECTION("Child commits to the parent's hash") {
        REQUIRE(ChildOf(g).hashParent == g.GetHash());
    }

    SECTION("Properties hold for arbitrary headers") {
        BlockHeader h;
        h.hashParent = uint256(0x42);
        h.nHeight = 1000;

        BlockHeader c = ChildOf(h);
        REQUIRE(c.nHeight == h.nHeight + 1);
        REQUIRE(c.hashParent == h.GetHash());
    }

    SECTION("Parent is left untouched") {
        BlockHeader before = g;
        (void)ChildOf(g);
        REQUIRE(g == before);
    }

    SECTION("Placeholders are reset to defaults") {
        BlockHeader c = ChildOf(g);
        REQUIRE(c.extrinsicsRoot == ExtrinsicsRoot{});
        REQUIRE(c.stateRoot == StateRoot{});
        REQUIRE(c.consensusDigest == ConsensusDigest{});
    }

    SECTION("Injected hasher supplies the parent digest") {
        test::ToyHeaderHasher toy;
        BlockHeader c = ChildOf(g, toy);
        REQUIRE(c.hashParent == toy.Hash(g));
        REQUIRE(c.hashParent != g.GetHash());
        REQUIRE(c.nHeight == 1);
    }

    SECTION("Child of the maximum height wraps") {
        BlockHeader top;
        top.nHeight = std::numeric_limits<uint64_t>::max();
        REQUIRE(ChildOf(top).nHeight == 0);
    }
}

TEST_CASE("BuildValidChain", "[header_chain][builder]") {
    SECTION("Zero length is empty") {
        REQUIRE(BuildValidChain(0).empty());
    }

    SECTION("Length one is just genesis") {
        auto chain = BuildValidChain(1);
        REQUIRE(chain.size() == 1);
        REQUIRE(IsGenesis(chain[0]));
    }

    SECTION("Every header is the child of the previous one") {
        auto chain = BuildValidChain(10);
        REQUIRE(chain.size() == 10);
        REQUIRE(IsGenesis(chain[0]));
        for (size_t i = 1; i < chain.size(); ++i) {
            REQUIRE(chain[i] == ChildOf(chain[i - 1]));
            REQUIRE(chain[i].nHeight == i);
        }
    }

    SECTION("Matches the hand-built five block fixture") {
        REQUIRE(BuildValidChain(5) == test::BuildValidChainLength5());
    }
}

TEST_CASE("BuildInvalidChain", "[header_chain][builder]") {
    SECTION("Rejects corrupt heights outside the chain") {
        REQUIRE_FALSE(BuildInvalidChain(5, 0, Corruption::PARENT).has_value());
        REQUIRE_FALSE(BuildInvalidChain(5, 5, Corruption::PARENT).has_value());
        REQUIRE_FALSE(BuildInvalidChain(1, 1, Corruption::HEIGHT).has_value());
        REQUIRE_FALSE(BuildInvalidChain(0, 1, Corruption::HEIGHT).has_value());
    }

    SECTION("Parent corruption uses the header's own hash") {
        auto chain = BuildInvalidChain(4, 2, Corruption::PARENT);
        REQUIRE(chain.has_value());
        REQUIRE(chain->size() == 4);
        REQUIRE(*chain == test::BuildAnInvalidChain());
    }

    SECTION("Height corruption moves only the damaged header") {
        auto chain = BuildInvalidChain(5, 3, Corruption::HEIGHT);
        REQUIRE(chain.has_value());
        REQUIRE((*chain)[2].nHeight == 2);
        REQUIRE((*chain)[3].nHeight != 3);
        REQUIRE((*chain)[3].hashParent == (*chain)[2].GetHash());
        REQUIRE((*chain)[4] == ChildOf((*chain)[3]));
    }

    SECTION("Exactly one link is broken") {
        for (Corruption kind : {Corruption::PARENT, Corruption::HEIGHT}) {
            for (size_t bad = 1; bad < 6; ++bad) {
                auto chain = BuildInvalidChain(6, bad, kind);
                REQUIRE(chain.has_value());

                int broken_links = 0;
                for (size_t i = 1; i < chain->size(); ++i) {
                    std::span<const BlockHeader> one(&(*chain)[i], 1);
                    if (!validation::VerifySubChain((*chain)[i - 1], one)) {
                        ++broken_links;
                        REQUIRE(i == bad);
                    }
                }
                REQUIRE(broken_links == 1);
            }
        }
    }
}

TEST_CASE("Corruption names", "[header_chain]") {
    REQUIRE(CorruptionToString(Corruption::PARENT) == "parent");
    REQUIRE(CorruptionToString(Corruption::HEIGHT) == "height");
    REQUIRE(CorruptionFromString("parent") == Corruption::PARENT);
    REQUIRE(CorruptionFromString("height") == Corruption::HEIGHT);
    REQUIRE_FALSE(CorruptionFromString("state").has_value());
}
