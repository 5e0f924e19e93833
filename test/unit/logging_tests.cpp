// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/logging.hpp"

using headerchain::util::LogManager;

TEST_CASE("LogManager components", "[logging]") {
    SECTION("Every component has its own logger") {
        for (const auto& component : LogManager::Components()) {
            auto logger = LogManager::GetLogger(component);
            REQUIRE(logger != nullptr);
            REQUIRE(logger->name() == component);
        }
    }

    SECTION("Unknown component falls back to default") {
        auto logger = LogManager::GetLogger("network");
        REQUIRE(logger != nullptr);
        REQUIRE(logger->name() == "default");
    }

    SECTION("Component level changes only that component") {
        auto chain = LogManager::GetLogger("chain");
        auto app = LogManager::GetLogger("app");
        auto app_level = app->level();
        auto chain_level = chain->level();

        REQUIRE(LogManager::SetComponentLevel("chain", "trace"));
        REQUIRE(chain->level() == spdlog::level::trace);
        REQUIRE(app->level() == app_level);

        REQUIRE(LogManager::SetComponentLevel("chain", spdlog::level::to_string_view(chain_level).data()));
        REQUIRE(chain->level() == chain_level);
    }

    SECTION("Unknown component level is refused") {
        REQUIRE_FALSE(LogManager::SetComponentLevel("network", "debug"));
    }
}
