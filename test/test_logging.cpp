// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Test logging initialization helpers

#include "util/logging.hpp"
#include <string>

// Console-only logging for tests
void InitializeTestLogging(const std::string& level) {
    headerchain::util::LogManager::Initialize(level, false, "");

    // "trace" also opens up every component logger
    if (level == "trace") {
        for (const auto& component : headerchain::util::LogManager::Components()) {
            headerchain::util::LogManager::SetComponentLevel(component, "trace");
        }
    }
}

void ShutdownTestLogging() {
    headerchain::util::LogManager::Shutdown();
}
