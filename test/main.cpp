// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <cstdlib>

#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    // Quiet unless LEDGERSIM_TEST_LOG is set.
    if (std::getenv("LEDGERSIM_TEST_LOG") == nullptr) {
        spdlog::set_level(spdlog::level::off);
    } else {
        spdlog::set_level(spdlog::level::debug);
    }

    return Catch::Session().run(argc, argv);
}
