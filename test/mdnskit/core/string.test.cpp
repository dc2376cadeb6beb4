/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/core/string.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("mdk::string") {
    SECTION("string_split keeps empty parts") {
        const auto parts = mdk::string_split("_http._tcp..local", '.');
        REQUIRE(parts.size() == 4);
        REQUIRE(parts[0] == "_http");
        REQUIRE(parts[2].empty());
    }

    SECTION("string_compare_case_insensitive") {
        REQUIRE(mdk::string_compare_case_insensitive("_HTTP._tcp", "_http._TCP"));
        REQUIRE_FALSE(mdk::string_compare_case_insensitive("_http", "_https"));
    }

    SECTION("string_to_lower") {
        REQUIRE(mdk::string_to_lower("Printer A") == "printer a");
        REQUIRE(mdk::string_to_lower("ABC", 1) == "aBC");
    }

    SECTION("string_starts_with and string_ends_with") {
        REQUIRE(mdk::string_starts_with("_http._tcp", "_http"));
        REQUIRE_FALSE(mdk::string_starts_with("_h", "_http"));
        REQUIRE(mdk::string_ends_with("_http._tcp.", "."));
        REQUIRE_FALSE(mdk::string_ends_with("", "."));
    }
}
