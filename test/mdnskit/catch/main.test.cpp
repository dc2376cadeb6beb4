/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include <catch2/catch_session.hpp>

#include "mdnskit/core/log.hpp"

#include <catch2/catch_test_case_info.hpp>
#include <catch2/interfaces/catch_interfaces_reporter.hpp>
#include <catch2/reporters/catch_reporter_event_listener.hpp>
#include <catch2/reporters/catch_reporter_registrars.hpp>

/**
 * Logs the start and outcome of every test case, so log output of the library can be attributed to a test.
 */
struct TestCaseLogger final: Catch::EventListenerBase {
    using EventListenerBase::EventListenerBase;

    void testCaseStarting(Catch::TestCaseInfo const& test_info) override {
        MDK_INFO("Run test: {}", test_info.name);
    }

    void testCaseEnded(Catch::TestCaseStats const& test_case_stats) override {
        if (test_case_stats.totals.assertions.failed > 0) {
            MDK_ERROR(
                "Test failed: {} ({} failed assertions)", test_case_stats.testInfo->name,
                test_case_stats.totals.assertions.failed
            );
        }
    }
};

CATCH_REGISTER_LISTENER(TestCaseLogger);

int main(const int argc, char* argv[]) {
    mdk::set_log_level_from_env();
    return Catch::Session().run(argc, argv);
}
