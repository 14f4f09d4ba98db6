/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <canonic/common/test.hpp>
#include <canonic/logger.hpp>

using namespace canonic;

suite logger_suite = [] {
    "logger"_test = [] {
        "api"_test = [] {
            // checks that the code compiles and does not fail
            logger::trace("OK - trace");
            logger::trace("OK - {}", "trace");
            logger::debug("OK - debug");
            logger::debug("OK - {}", "debug");
            logger::info("OK - info");
            logger::info("OK - {}", "info");
            logger::warn("OK - warn");
            logger::warn("OK - {}", "warn");
            logger::error("OK - error");
            logger::error("OK - {}", "error");
            expect(true);
        };
        "run_log_errors"_test = [] {
            const auto ex1 = logger::run_log_errors([] {});
            expect(!ex1);
            const auto ex2 = logger::run_log_errors([] { throw error("Something bad!"); });
            expect(static_cast<bool>(ex2));
            bool cleaned_up = false;
            const auto ex3 = logger::run_log_errors([] { throw error("Something bad!"); }, [&] { cleaned_up = true; });
            expect(static_cast<bool>(ex3));
            expect(cleaned_up);
        };
    };
};
