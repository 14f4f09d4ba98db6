/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <iostream>
#include <canonic/common/test.hpp>
#include <canonic/logger.hpp>

int main(const int argc, const char **argv)
{
    using namespace canonic;
    bool failed = true;
    const auto ex = logger::run_log_errors([&] {
        if (argc >= 2) {
            std::cerr << "using test-filter mask: " << argv[1] << '\n';
            boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
        }
        failed = boost::ut::cfg<boost::ut::override>.run();
        logger::info("run-tests finished with {}", failed ? "failures" : "success");
    });
    return ex || failed ? 1 : 0;
}
