/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <filesystem>
#include <canonic/common/test.hpp>
#include <canonic/config.hpp>

using namespace canonic;

suite config_suite = [] {
    "config"_test = [] {
        const std::string tmp_dir { "./tmp" };
        std::filesystem::create_directories(tmp_dir);
        "config_json"_test = [] {
            const config_json cfg { json::object { { "maxContainerDepth", 64 } } };
            test_same(json::value_to<uint64_t>(cfg.at("maxContainerDepth")), 64ULL);
            expect(cfg.find("missing") == nullptr);
            expect(throws<error>([&] { cfg.at("missing"); }));
            test_same(cfg.bytes().size(), std::string_view { R"({"maxContainerDepth":64})" }.size());
        };
        "config_file"_test = [&] {
            const auto path = tmp_dir + "/codec.json";
            file::write(path, std::string_view { R"({"maxSequenceLength": 1024})" });
            const config_file cfg { path };
            test_same(json::value_to<uint64_t>(cfg.at("maxSequenceLength")), 1024ULL);
            const config_json copy { cfg };
            test_same(copy.bytes(), cfg.bytes());
        };
        "malformed files"_test = [&] {
            const auto path = tmp_dir + "/codec-bad.json";
            file::write(path, std::string_view { "[1, 2" });
            expect(throws<error>([&] { config_file { path }; }));
            file::write(path, std::string_view { "[1, 2]" });
            expect(throws<error>([&] { config_file { path }; }));
            expect(throws<error_sys>([&] { config_file { tmp_dir + "/no-such-file.json" }; }));
        };
    };
};
