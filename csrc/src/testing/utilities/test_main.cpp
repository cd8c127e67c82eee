// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_session.hpp>

#include <CLI/CLI.hpp>
#include <string>
#include <vector>

#include "test_config.h"

int main(int argc, char** argv) {
    testing_config::TestSizeConfig cfg{};
    CLI::App app{"transfuse unit tests"};
    app.allow_extras();

    app.add_option("-B, --batch", cfg.B, "Raw batch size (B)");
    app.add_option("-S, --image-size", cfg.ImageSize, "Image side (S)");
    app.add_option("-P, --patch-size", cfg.PatchSize, "Patch side (p)");
    app.add_option("-L, --max-length", cfg.MaxLength, "Token sequence length (L)");

    std::vector<std::string> remaining;
    try {
        app.parse(argc, argv);
        remaining = app.remaining();
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    testing_config::set_test_config(cfg);

    // Forward remaining args to Catch2
    std::vector<const char*> args;
    args.reserve(1 + remaining.size());
    args.push_back(argv[0]);
    for (const auto& s : remaining) {
        args.push_back(s.c_str());
    }

    return Catch::Session().run((int)args.size(), const_cast<char**>(args.data()));
}
