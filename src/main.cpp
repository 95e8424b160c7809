/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

// standard
#include <iostream>
#include <memory>
#include <string>

// cxxopts
#include <cxxopts.hpp>

// class
#include "config.hpp"
#include "utility.hpp"
#include "subcall/assemble.hpp"
#include "subcall/retention.hpp"

void showVersion(std::ostream& _str) {
    _str << "isoweave v" << isoweave_VERSION_MAJOR;
    _str << "." << isoweave_VERSION_MINOR << ".";
    _str << isoweave_VERSION_PATCH << " - ";
    _str << "Assemble transcript models from spliced alignments";
    _str << std::endl;
}

void showUsage(std::ostream& _str) {
    _str << "Usage: isoweave <subcommand> [options]\n\n";
    _str << "Subcommands:\n";
    _str << "  assemble    Assemble transcript models from spliced alignments\n";
    _str << "  retention   Detect intron retention events in assembled transcripts\n\n";
    _str << "Run 'isoweave <subcommand> --help' for subcommand options." << std::endl;
}

std::unique_ptr<subcall::subcall> make_subcall(const std::string& name) {
    if (name == "assemble") return std::make_unique<subcall::assemble>();
    if (name == "retention") return std::make_unique<subcall::retention>();
    return nullptr;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        showUsage(std::cerr);
        return 1;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        showUsage(std::cout);
        return 0;
    }
    if (command == "-v" || command == "--version") {
        showVersion(std::cout);
        return 0;
    }

    auto cmd = make_subcall(command);
    if (!cmd) {
        std::cerr << "Error: unknown subcommand '" << command << "'\n\n";
        showUsage(std::cerr);
        return 1;
    }

    try {
        // shift argv so the subcommand sees itself as the program name
        auto options = cmd->parse_args(argc - 1, argv + 1);
        auto result = options.parse(argc - 1, argv + 1);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        cmd->run(result);

    } catch(const cxxopts::exceptions::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch(const std::exception& e) {
        logging::error(e.what());
        return 1;
    }

    return 0;
}
