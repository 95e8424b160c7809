/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/retention.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

#include "bed_reader.hpp"
#include "retention_finder.hpp"
#include "utility.hpp"

namespace subcall {

cxxopts::Options retention::parse_args(int argc, char** argv) {
    cxxopts::Options options("isoweave retention",
        "Detect intron retention events in assembled transcripts");

    options.add_options("Input")
        ("i,input", "Assembled transcripts in BED12 format",
            cxxopts::value<std::string>())
        ;

    options.add_options("Grove")
        ("k,order", "Genogrove tree order",
            cxxopts::value<int>()->default_value("3"))
        ;

    add_common_options(options);

    return options;
}

void retention::validate(const cxxopts::ParseResult& args) {
    if (!args.count("input")) {
        throw std::runtime_error("No input file specified. Use -i/--input");
    }
    if (args["order"].as<int>() < 2) {
        throw std::runtime_error("Genogrove tree order must be at least 2");
    }
    require_files({args["input"].as<std::string>()});
}

void retention::execute(const cxxopts::ParseResult& args) {
    std::string input = args["input"].as<std::string>();
    int order = args["order"].as<int>();

    std::ofstream file_out;
    if (args.count("output")) {
        std::string output_path = args["output"].as<std::string>();
        file_out.open(output_path);
        if (!file_out.is_open()) {
            throw std::runtime_error("Failed to open output file: " + output_path);
        }
        logging::info("Writing retention events to: " + output_path);
    }
    std::ostream& out = file_out.is_open() ? static_cast<std::ostream&>(file_out) : std::cout;

    logging::info("Scanning " + input + " for intron retention");

    bed_reader reader(input);
    retention_finder finder(out, order);

    alignment_record record;
    size_t transcripts = 0;
    logging::progress_start();
    while (reader.read_next(record)) {
        finder.add_transcript(record);
        transcripts++;
        if (transcripts % 1000 == 0) {
            logging::progress(transcripts, "Reading transcripts");
        }
    }
    finder.finish();
    logging::progress_done(transcripts, "Read transcripts");

    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write retention events");
    }

    logging::info("Transcripts = " + std::to_string(transcripts) +
                  ", genes = " + std::to_string(finder.gene_count()) +
                  ", retention events = " + std::to_string(finder.event_count()));
    if (reader.get_skipped_lines() > 0) {
        logging::warning("Skipped input lines = " + std::to_string(reader.get_skipped_lines()));
    }
}

} // namespace subcall
