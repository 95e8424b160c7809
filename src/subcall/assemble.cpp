/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/assemble.hpp"

#include <cstdio>
#include <memory>
#include <stdexcept>

#include "alignment_loader.hpp"
#include "bed_writer.hpp"
#include "utility.hpp"

namespace subcall {

cxxopts::Options assemble::parse_args(int argc, char** argv) {
    cxxopts::Options options("isoweave assemble",
        "Assemble transcript models from spliced alignments");

    options.add_options("Input")
        ("i,input", "Input alignment file(s) (PSL, BED12, SAM or BAM, optionally gzipped)",
            cxxopts::value<std::vector<std::string>>())
        ;

    options.add_options("Assembly")
        ("gap-size", "Maximum alignment gap filled into an exon (bp)",
            cxxopts::value<int>()->default_value("10"))
        ("max-intron", "Maximum intron size (bp)",
            cxxopts::value<long long>()->default_value("100000"))
        ("min-utr", "Cutoff size of alternative UTRs (bp)",
            cxxopts::value<long long>()->default_value("100"))
        ("min-exon", "Minimum exon size (bp)",
            cxxopts::value<int>()->default_value("10"))
        ("min-transcript", "Minimum transcript length (bp)",
            cxxopts::value<int>()->default_value("300"))
        ("min", "Report a minimum set of isoforms")
        ("min-mapq", "Minimum mapping quality (SAM/BAM input only)",
            cxxopts::value<int>()->default_value("0"))
        ;

    add_common_options(options);

    return options;
}

assembler::config assemble::make_config(const cxxopts::ParseResult& args) {
    assembler::config cfg;
    cfg.gap_size = args["gap-size"].as<int>();
    cfg.max_intron = args["max-intron"].as<long long>();
    cfg.min_utr = args["min-utr"].as<long long>();
    cfg.min_exon_len = args["min-exon"].as<int>();
    cfg.min_transcript_len = args["min-transcript"].as<int>();
    cfg.minimal_isoforms = args.count("min") > 0;
    return cfg;
}

void assemble::validate(const cxxopts::ParseResult& args) {
    if (!args.count("input")) {
        throw std::runtime_error("No input files specified. Use -i/--input");
    }

    // parameters are checked before any input is read
    make_config(args).validate();

    int min_mapq = args["min-mapq"].as<int>();
    if (min_mapq < 0 || min_mapq > 255) {
        throw std::runtime_error("Invalid minimum mapping quality (0-255): " + std::to_string(min_mapq));
    }

    require_files(args["input"].as<std::vector<std::string>>());
}

void assemble::report_parameters(const cxxopts::ParseResult& args, const assembler::config& cfg) const {
    auto report = [&args](const std::string& option, const std::string& label, long long value) {
        std::string prefix = args.count(option) ? "User defined " : "Default ";
        logging::info(prefix + label + " = " + std::to_string(value));
    };

    report("min-utr", "MIN_UTR", cfg.min_utr);
    report("gap-size", "GAP_SIZE", cfg.gap_size);
    report("max-intron", "MAX_INTRON", cfg.max_intron);
    report("min-exon", "MIN_EXON", cfg.min_exon_len);
    report("min-transcript", "MIN_TRANSCRIPT_LEN", cfg.min_transcript_len);

    if (cfg.minimal_isoforms) {
        logging::info("Search for a minimum set of isoforms = yes");
    } else {
        logging::info("Search for a maximum set of isoforms = yes");
    }
}

void assemble::execute(const cxxopts::ParseResult& args) {
    assembler::config cfg = make_config(args);
    report_parameters(args, cfg);

    assembler engine(cfg);

    alignment_loader::config load_cfg;
    load_cfg.min_mapq = static_cast<uint8_t>(args["min-mapq"].as<int>());
    alignment_loader loader(load_cfg);

    size_t skipped_lines = 0;
    for (const auto& input : args["input"].as<std::vector<std::string>>()) {
        auto load_stats = loader.load(input, [&engine](const alignment_record& record) {
            engine.add_alignment(record);
        });
        skipped_lines += load_stats.skipped_lines;
        logging::info("Read " + std::to_string(load_stats.records) + " alignment(s) from " + input);
    }

    std::unique_ptr<bed_writer> writer;
    if (args.count("output")) {
        std::string output_path = args["output"].as<std::string>();
        writer = std::make_unique<bed_writer>(output_path);
        logging::info("Writing transcript models to: " + output_path);
    } else {
        writer = std::make_unique<bed_writer>();
    }

    engine.build_gene_models(*writer);

    const auto& stats = engine.get_stats();
    char ratio[32];
    std::snprintf(ratio, sizeof(ratio), "%.2f", stats.isoforms_per_gene());

    logging::info("Assembly complete:");
    logging::info("  Total exons = " + std::to_string(engine.get_state().exons.size()));
    logging::info("  Total genes = " + std::to_string(stats.genes) +
                  " (" + std::to_string(stats.single_exon_genes) + " single-exon)");
    logging::info("  Total transcripts = " + std::to_string(stats.transcripts));
    logging::info("  Excluded transcripts = " + std::to_string(stats.excluded_transcripts));
    logging::info("  Isoform/gene = " + std::string(ratio));
    if (skipped_lines > 0) {
        logging::warning("Skipped input lines = " + std::to_string(skipped_lines));
    }
}

} // namespace subcall
