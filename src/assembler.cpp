/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "assembler.hpp"

#include <algorithm>
#include <stdexcept>

#include "interval_utils.hpp"
#include "path_cover.hpp"
#include "splice_graph.hpp"
#include "utility.hpp"

// ============================================================================
// config
// ============================================================================

void assembler::config::validate() const {
    if (gap_size < 0) {
        throw std::runtime_error("Invalid gap size (<0): " + std::to_string(gap_size));
    }
    if (max_intron <= 0) {
        throw std::runtime_error("Invalid maximum intron size (<=0): " + std::to_string(max_intron));
    }
    if (min_utr <= 0) {
        throw std::runtime_error("Invalid UTR size (<=0): " + std::to_string(min_utr));
    }
    if (min_exon_len < 0) {
        throw std::runtime_error("Invalid minimum exon size (<0): " + std::to_string(min_exon_len));
    }
    if (min_transcript_len < 0) {
        throw std::runtime_error("Invalid minimum transcript length (<0): " +
                                 std::to_string(min_transcript_len));
    }
}

// ============================================================================
// assembler implementation
// ============================================================================

assembler::assembler(const config& cfg)
    : cfg_(cfg) {
    cfg_.validate();
}

void assembler::add_alignment(const alignment_record& record) {
    stats_.alignments++;
    if (record.blocks.empty()) return;

    auto exons = interval_utils::fill_gaps(interval_utils::from_blocks(record.blocks), cfg_.gap_size);

    for (auto& run : interval_utils::split_at_short_exons(exons, cfg_.min_exon_len)) {
        if (run.size() > 1) {
            stats_.spliced_runs++;
            auto handles = state_.exons.add_exons(record.seqid, run);
            state_.introns.link_introns(state_.exons, handles, cfg_.max_intron);
        } else {
            stats_.single_exon_runs++;
            state_.single_exons[record.seqid].push_back(run.front());
        }
    }
}

std::vector<transcript_path> assembler::locus_transcripts(const gene_locus& locus) {
    std::vector<transcript_path> transcripts;

    splice_graph graph = build_gene_graph(state_.exons, state_.introns, locus);
    if (graph.empty()) {
        return transcripts;
    }

    collapse_exons(graph, state_.exons, cfg_.min_utr);

    auto paths = enumerate_paths(graph, state_.exons);
    if (cfg_.minimal_isoforms) {
        paths = minimum_path_cover(paths);
    }

    for (auto& path : paths) {
        if (passes_length_filter(path, state_.exons, static_cast<size_t>(cfg_.min_transcript_len))) {
            transcripts.push_back(std::move(path));
        } else {
            stats_.excluded_transcripts++;
        }
    }

    return transcripts;
}

void assembler::build_gene_models(bed_writer& writer) {
    logging::info("Building gene models...");

    auto loci = merge_loci(state_.exons, state_.introns);
    stats_.loci = loci.size();

    size_t gene_id = 0;
    size_t locus_count = 0;
    logging::progress_start();

    for (const auto& locus : loci) {
        locus_count++;
        if (locus_count % 1000 == 0) {
            logging::progress(locus_count, "Loci processed (excluded " +
                              std::to_string(stats_.excluded_transcripts) + " transcript(s))");
        }

        auto transcripts = locus_transcripts(locus);
        // a gene id is only consumed when a transcript survives
        if (transcripts.empty()) continue;

        gene_id++;
        size_t transcript_id = 0;
        for (const auto& path : transcripts) {
            writer.write(make_record(path, gene_id, ++transcript_id));
            stats_.transcripts++;
        }
    }
    logging::progress_done(locus_count, "Processed loci");

    for (const auto& [seqid, merged] : merge_single_exons(state_.single_exons)) {
        for (const auto& exon : merged) {
            bed_record record;
            record.seqid = seqid;
            record.gene_id = ++gene_id;
            record.transcript_id = 1;
            record.exons.push_back(exon);
            writer.write(record);
            stats_.single_exon_genes++;
            stats_.transcripts++;
        }
    }

    stats_.genes = gene_id;
}

bed_record assembler::make_record(const transcript_path& path, size_t gene_id, size_t transcript_id) const {
    bed_record record;
    record.gene_id = gene_id;
    record.transcript_id = transcript_id;

    for (exon_id id : path) {
        const exon_node& exon = state_.exons.get(id);
        record.seqid = exon.seqid;
        record.exons.emplace_back(exon.start, exon.end);
    }
    std::sort(record.exons.begin(), record.exons.end(), [](const exon_span& a, const exon_span& b) {
        if (a.start != b.start) return a.start < b.start;
        return a.end < b.end;
    });

    return record;
}
