/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef ISOWEAVE_ASSEMBLER_HPP
#define ISOWEAVE_ASSEMBLER_HPP

// standard
#include <cstddef>
#include <string>
#include <vector>

// class
#include "bed_writer.hpp"
#include "exon_registry.hpp"
#include "file_entries.hpp"
#include "intron_clusters.hpp"
#include "locus_merger.hpp"
#include "path_enumerator.hpp"
#include "single_exon_merger.hpp"

/**
 * Everything accumulated while reading alignments of one run.
 * Owned by the assembler and handed by reference to each stage.
 */
struct assembly_state {
    exon_registry exons;
    intron_clusters introns;
    single_exon_table single_exons;
};

/**
 * Gene model assembly engine
 *
 * Pipeline:
 * 1. add_alignment(): gap filling, short exon removal, exon registration,
 *    intron linkage and cluster merging (spliced runs) or collection of
 *    unspliced runs
 * 2. build_gene_models(): locus merging, splice graph assembly, terminus
 *    collapsing, path enumeration, length filtering and output
 */
class assembler {
public:
    struct config {
        int gap_size = 10;               // gaps <= gap_size are filled (bp)
        long long max_intron = 100000;   // longer introns are not linked (bp)
        long long min_utr = 100;         // alternative terminus tolerance (bp)
        int min_exon_len = 10;           // shorter exons are dropped (bp)
        int min_transcript_len = 300;    // transcripts must be longer (bp)
        bool minimal_isoforms = false;   // minimum path cover instead of all paths

        /**
         * Check parameter ranges
         * @throws std::runtime_error naming the first invalid parameter
         */
        void validate() const;
    };

    struct stats {
        size_t alignments = 0;
        size_t spliced_runs = 0;
        size_t single_exon_runs = 0;
        size_t loci = 0;
        size_t genes = 0;
        size_t single_exon_genes = 0;
        size_t transcripts = 0;
        size_t excluded_transcripts = 0;

        double isoforms_per_gene() const {
            return genes == 0 ? 0.0 : static_cast<double>(transcripts) / static_cast<double>(genes);
        }
    };

    assembler() : assembler(config{}) {}
    explicit assembler(const config& cfg);

    // Add one alignment record
    void add_alignment(const alignment_record& record);

    /**
     * Build transcript models for every locus and every merged unspliced
     * interval and hand them to the writer.
     * Spliced genes are numbered first, then single-exon genes.
     */
    void build_gene_models(bed_writer& writer);

    /**
     * Transcript models of one locus, before numbering.
     * Empty when the locus graph is empty or no transcript passes the
     * length filter.
     */
    std::vector<transcript_path> locus_transcripts(const gene_locus& locus);

    const config& get_config() const { return cfg_; }
    const stats& get_stats() const { return stats_; }
    const assembly_state& get_state() const { return state_; }

private:
    config cfg_;
    stats stats_;
    assembly_state state_;

    bed_record make_record(const transcript_path& path, size_t gene_id, size_t transcript_id) const;
};

#endif //ISOWEAVE_ASSEMBLER_HPP
