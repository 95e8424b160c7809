/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef ISOWEAVE_RETENTION_FINDER_HPP
#define ISOWEAVE_RETENTION_FINDER_HPP

// standard
#include <cstddef>
#include <map>
#include <ostream>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

// genogrove
#include <genogrove/structure/grove/grove.hpp>
#include <genogrove/data_type/interval.hpp>

// class
#include "file_entries.hpp"

namespace gdt = genogrove::data_type;
namespace gst = genogrove::structure;

/**
 * Exon of an assembled transcript, 1-based inclusive coordinates
 */
struct model_exon {
    std::string seqid;
    size_t start;
    size_t end;
    char strand;

    model_exon() : start(0), end(0), strand('.') {}
    model_exon(std::string seqid, size_t start, size_t end, char strand)
        : seqid{std::move(seqid)}, start{start}, end{end}, strand{strand} {}
};

/**
 * Intron retention detection over assembled transcript models (BED12).
 *
 * Consecutive records sharing a gene id form one exon graph. For every
 * edge up -> dn an exon spanning exactly up.start..dn.end retains the
 * intron between them. Each such event is written as a GFF3 gene with
 * one mRNA per alternative (spliced and retained).
 */
class retention_finder {
public:
    /**
     * @param out Stream receiving GFF3 lines
     * @param order Genogrove tree order of the per-gene exon index
     */
    explicit retention_finder(std::ostream& out, int order = 3);

    // Add one transcript; a new gene id flushes the previous gene
    void add_transcript(const alignment_record& record);

    // Flush the last gene
    void finish();

    size_t event_count() const { return event_count_; }
    // distinct gene ids seen; a gene split across the input counts once and
    // continues its event numbering
    size_t gene_count() const { return events_per_gene_.size(); }

    // Transcript name with ':' replaced by '-'
    static std::string transcript_id_of(const std::string& name);

    // Gene part of a transcript id (text before the first '.')
    static std::string gene_id_of(const std::string& transcript_id);

private:
    using grove_type = gst::grove<gdt::interval, size_t>;
    using exon_key = std::tuple<std::string, size_t, size_t>;

    std::ostream& out_;
    int order_;
    size_t event_count_;

    // current gene
    std::string current_gene_;
    std::vector<model_exon> exons_;
    std::map<exon_key, size_t> exon_index_;
    std::vector<std::pair<size_t, size_t>> edges_;
    std::set<std::pair<size_t, size_t>> seen_edges_;

    std::map<std::string, size_t> events_per_gene_;

    size_t intern_exon(const model_exon& exon);
    void flush_gene();

    // Each event lists its alternatives: the spliced pair and the retaining exon
    std::vector<std::vector<std::vector<size_t>>> find_events() const;

    void write_gff(const std::vector<std::vector<size_t>>& event);
};

#endif //ISOWEAVE_RETENTION_FINDER_HPP
