/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef ISOWEAVE_EXON_REGISTRY_HPP
#define ISOWEAVE_EXON_REGISTRY_HPP

// standard
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

// class
#include "interval_utils.hpp"

using exon_id = size_t;
using intron_id = size_t;

/**
 * Position of an exon within the alignments it was observed in.
 * LEFT: first exon of some run, RIGHT: last exon of some run.
 */
enum class terminal_type : uint8_t {
    NONE,
    LEFT,
    RIGHT
};

/**
 * Represents an exon in the registry
 * Exons are deduplicated: same seqid + start + end = same node
 */
struct exon_node {
    std::string seqid;
    size_t start;
    size_t end;
    terminal_type terminal;
    std::set<exon_id> next_exons;  // downstream exons, the splice graph edges
    std::set<intron_id> introns;   // incident introns

    exon_node() : start(0), end(0), terminal(terminal_type::NONE) {}
    exon_node(std::string seqid, size_t start, size_t end)
        : seqid{std::move(seqid)}, start{start}, end{end}, terminal(terminal_type::NONE) {}

    size_t length() const { return end - start; }

    std::string get_key() const {
        return seqid + ":" + std::to_string(start) + "-" + std::to_string(end);
    }
};

/**
 * Deduplicated store of exons keyed by genomic coordinate.
 * Exons get a stable integer handle (index into the arena) on first
 * observation and are never removed.
 */
class exon_registry {
public:
    /**
     * Register a run of consecutive exons of one alignment.
     * Marks the first exon LEFT and the last RIGHT; an exon already in the
     * registry loses its terminal flag when it occurs internally here.
     * @return handles of the exons in run order
     */
    std::vector<exon_id> add_exons(const std::string& seqid, const std::vector<exon_span>& run);

    std::optional<exon_id> find(const std::string& seqid, size_t start, size_t end) const;

    exon_node& get(exon_id id) { return exons_[id]; }
    const exon_node& get(exon_id id) const { return exons_[id]; }

    size_t size() const { return exons_.size(); }
    bool empty() const { return exons_.empty(); }

    // Order of first appearance of each sequence name
    size_t seqid_rank(const std::string& seqid) const;

    std::vector<exon_node>::const_iterator begin() const { return exons_.begin(); }
    std::vector<exon_node>::const_iterator end() const { return exons_.end(); }

private:
    using coordinate_key = std::tuple<std::string, size_t, size_t>;

    std::vector<exon_node> exons_;
    std::map<coordinate_key, exon_id> index_;
    std::map<std::string, size_t> seqid_ranks_;
};

#endif //ISOWEAVE_EXON_REGISTRY_HPP
