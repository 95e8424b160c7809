/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef ISOWEAVE_INTRON_CLUSTERS_HPP
#define ISOWEAVE_INTRON_CLUSTERS_HPP

// standard
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

// class
#include "exon_registry.hpp"

using cluster_id = size_t;

/**
 * Intron between two consecutive exons of an alignment.
 * start = upstream.end + 1, end = downstream.start - 1.
 * Alternative exon boundaries sharing the same splice sites accumulate
 * as additional exon -> exon edges on the same intron.
 */
struct intron_node {
    std::string seqid;
    long long start;
    long long end;
    std::set<std::pair<exon_id, exon_id>> edges;

    intron_node() : start(0), end(0) {}
    intron_node(std::string seqid, long long start, long long end)
        : seqid{std::move(seqid)}, start{start}, end{end} {}

    std::string get_key() const {
        return seqid + ":" + std::to_string(start) + "-" + std::to_string(end);
    }
};

/**
 * Intron table plus the clusters of introns connected through shared
 * introns, discovered incrementally alignment by alignment.
 *
 * Clusters form a disjoint-set forest over intron handles. A cluster is
 * identified by the handle of its representative intron and its member
 * list is stored once, at the representative. Clusters only ever merge.
 */
class intron_clusters {
public:
    /**
     * Derive the introns of one registered run and file them into clusters.
     * Exon pairs whose intron is longer than max_intron are skipped.
     * Updates next_exons / introns of the touched exons.
     * @param exons Registry holding the run's exons
     * @param run Exon handles in alignment order
     * @param max_intron Maximum intron length (intron end - intron start)
     * @return the cluster now owning this run's introns, none if no intron was linked
     */
    std::optional<cluster_id> link_introns(exon_registry& exons,
                                           const std::vector<exon_id>& run,
                                           long long max_intron);

    std::optional<intron_id> find_intron(const std::string& seqid, long long start, long long end) const;

    const intron_node& get(intron_id id) const { return introns_[id]; }
    size_t size() const { return introns_.size(); }

    // Cluster currently owning an intron
    cluster_id cluster_of(intron_id id) const;

    // Introns of a cluster in discovery order
    const std::vector<intron_id>& members(cluster_id id) const;

    // Cluster table: representative -> member introns
    const std::map<cluster_id, std::vector<intron_id>>& clusters() const { return clusters_; }
    size_t cluster_count() const { return clusters_.size(); }

private:
    using coordinate_key = std::tuple<std::string, long long, long long>;

    std::vector<intron_node> introns_;
    std::map<coordinate_key, intron_id> index_;

    // disjoint-set forest
    std::vector<size_t> parent_;
    std::vector<size_t> rank_;
    std::map<cluster_id, std::vector<intron_id>> clusters_;

    intron_id make_intron(const std::string& seqid, long long start, long long end);
    size_t find_root(size_t id);
    cluster_id unite(size_t a, size_t b);
};

#endif //ISOWEAVE_INTRON_CLUSTERS_HPP
