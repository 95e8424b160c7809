/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef ISOWEAVE_SPLICE_GRAPH_HPP
#define ISOWEAVE_SPLICE_GRAPH_HPP

// standard
#include <cstddef>
#include <map>
#include <set>
#include <vector>

// class
#include "exon_registry.hpp"
#include "intron_clusters.hpp"
#include "locus_merger.hpp"

/**
 * Directed exon graph of one gene locus.
 * Nodes are exon handles, edges observed exon -> exon transitions.
 */
class splice_graph {
public:
    void add_node(exon_id id);
    void add_edge(exon_id from, exon_id to);

    // Remove a node together with all its in- and out-edges
    void remove_node(exon_id id);

    bool contains(exon_id id) const { return nodes_.find(id) != nodes_.end(); }
    bool empty() const { return nodes_.empty(); }
    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const;

    const std::set<exon_id>& successors(exon_id id) const;
    const std::set<exon_id>& predecessors(exon_id id) const;

    std::vector<exon_id> nodes() const;

    // Nodes without predecessors
    std::vector<exon_id> roots() const;

private:
    struct adjacency {
        std::set<exon_id> out;
        std::set<exon_id> in;
    };

    std::map<exon_id, adjacency> nodes_;
};

/**
 * Graph of a locus: its exons (the ends of every intron of its clusters)
 * connected through their downstream links.
 */
splice_graph build_gene_graph(const exon_registry& exons, const intron_clusters& introns,
                              const gene_locus& locus);

/**
 * Collapse redundant alternative termini, in place.
 *
 * Pass 1 walks exons sorted by (end, start) and looks at neighbours sharing
 * an end: a LEFT-terminal later exon is absorbed by the earlier (longer) one,
 * otherwise a LEFT-terminal earlier exon whose start lies within min_utr of
 * the later one is absorbed by the later exon. Successors move to the kept exon.
 *
 * Pass 2 walks the reduced graph sorted by (start, end) and looks at
 * neighbours sharing a start: a RIGHT-terminal earlier (shorter) exon is
 * absorbed by the later one, otherwise a RIGHT-terminal later exon whose end
 * lies within min_utr is absorbed by the earlier one. Predecessors move to
 * the kept exon.
 */
void collapse_exons(splice_graph& graph, const exon_registry& exons, long long min_utr);

#endif //ISOWEAVE_SPLICE_GRAPH_HPP
