/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "splice_graph.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

// ============================================================================
// splice_graph implementation
// ============================================================================

void splice_graph::add_node(exon_id id) {
    nodes_[id];
}

void splice_graph::add_edge(exon_id from, exon_id to) {
    if (from == to) return;
    nodes_[from].out.insert(to);
    nodes_[to].in.insert(from);
}

void splice_graph::remove_node(exon_id id) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return;

    for (exon_id succ : it->second.out) {
        nodes_[succ].in.erase(id);
    }
    for (exon_id pred : it->second.in) {
        nodes_[pred].out.erase(id);
    }
    nodes_.erase(it);
}

size_t splice_graph::edge_count() const {
    size_t count = 0;
    for (const auto& [id, adj] : nodes_) {
        count += adj.out.size();
    }
    return count;
}

const std::set<exon_id>& splice_graph::successors(exon_id id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        throw std::out_of_range("Exon not in splice graph: " + std::to_string(id));
    }
    return it->second.out;
}

const std::set<exon_id>& splice_graph::predecessors(exon_id id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        throw std::out_of_range("Exon not in splice graph: " + std::to_string(id));
    }
    return it->second.in;
}

std::vector<exon_id> splice_graph::nodes() const {
    std::vector<exon_id> ids;
    ids.reserve(nodes_.size());
    for (const auto& [id, adj] : nodes_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<exon_id> splice_graph::roots() const {
    std::vector<exon_id> ids;
    for (const auto& [id, adj] : nodes_) {
        if (adj.in.empty()) ids.push_back(id);
    }
    return ids;
}

// ============================================================================
// graph assembly and collapsing
// ============================================================================

splice_graph build_gene_graph(const exon_registry& exons, const intron_clusters& introns,
                              const gene_locus& locus) {
    splice_graph graph;
    for (cluster_id cl : locus.clusters) {
        for (intron_id intron : introns.members(cl)) {
            for (const auto& [up, down] : introns.get(intron).edges) {
                graph.add_node(up);
                graph.add_node(down);
            }
        }
    }

    // downstream links never leave the locus: both ends share an intron
    for (exon_id id : graph.nodes()) {
        for (exon_id next : exons.get(id).next_exons) {
            graph.add_edge(id, next);
        }
    }
    return graph;
}

namespace {

// Move the out-edges of `from` onto `into`, then drop `from`
void absorb_successors(splice_graph& graph, exon_id from, exon_id into) {
    std::set<exon_id> successors = graph.successors(from);
    for (exon_id succ : successors) {
        graph.add_edge(into, succ);
    }
    graph.remove_node(from);
}

// Move the in-edges of `from` onto `into`, then drop `from`
void absorb_predecessors(splice_graph& graph, exon_id from, exon_id into) {
    std::set<exon_id> predecessors = graph.predecessors(from);
    for (exon_id pred : predecessors) {
        graph.add_edge(pred, into);
    }
    graph.remove_node(from);
}

std::vector<exon_id> sorted_nodes(const splice_graph& graph, const exon_registry& exons,
                                  bool by_end) {
    std::vector<exon_id> ids = graph.nodes();
    std::sort(ids.begin(), ids.end(), [&exons, by_end](exon_id a, exon_id b) {
        const exon_node& ea = exons.get(a);
        const exon_node& eb = exons.get(b);
        if (by_end) {
            if (ea.end != eb.end) return ea.end < eb.end;
            return ea.start < eb.start;
        }
        if (ea.start != eb.start) return ea.start < eb.start;
        return ea.end < eb.end;
    });
    return ids;
}

void collapse_shared_ends(splice_graph& graph, const exon_registry& exons, long long min_utr) {
    auto sorted = sorted_nodes(graph, exons, true);
    if (sorted.empty()) return;

    exon_id curr = sorted.front();
    for (size_t i = 1; i < sorted.size(); ++i) {
        exon_id next = sorted[i];
        const exon_node& curr_exon = exons.get(curr);
        const exon_node& next_exon = exons.get(next);

        if (curr_exon.end != next_exon.end) {
            curr = next;
            continue;
        }

        if (next_exon.terminal == terminal_type::LEFT) {
            absorb_successors(graph, next, curr);
            continue;
        }

        long long start_diff = static_cast<long long>(next_exon.start) -
                               static_cast<long long>(curr_exon.start);
        if (curr_exon.terminal == terminal_type::LEFT && start_diff <= min_utr) {
            absorb_successors(graph, curr, next);
        }
        curr = next;
    }
}

void collapse_shared_starts(splice_graph& graph, const exon_registry& exons, long long min_utr) {
    auto sorted = sorted_nodes(graph, exons, false);
    if (sorted.empty()) return;

    exon_id curr = sorted.front();
    for (size_t i = 1; i < sorted.size(); ++i) {
        exon_id next = sorted[i];
        const exon_node& curr_exon = exons.get(curr);
        const exon_node& next_exon = exons.get(next);

        if (curr_exon.start != next_exon.start) {
            curr = next;
            continue;
        }

        if (curr_exon.terminal == terminal_type::RIGHT) {
            absorb_predecessors(graph, curr, next);
            curr = next;
            continue;
        }

        long long end_diff = static_cast<long long>(next_exon.end) -
                             static_cast<long long>(curr_exon.end);
        if (next_exon.terminal == terminal_type::RIGHT && end_diff <= min_utr) {
            absorb_predecessors(graph, next, curr);
        } else {
            curr = next;
        }
    }
}

} // anonymous namespace

void collapse_exons(splice_graph& graph, const exon_registry& exons, long long min_utr) {
    // order matters: pass 2 sees the graph already reduced by pass 1
    collapse_shared_ends(graph, exons, min_utr);
    collapse_shared_starts(graph, exons, min_utr);
}
