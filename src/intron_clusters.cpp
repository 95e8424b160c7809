/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "intron_clusters.hpp"

#include <stdexcept>

std::optional<cluster_id> intron_clusters::link_introns(exon_registry& exons,
                                                        const std::vector<exon_id>& run,
                                                        long long max_intron) {
    std::vector<intron_id> linked;

    for (size_t i = 0; i + 1 < run.size(); ++i) {
        exon_node& curr = exons.get(run[i]);
        exon_node& next = exons.get(run[i + 1]);

        long long intron_start = static_cast<long long>(curr.end) + 1;
        long long intron_end = static_cast<long long>(next.start) - 1;

        if (intron_end - intron_start > max_intron) {
            continue;
        }

        curr.next_exons.insert(run[i + 1]);

        intron_id id;
        auto existing = find_intron(curr.seqid, intron_start, intron_end);
        if (existing.has_value()) {
            id = *existing;
        } else {
            id = make_intron(curr.seqid, intron_start, intron_end);
        }

        introns_[id].edges.emplace(run[i], run[i + 1]);
        curr.introns.insert(id);
        next.introns.insert(id);
        linked.push_back(id);
    }

    if (linked.empty()) {
        return std::nullopt;
    }

    // every intron of one alignment lands in the same cluster, pulling in
    // any cluster that already owns one of them
    size_t root = find_root(linked.front());
    for (size_t i = 1; i < linked.size(); ++i) {
        root = unite(root, linked[i]);
    }

    return root;
}

std::optional<intron_id> intron_clusters::find_intron(const std::string& seqid,
                                                      long long start, long long end) const {
    auto it = index_.find(coordinate_key{seqid, start, end});
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

cluster_id intron_clusters::cluster_of(intron_id id) const {
    if (id >= parent_.size()) {
        throw std::out_of_range("Unknown intron handle: " + std::to_string(id));
    }
    size_t current = id;
    while (parent_[current] != current) {
        current = parent_[current];
    }
    return current;
}

const std::vector<intron_id>& intron_clusters::members(cluster_id id) const {
    auto it = clusters_.find(id);
    if (it == clusters_.end()) {
        throw std::out_of_range("Unknown cluster: " + std::to_string(id));
    }
    return it->second;
}

intron_id intron_clusters::make_intron(const std::string& seqid, long long start, long long end) {
    intron_id id = introns_.size();
    introns_.emplace_back(seqid, start, end);
    index_.emplace(coordinate_key{seqid, start, end}, id);

    parent_.push_back(id);
    rank_.push_back(0);
    clusters_[id] = {id};

    return id;
}

size_t intron_clusters::find_root(size_t id) {
    // path halving
    while (parent_[id] != id) {
        parent_[id] = parent_[parent_[id]];
        id = parent_[id];
    }
    return id;
}

cluster_id intron_clusters::unite(size_t a, size_t b) {
    size_t root_a = find_root(a);
    size_t root_b = find_root(b);
    if (root_a == root_b) {
        return root_a;
    }

    // union by rank, the absorbed cluster's members follow in discovery order
    if (rank_[root_a] < rank_[root_b]) {
        std::swap(root_a, root_b);
    }
    parent_[root_b] = root_a;
    if (rank_[root_a] == rank_[root_b]) {
        rank_[root_a]++;
    }

    auto absorbed = clusters_.find(root_b);
    auto& target = clusters_[root_a];
    target.insert(target.end(), absorbed->second.begin(), absorbed->second.end());
    clusters_.erase(absorbed);

    return root_a;
}
