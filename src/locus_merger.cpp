/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "locus_merger.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <set>

namespace {

// undirected "big cluster" connectivity over cluster ids
class cluster_links {
public:
    void add_node(cluster_id id) {
        parent_.emplace(id, id);
    }

    void link(cluster_id a, cluster_id b) {
        add_node(a);
        add_node(b);
        cluster_id root_a = find(a);
        cluster_id root_b = find(b);
        if (root_a != root_b) {
            // smaller id as representative keeps results independent of link order
            if (root_b < root_a) std::swap(root_a, root_b);
            parent_[root_b] = root_a;
        }
    }

    cluster_id find(cluster_id id) {
        cluster_id root = id;
        while (parent_.at(root) != root) {
            root = parent_.at(root);
        }
        while (parent_.at(id) != root) {
            cluster_id next = parent_.at(id);
            parent_[id] = root;
            id = next;
        }
        return root;
    }

    const std::map<cluster_id, cluster_id>& nodes() const { return parent_; }

private:
    std::map<cluster_id, cluster_id> parent_;
};

} // anonymous namespace

std::vector<gene_locus> merge_loci(const exon_registry& exons, const intron_clusters& introns) {
    cluster_links links;

    for (const auto& [id, members] : introns.clusters()) {
        links.add_node(id);
    }

    for (const auto& exon : exons) {
        std::set<cluster_id> owners;
        for (intron_id intron : exon.introns) {
            owners.insert(introns.cluster_of(intron));
        }
        if (owners.size() < 2) {
            continue;
        }

        // a path through all clusters sharing this exon
        auto it = owners.begin();
        cluster_id previous = *it;
        for (++it; it != owners.end(); ++it) {
            links.link(previous, *it);
            previous = *it;
        }
    }

    std::map<cluster_id, gene_locus> by_root;
    std::vector<cluster_id> node_ids;
    for (const auto& [id, parent] : links.nodes()) {
        node_ids.push_back(id);
    }
    for (cluster_id id : node_ids) {
        by_root[links.find(id)].clusters.push_back(id);
    }

    std::vector<gene_locus> loci;
    loci.reserve(by_root.size());
    for (auto& [root, locus] : by_root) {
        size_t leftmost = std::numeric_limits<size_t>::max();
        for (cluster_id cl : locus.clusters) {
            for (intron_id intron : introns.members(cl)) {
                for (const auto& [up, down] : introns.get(intron).edges) {
                    const exon_node& exon = exons.get(up);
                    if (exon.start < leftmost) {
                        leftmost = exon.start;
                        locus.seqid = exon.seqid;
                    }
                }
            }
        }
        locus.start = leftmost;
        loci.push_back(std::move(locus));
    }

    std::sort(loci.begin(), loci.end(), [&exons](const gene_locus& a, const gene_locus& b) {
        size_t rank_a = exons.seqid_rank(a.seqid);
        size_t rank_b = exons.seqid_rank(b.seqid);
        if (rank_a != rank_b) return rank_a < rank_b;
        if (a.start != b.start) return a.start < b.start;
        return a.clusters.front() < b.clusters.front();
    });

    return loci;
}
