/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef ISOWEAVE_LOCUS_MERGER_HPP
#define ISOWEAVE_LOCUS_MERGER_HPP

// standard
#include <cstddef>
#include <string>
#include <vector>

// class
#include "exon_registry.hpp"
#include "intron_clusters.hpp"

/**
 * Gene locus: a connected group of intron clusters.
 * The unit for which a splice graph and its transcripts are built.
 */
struct gene_locus {
    std::vector<cluster_id> clusters;
    std::string seqid;
    size_t start;  // leftmost exon start over all clusters

    gene_locus() : start(0) {}
};

/**
 * Group clusters that share an exon into gene loci.
 *
 * Cluster discovery is alignment-order dependent: one true locus can be
 * split into several clusters until an exon carrying introns of more than
 * one cluster connects them. Every cluster of the table ends up in exactly
 * one locus. Loci are returned in genomic order (sequence order of first
 * appearance, then start), clusters within a locus by id.
 */
std::vector<gene_locus> merge_loci(const exon_registry& exons, const intron_clusters& introns);

#endif //ISOWEAVE_LOCUS_MERGER_HPP
