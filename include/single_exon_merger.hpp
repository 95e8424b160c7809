/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef ISOWEAVE_SINGLE_EXON_MERGER_HPP
#define ISOWEAVE_SINGLE_EXON_MERGER_HPP

// standard
#include <map>
#include <string>
#include <vector>

// class
#include "interval_utils.hpp"

// Unspliced alignments grouped by sequence name
using single_exon_table = std::map<std::string, std::vector<exon_span>>;

/**
 * Merge unspliced alignments per chromosome by interval overlap.
 * An exon starting inside the running interval extends it, any other
 * exon starts a new one. Each merged interval becomes a one-exon gene.
 */
single_exon_table merge_single_exons(const single_exon_table& exons);

#endif //ISOWEAVE_SINGLE_EXON_MERGER_HPP
