/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef ISOWEAVE_ALIGNMENT_LOADER_HPP
#define ISOWEAVE_ALIGNMENT_LOADER_HPP

// standard
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <vector>

// genogrove
#include <genogrove/io/bam_reader.hpp>

// class
#include "file_entries.hpp"
#include "filetype_detector.hpp"

namespace gio = genogrove::io;

/**
 * Collects reference blocks while walking the CIGAR operations of one
 * alignment. A reference skip (N) closes the current block; any other
 * reference-consuming operation (M, D, =, X) extends it. Operations that
 * do not consume the reference (I, S, H, P) are ignored.
 */
class cigar_block_builder {
public:
    explicit cigar_block_builder(size_t ref_start);

    void add(size_t length, bool consumes_reference, bool ref_skip);

    // Close the open block and return all blocks
    std::vector<alignment_block> finish();

private:
    size_t ref_pos;
    size_t block_start;
    std::vector<alignment_block> blocks;
};

/**
 * Streams alignment records out of PSL, BED12, SAM or BAM files.
 * The input format is detected from the file content.
 */
class alignment_loader {
public:
    struct config {
        uint8_t min_mapq = 0;  // SAM/BAM only
    };

    struct stats {
        size_t records = 0;
        size_t skipped_lines = 0;
    };

    using callback = std::function<void(const alignment_record&)>;

    alignment_loader() : alignment_loader(config{}) {}
    explicit alignment_loader(const config& cfg);

    /**
     * Read every alignment of a file and pass it to the callback
     * @throws std::runtime_error for unreadable or unsupported files
     */
    stats load(const std::filesystem::path& path, const callback& on_record);

    /**
     * Split a SAM/BAM record into aligned blocks at CIGAR N operations.
     * M, =, X and D extend the current block.
     */
    static alignment_record from_sam_entry(const gio::sam_entry& entry);

private:
    config cfg_;

    stats load_psl(const std::filesystem::path& path, const callback& on_record);
    stats load_bed(const std::filesystem::path& path, const callback& on_record);
    stats load_sam(const std::filesystem::path& path, const callback& on_record);
};

#endif //ISOWEAVE_ALIGNMENT_LOADER_HPP
