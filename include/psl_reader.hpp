/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef ISOWEAVE_PSL_READER_HPP
#define ISOWEAVE_PSL_READER_HPP

// standard
#include <filesystem>
#include <string>

// class
#include "file_entries.hpp"
#include "file_reader.hpp"

/**
 * Reader for PSL alignments (BLAT / GMAP output), plain or gzipped.
 * Only the target name, block sizes and target starts are extracted.
 * The psLayout header and malformed lines are skipped and counted.
 */
class psl_reader : public file_reader<alignment_record> {
public:
    explicit psl_reader(const std::filesystem::path& filepath);

    bool read_next(alignment_record& entry) override;
    bool has_next() override { return !eof_reached; }
    std::string get_error_message() override { return error_message; }
    size_t get_current_line() override { return reader.get_line_number(); }

    size_t get_skipped_lines() const { return skipped_lines; }

    // Parse one PSL data line; false if the line is not a valid alignment
    static bool parse_line(const std::string& line, alignment_record& entry);

private:
    line_reader reader;
    bool eof_reached;
    size_t skipped_lines;
    std::string error_message;
};

#endif //ISOWEAVE_PSL_READER_HPP
