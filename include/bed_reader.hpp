/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef ISOWEAVE_BED_READER_HPP
#define ISOWEAVE_BED_READER_HPP

// standard
#include <filesystem>
#include <string>

// class
#include "file_entries.hpp"
#include "file_reader.hpp"

/**
 * Reader for BED files, plain or gzipped.
 * BED12 lines yield one block per exon; lines with fewer than 12 columns
 * are read as a single block spanning chromStart-chromEnd.
 */
class bed_reader : public file_reader<alignment_record> {
public:
    explicit bed_reader(const std::filesystem::path& filepath);

    bool read_next(alignment_record& entry) override;
    bool has_next() override { return !eof_reached; }
    std::string get_error_message() override { return error_message; }
    size_t get_current_line() override { return reader.get_line_number(); }

    size_t get_skipped_lines() const { return skipped_lines; }

    static bool parse_line(const std::string& line, alignment_record& entry);

private:
    line_reader reader;
    bool eof_reached;
    size_t skipped_lines;
    std::string error_message;
};

#endif //ISOWEAVE_BED_READER_HPP
