/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef ISOWEAVE_FILE_READER_HPP
#define ISOWEAVE_FILE_READER_HPP

// standard
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

// zlib
#include <zlib.h>

// Base class for all file readers
class file_reader_base {
    public:
        virtual bool has_next() = 0;
        virtual std::string get_error_message() = 0;
        virtual size_t get_current_line() = 0;
        virtual ~file_reader_base() = default;
};

// Templated derived class for type-specific reading
template<typename EntryType>
class file_reader : public file_reader_base {
    public:
        virtual bool read_next(EntryType& entry) = 0;
};

/**
 * Line-oriented input through zlib. gzopen() reads uncompressed files
 * transparently, so one code path serves plain and gzipped text.
 */
class line_reader {
    public:
        explicit line_reader(const std::filesystem::path& path);
        ~line_reader();

        line_reader(const line_reader&) = delete;
        line_reader& operator=(const line_reader&) = delete;

        /**
         * Read the next line without its trailing newline / carriage return
         * @return false at end of input
         * @throws std::runtime_error on a decompression error
         */
        bool next_line(std::string& line);

        size_t get_line_number() const { return line_num; }

    private:
        gzFile file;
        std::filesystem::path path;
        size_t line_num;
};

// Split a line on a single delimiter, keeping empty fields
std::vector<std::string> split_fields(const std::string& line, char delim);

/**
 * Parse a comma-separated list of unsigned integers as used by the PSL
 * blockSizes/tStarts and BED blockSizes/blockStarts columns.
 * A trailing comma is accepted.
 * @throws std::invalid_argument on a non-numeric entry
 */
std::vector<size_t> parse_coordinate_list(const std::string& field);

#endif //ISOWEAVE_FILE_READER_HPP
