/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "file_reader.hpp"

// standard
#include <stdexcept>

line_reader::line_reader(const std::filesystem::path& path)
    : file(nullptr), path(path), line_num(0) {
    file = gzopen(path.string().c_str(), "rb");
    if (!file) {
        throw std::runtime_error("Failed to open file: " + path.string());
    }
}

line_reader::~line_reader() {
    if (file) {
        gzclose(file);
    }
}

bool line_reader::next_line(std::string& line) {
    line.clear();
    char buffer[4096];

    while (true) {
        if (gzgets(file, buffer, sizeof(buffer)) == nullptr) {
            int errnum = 0;
            const char* msg = gzerror(file, &errnum);
            if (errnum != Z_OK && errnum != Z_STREAM_END) {
                throw std::runtime_error("Error reading " + path.string() + ": " + msg);
            }
            // last line without a trailing newline
            if (!line.empty()) {
                line_num++;
                return true;
            }
            return false;
        }

        line.append(buffer);
        if (!line.empty() && line.back() == '\n') {
            break;
        }
    }

    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
    line_num++;
    return true;
}

std::vector<std::string> split_fields(const std::string& line, char delim) {
    std::vector<std::string> fields;
    size_t begin = 0;
    while (true) {
        size_t pos = line.find(delim, begin);
        if (pos == std::string::npos) {
            fields.push_back(line.substr(begin));
            break;
        }
        fields.push_back(line.substr(begin, pos - begin));
        begin = pos + 1;
    }
    return fields;
}

std::vector<size_t> parse_coordinate_list(const std::string& field) {
    std::vector<size_t> values;
    for (const auto& item : split_fields(field, ',')) {
        if (item.empty()) continue;
        size_t consumed = 0;
        unsigned long long value = std::stoull(item, &consumed);
        if (consumed != item.size()) {
            throw std::invalid_argument("Invalid coordinate: " + item);
        }
        values.push_back(static_cast<size_t>(value));
    }
    return values;
}
