/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef ISOWEAVE_FILETYPE_DETECTOR_HPP
#define ISOWEAVE_FILETYPE_DETECTOR_HPP

// standard
#include <filesystem>
#include <ios>
#include <string>
#include <tuple>

enum class filetype {
    PSL, BED, SAM, BAM, UNKNOWN
};

std::string filetype_name(filetype ftype);

class filetype_detector {
public:
    /**
     * Sniff the first bytes of a file
     * @return detected type and whether the file is gzip/BGZF compressed
     * @throws std::runtime_error if the file cannot be opened
     */
    std::tuple<filetype, bool> detect_filetype(const std::filesystem::path& filepath);

    // exposed for tests
    std::tuple<filetype, bool> detect_plain_filetype(const char* buffer, std::streamsize size);

private:
    std::tuple<filetype, bool> detect_gzipped_filetype(const std::filesystem::path& filepath);
};

#endif //ISOWEAVE_FILETYPE_DETECTOR_HPP
