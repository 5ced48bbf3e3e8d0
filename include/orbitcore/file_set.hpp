/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCORE_FILE_SET_HPP
#define __ORBITCORE_FILE_SET_HPP

#include <orbitcore/time_system.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace orbitcore {

/**
 * One TLE file of a time-sliced set.
 */
struct TleFile {
    std::string filename;
    std::string content;
    time_point epoch;   ///< Epoch of the first satellite in the file
};

/**
 * Index of the file that covers an instant: the largest i with
 * files[i].epoch <= instant, clamped to the first and last file.
 *
 * @param files Files sorted ascending by epoch
 * @return The index, or std::nullopt if there are no files
 */
std::optional<std::size_t> selectActiveFile(const std::vector<TleFile> &files, time_point instant);

/**
 * Epoch-sorted collection of TLE files with a cursor on the active one.
 */
class TimeSlicedFileSet {
public:
    TimeSlicedFileSet() = default;

    /**
     * Adds a file and keeps the set sorted by epoch. The cursor is cleared so
     * the next update() selects a file again.
     *
     * @throws std::invalid_argument if the content holds no parsable TLE
     */
    void addFile(const std::string &filename, const std::string &content);

    void clear();

    bool empty() const;
    std::size_t size() const;
    const std::vector<TleFile>& files() const;

    std::optional<std::size_t> currentIndex() const;

    /**
     * The file under the cursor, or nullptr before the first update().
     */
    const TleFile* currentFile() const;

    /**
     * Epoch of the earliest file.
     */
    std::optional<time_point> earliestEpoch() const;

    /**
     * Moves the cursor to the file covering the instant.
     *
     * @return true if the cursor moved, meaning the roster must be reloaded
     */
    bool update(time_point instant);

private:
    std::vector<TleFile> files_;
    std::optional<std::size_t> current_;
};

}

#endif
