/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcore/file_set.hpp>
#include <orbitcore/satellite.hpp>

#include <algorithm>
#include <iterator>
#include <stdexcept>

#include <spdlog/spdlog.h>

using spdlog::info;

namespace orbitcore {

std::optional<std::size_t> selectActiveFile(const std::vector<TleFile> &files, time_point instant) {
    if (files.empty()) {
        return std::nullopt;
    }

    auto after = std::ranges::upper_bound(files, instant, {}, &TleFile::epoch);
    if (after == files.begin()) {
        return 0;
    }
    return static_cast<std::size_t>(std::distance(files.begin(), after)) - 1;
}

void TimeSlicedFileSet::addFile(const std::string &filename, const std::string &content) {
    auto epoch = firstEpoch(content);
    if (!epoch) {
        throw std::invalid_argument("No TLE entries found in " + filename);
    }

    TleFile file{filename, content, *epoch};
    auto pos = std::ranges::upper_bound(files_, file.epoch, {}, &TleFile::epoch);
    files_.insert(pos, std::move(file));
    current_.reset();

    info("Added TLE file {} with epoch {}", filename, formatInstantUTC(*epoch));
}

void TimeSlicedFileSet::clear() {
    files_.clear();
    current_.reset();
}

bool TimeSlicedFileSet::empty() const {
    return files_.empty();
}

std::size_t TimeSlicedFileSet::size() const {
    return files_.size();
}

const std::vector<TleFile>& TimeSlicedFileSet::files() const {
    return files_;
}

std::optional<std::size_t> TimeSlicedFileSet::currentIndex() const {
    return current_;
}

const TleFile* TimeSlicedFileSet::currentFile() const {
    return current_ ? &files_[*current_] : nullptr;
}

std::optional<time_point> TimeSlicedFileSet::earliestEpoch() const {
    if (files_.empty()) {
        return std::nullopt;
    }
    return files_.front().epoch;
}

bool TimeSlicedFileSet::update(time_point instant) {
    auto index = selectActiveFile(files_, instant);
    if (index == current_) {
        return false;
    }

    current_ = index;
    if (current_) {
        info("Switched to TLE file {} ({})", files_[*current_].filename, formatInstantUTC(instant));
    }
    return true;
}

}
