/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <orbitcore/file_set.hpp>

#include <chrono>
#include <stdexcept>
#include <string>

namespace orbitcore {
namespace {

using namespace std::chrono;

// Epoch 2023-11-01 00:00
constexpr const char* FILE_A =
    "ISS\n"
    "1 25544U 98067A   23305.00000000  .00016717  00000+0  30308-3 0  9991\n"
    "2 25544  51.6416 247.4627 0006703 130.5360 325.0288 15.50125391 42535\n";

// Epoch 2023-11-02 00:00
constexpr const char* FILE_B =
    "ISS\n"
    "1 25544U 98067A   23306.00000000  .00016717  00000+0  30308-3 0  9992\n"
    "2 25544  51.6416 242.4627 0006703 131.5360 326.0288 15.50125391 42699\n";

const time_point NOV_1 = sys_days{year{2023}/November/1};
const time_point NOV_2 = sys_days{year{2023}/November/2};

std::vector<TleFile> files() {
    return {
        {"a.tle", FILE_A, NOV_1},
        {"b.tle", FILE_B, NOV_2},
    };
}

// ============================================================================
// selectActiveFile Tests
// ============================================================================

TEST(SelectActiveFileTest, EmptySet) {
    EXPECT_FALSE(selectActiveFile({}, NOV_1).has_value());
}

TEST(SelectActiveFileTest, PicksLatestFileNotAfterInstant) {
    EXPECT_EQ(selectActiveFile(files(), NOV_1 + hours{12}), 0u);
    EXPECT_EQ(selectActiveFile(files(), NOV_2 + hours{12}), 1u);
}

TEST(SelectActiveFileTest, BoundaryBelongsToLaterFile) {
    EXPECT_EQ(selectActiveFile(files(), NOV_2), 1u);
    EXPECT_EQ(selectActiveFile(files(), NOV_2 - microseconds{1}), 0u);
}

TEST(SelectActiveFileTest, ClampsOutsideRange) {
    EXPECT_EQ(selectActiveFile(files(), NOV_1 - days{30}), 0u);
    EXPECT_EQ(selectActiveFile(files(), NOV_2 + days{30}), 1u);
}

// ============================================================================
// TimeSlicedFileSet Tests
// ============================================================================

class TimeSlicedFileSetTest : public ::testing::Test {
protected:
    TimeSlicedFileSet fileSet;
};

TEST_F(TimeSlicedFileSetTest, StartsEmpty) {
    EXPECT_TRUE(fileSet.empty());
    EXPECT_EQ(fileSet.currentFile(), nullptr);
    EXPECT_FALSE(fileSet.earliestEpoch().has_value());
    EXPECT_FALSE(fileSet.update(NOV_1));
}

TEST_F(TimeSlicedFileSetTest, AddFileSortsByEpoch) {
    fileSet.addFile("b.tle", FILE_B);
    fileSet.addFile("a.tle", FILE_A);

    ASSERT_EQ(fileSet.size(), 2);
    EXPECT_EQ(fileSet.files()[0].filename, "a.tle");
    EXPECT_EQ(fileSet.files()[0].epoch, NOV_1);
    EXPECT_EQ(fileSet.files()[1].filename, "b.tle");
    EXPECT_EQ(fileSet.earliestEpoch(), NOV_1);
}

TEST_F(TimeSlicedFileSetTest, AddFileWithoutTLEThrows) {
    EXPECT_THROW(fileSet.addFile("empty.tle", ""), std::invalid_argument);
    EXPECT_THROW(fileSet.addFile("names.tle", "ISS\nNOAA 19\n"), std::invalid_argument);
    EXPECT_TRUE(fileSet.empty());
}

TEST_F(TimeSlicedFileSetTest, SwitchesFilesAsTimeAdvances) {
    fileSet.addFile("a.tle", FILE_A);
    fileSet.addFile("b.tle", FILE_B);

    EXPECT_TRUE(fileSet.update(NOV_1));
    EXPECT_EQ(fileSet.currentFile()->filename, "a.tle");

    // Same file, nothing to reload
    EXPECT_FALSE(fileSet.update(NOV_1 + hours{23}));
    EXPECT_FALSE(fileSet.update(NOV_1 + hours{23}));

    EXPECT_TRUE(fileSet.update(NOV_2));
    EXPECT_EQ(fileSet.currentFile()->filename, "b.tle");
    EXPECT_EQ(fileSet.currentIndex(), 1u);
}

TEST_F(TimeSlicedFileSetTest, SwitchesBackwards) {
    fileSet.addFile("a.tle", FILE_A);
    fileSet.addFile("b.tle", FILE_B);
    fileSet.update(NOV_2 + hours{6});

    EXPECT_TRUE(fileSet.update(NOV_1 + hours{6}));
    EXPECT_EQ(fileSet.currentFile()->filename, "a.tle");
}

TEST_F(TimeSlicedFileSetTest, InstantBeforeFirstFileUsesFirst) {
    fileSet.addFile("a.tle", FILE_A);
    fileSet.addFile("b.tle", FILE_B);
    EXPECT_TRUE(fileSet.update(NOV_1 - days{365}));
    EXPECT_EQ(fileSet.currentIndex(), 0u);
}

TEST_F(TimeSlicedFileSetTest, AddingAFileForcesReselection) {
    fileSet.addFile("a.tle", FILE_A);
    EXPECT_TRUE(fileSet.update(NOV_1));

    fileSet.addFile("b.tle", FILE_B);
    EXPECT_EQ(fileSet.currentFile(), nullptr);
    EXPECT_TRUE(fileSet.update(NOV_1));
    EXPECT_EQ(fileSet.currentFile()->filename, "a.tle");
}

TEST_F(TimeSlicedFileSetTest, Clear) {
    fileSet.addFile("a.tle", FILE_A);
    fileSet.update(NOV_1);
    fileSet.clear();
    EXPECT_TRUE(fileSet.empty());
    EXPECT_EQ(fileSet.currentFile(), nullptr);
}

}
}
