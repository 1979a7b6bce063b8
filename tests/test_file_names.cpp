/**
 * @file test_file_names.cpp
 * @brief Tests for the display/file name sanitizer
 */

#include <gtest/gtest.h>

#include <string>

#include "mediagrab/FileNames.hpp"

using mediagrab::sanitizeFileName;

TEST(FileNames, RemovesForbiddenCharacters) {
    EXPECT_EQ(sanitizeFileName("a/b\\c*d?e:f\"g<h>i|j"), "Abcdefghij");
}

TEST(FileNames, TitleCasesWords) {
    EXPECT_EQ(sanitizeFileName("absolum - live @ fest.mp3"), "Absolum - Live @ Fest.Mp3");
    EXPECT_EQ(sanitizeFileName("LOUD SONG"), "Loud Song");
}

TEST(FileNames, DigitsStartNewWord) {
    EXPECT_EQ(sanitizeFileName("track01side.wav"), "Track01Side.Wav");
}

TEST(FileNames, TrimsWhitespace) {
    EXPECT_EQ(sanitizeFileName("   intro.flac \t\n"), "Intro.Flac");
}

TEST(FileNames, EmptyWhenNothingUsable) {
    EXPECT_EQ(sanitizeFileName(""), "");
    EXPECT_EQ(sanitizeFileName("  ?*:  "), "");
}

TEST(FileNames, KeepsNonAsciiBytes) {
    // "Été" stays untouched byte-wise, following ASCII letters stay lowercase
    EXPECT_EQ(sanitizeFileName("\xc3\x89t\xc3\xa9 song"), "\xc3\x89t\xc3\xa9 Song");
}

TEST(FileNames, FallbackName) {
    EXPECT_STREQ(mediagrab::fallbackFileName(), "unnamed_file");
}
