/********************************************************************************
 *                                Warden Project                                *
 *                        Secure Audio Upload Ingestion                         *
 *                                                                              *
 *  Copyright (c) 2025 Oinkognito                                               *
 *  All rights reserved.                                                        *
 *                                                                              *
 *  License:                                                                    *
 *  This software is licensed under the BSD-3-Clause License. You may use,      *
 *  modify, and distribute this software under the conditions stated in the     *
 *  LICENSE file provided in the project root.                                  *
 *                                                                              *
 *  Warranty Disclaimer:                                                        *
 *  This software is provided "AS IS", without any warranties or guarantees,    *
 *  either expressed or implied, including but not limited to fitness for a     *
 *  particular purpose.                                                         *
 *                                                                              *
 *  Contributions:                                                              *
 *  Contributions are welcome. By submitting code, you agree to license your    *
 *  contributions under the same BSD-3-Clause terms.                            *
 *                                                                              *
 *  See LICENSE file for full legal details.                                    *
 ********************************************************************************/

#include <libwarden/ingest/sanitizer.hpp>

#include <gtest/gtest.h>
#include <string>

using libwarden::ingest::RejectKind;
using libwarden::ingest::sanitize_filename;

TEST(SanitizerTest, AcceptsWhitelistedNamesUnchanged)
{
  for (const std::string name : {"note.wav", "my-recording_01.mp3", "A.B.c.flac", "x", "0.ogg"})
  {
    const auto verdict = sanitize_filename(name);
    ASSERT_TRUE(verdict.ok()) << name;
    EXPECT_EQ(verdict.value().str(), name);
  }
}

TEST(SanitizerTest, RejectsTraversalScenario)
{
  const auto verdict = sanitize_filename("../../etc/passwd");
  ASSERT_FALSE(verdict.ok());
  EXPECT_EQ(verdict.kind(), RejectKind::PathTraversal);
}

TEST(SanitizerTest, RejectsAnyDirectoryComponent)
{
  for (const std::string name :
       {"a/b.wav", "/tmp/note.wav", "dir\\note.wav", "C:\\Users\\x\\note.wav", "./note.wav"})
  {
    const auto verdict = sanitize_filename(name);
    ASSERT_FALSE(verdict.ok()) << name;
    EXPECT_EQ(verdict.kind(), RejectKind::PathTraversal) << name;
  }
}

TEST(SanitizerTest, RejectsEmptyBasename)
{
  EXPECT_EQ(sanitize_filename("").kind(), RejectKind::PathTraversal);
  EXPECT_EQ(sanitize_filename("uploads/").kind(), RejectKind::PathTraversal);
  EXPECT_EQ(sanitize_filename("\\").kind(), RejectKind::PathTraversal);
}

TEST(SanitizerTest, RejectsDotDotAnywhere)
{
  EXPECT_FALSE(sanitize_filename("..").ok());
  EXPECT_FALSE(sanitize_filename("note..wav").ok());
  EXPECT_FALSE(sanitize_filename("note.wav..").ok());
}

TEST(SanitizerTest, RejectsControlCharacters)
{
  const std::string with_nul("note\0.wav", 9);
  EXPECT_EQ(sanitize_filename(with_nul).kind(), RejectKind::PathTraversal);
  EXPECT_EQ(sanitize_filename("note\r.wav").kind(), RejectKind::PathTraversal);
  EXPECT_EQ(sanitize_filename("note\n.wav").kind(), RejectKind::PathTraversal);
  EXPECT_EQ(sanitize_filename("note\t.wav").kind(), RejectKind::PathTraversal);
}

TEST(SanitizerTest, RejectsCharactersOutsideWhitelist)
{
  for (const std::string name :
       {"my note.wav", "note;rm.wav", "n\xC3\xBCte.wav", "note$.wav", "note%00.wav", "a:b.wav"})
  {
    EXPECT_FALSE(sanitize_filename(name).ok()) << name;
  }
}

TEST(SanitizerTest, RejectsHiddenNames)
{
  EXPECT_FALSE(sanitize_filename(".wav").ok());
  EXPECT_FALSE(sanitize_filename(".hidden.mp3").ok());
}

TEST(SanitizerTest, EnforcesLengthLimit)
{
  const std::string at_limit    = std::string(251, 'a') + ".wav";
  const std::string over_limit  = std::string(252, 'a') + ".wav";
  const std::string short_limit = "abcdef.wav";

  EXPECT_EQ(at_limit.size(), 255u);
  EXPECT_TRUE(sanitize_filename(at_limit).ok());
  EXPECT_FALSE(sanitize_filename(over_limit).ok());

  EXPECT_FALSE(sanitize_filename(short_limit, 5).ok());
  EXPECT_TRUE(sanitize_filename(short_limit, short_limit.size()).ok());
}

TEST(SanitizerTest, RejectionDetailIsNotTheRawName)
{
  const auto verdict = sanitize_filename("../../etc/passwd");
  ASSERT_FALSE(verdict.ok());
  EXPECT_EQ(verdict.rejection().detail.find("passwd"), std::string::npos);
}
