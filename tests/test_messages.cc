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

#include <libwarden/ingest/messages.hpp>

#include <gtest/gtest.h>
#include <iterator>
#include <string>

using namespace libwarden::ingest;

namespace
{

struct Expected
{
  RejectKind  kind;
  const char* message;
  int         status;
};

constexpr Expected TABLE[] = {
  {RejectKind::PathTraversal, "Invalid filename provided", 400},
  {RejectKind::MissingExtension, "Invalid file format or content", 400},
  {RejectKind::UnsupportedExtension, "Invalid file format or content", 400},
  {RejectKind::ContentMismatch, "Invalid file format or content", 400},
  {RejectKind::UnrecognizedContent, "Invalid file format or content", 400},
  {RejectKind::SuspiciousContent, "Invalid file format or content", 400},
  {RejectKind::SizeExceeded, "File size exceeds maximum allowed size", 413},
  {RejectKind::TempFileAllocationFailure, "Internal server error occurred", 500},
  {RejectKind::DownstreamProcessingFailure, "Audio processing failed", 500},
};

} // namespace

TEST(MessagesTest, EveryKindMapsToItsGenericMessageAndStatus)
{
  static_assert(std::size(TABLE) == kRejectKindCount);

  for (const auto& row : TABLE)
  {
    EXPECT_EQ(generic_message(row.kind), row.message) << row.kind;
    EXPECT_EQ(http_status(row.kind), row.status) << row.kind;
  }
}

TEST(MessagesTest, ClientErrorNeverCarriesTheDetail)
{
  const auto rejection =
    reject(RejectKind::SuspiciousContent, "ExecutableHeader at offset 0 in ../../evil.exe");
  const auto error = make_client_error(rejection);

  EXPECT_EQ(error.status, 400);
  EXPECT_EQ(error.message, "Invalid file format or content");
  EXPECT_EQ(error.message.find("Executable"), std::string::npos);
  EXPECT_EQ(error.message.find("evil"), std::string::npos);
}

TEST(MessagesTest, KindNamesAreStable)
{
  EXPECT_EQ(to_string(RejectKind::PathTraversal), "PathTraversal");
  EXPECT_EQ(to_string(RejectKind::DownstreamProcessingFailure), "DownstreamProcessingFailure");
}
