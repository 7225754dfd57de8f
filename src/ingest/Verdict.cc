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

#include <libwarden/ingest/verdict.hpp>

namespace libwarden::ingest
{

auto to_string(RejectKind kind) -> std::string_view
{
  switch (kind)
  {
    case RejectKind::PathTraversal:
      return "PathTraversal";
    case RejectKind::MissingExtension:
      return "MissingExtension";
    case RejectKind::UnsupportedExtension:
      return "UnsupportedExtension";
    case RejectKind::ContentMismatch:
      return "ContentMismatch";
    case RejectKind::UnrecognizedContent:
      return "UnrecognizedContent";
    case RejectKind::SuspiciousContent:
      return "SuspiciousContent";
    case RejectKind::SizeExceeded:
      return "SizeExceeded";
    case RejectKind::TempFileAllocationFailure:
      return "TempFileAllocationFailure";
    case RejectKind::DownstreamProcessingFailure:
      return "DownstreamProcessingFailure";
  }

  return "Unknown";
}

} // namespace libwarden::ingest
