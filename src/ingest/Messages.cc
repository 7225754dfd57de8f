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

#include <libwarden/common/macros.hpp>
#include <libwarden/ingest/messages.hpp>

namespace libwarden::ingest
{

namespace
{

constexpr int HTTP_BAD_REQUEST       = 400;
constexpr int HTTP_PAYLOAD_TOO_LARGE = 413;
constexpr int HTTP_INTERNAL_ERROR    = 500;

} // namespace

auto generic_message(RejectKind kind) -> std::string_view
{
  switch (kind)
  {
    case RejectKind::PathTraversal:
      return macros::CLIENT_MSG_FILENAME;

    case RejectKind::MissingExtension:
    case RejectKind::UnsupportedExtension:
    case RejectKind::ContentMismatch:
    case RejectKind::UnrecognizedContent:
    case RejectKind::SuspiciousContent:
      return macros::CLIENT_MSG_VALIDATION;

    case RejectKind::SizeExceeded:
      return macros::CLIENT_MSG_FILE_SIZE;

    case RejectKind::TempFileAllocationFailure:
      return macros::CLIENT_MSG_SERVER_ERROR;

    case RejectKind::DownstreamProcessingFailure:
      return macros::CLIENT_MSG_PROCESSING;
  }

  return macros::CLIENT_MSG_FALLBACK;
}

auto http_status(RejectKind kind) -> int
{
  switch (kind)
  {
    case RejectKind::SizeExceeded:
      return HTTP_PAYLOAD_TOO_LARGE;

    case RejectKind::TempFileAllocationFailure:
    case RejectKind::DownstreamProcessingFailure:
      return HTTP_INTERNAL_ERROR;

    default:
      return HTTP_BAD_REQUEST;
  }
}

auto make_client_error(const Rejection& rejection) -> ClientError
{
  return ClientError{http_status(rejection.kind), std::string(generic_message(rejection.kind))};
}

} // namespace libwarden::ingest
