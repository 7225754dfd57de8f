#pragma once
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

#include <string>
#include <string_view>

#include <libwarden/common/api/entry.hpp>
#include <libwarden/ingest/verdict.hpp>

namespace libwarden::ingest
{

// What the HTTP boundary is allowed to tell the client. Nothing here is ever request derived.
struct ClientError
{
  int         status;
  std::string message;
};

WARDEN_API auto generic_message(RejectKind kind) -> std::string_view;
WARDEN_API auto http_status(RejectKind kind) -> int;

// Drops the rejection detail on purpose, it stays in our logs
WARDEN_API auto make_client_error(const Rejection& rejection) -> ClientError;

} // namespace libwarden::ingest
