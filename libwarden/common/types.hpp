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

// Contains typedefs for the entire project

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

//[ Int types ]//
using ui8  = std::uint8_t;
using ui64 = std::uint64_t;

//[ DIRECTORY AND PATHS DEFS ]//
using Directory = std::string; // Directory represented as a string
using AbsPath   = std::string; // Absolute Path as a string (need not be of a file)

//[ UPLOAD DEFS ]//
using RawFileName = std::string; // Filename exactly as the client sent it. NEVER trust or log as-is!
using MimeType    = std::string; // Claimed Content-Type of the upload (untrusted)
using Extension   = std::string; // Lower-cased extension with the leading dot (ex: ".wav")
using HexDigest   = std::string; // Lower-case hex digest (SHA-256)
using Transcript  = std::string; // Text returned by the transcription collaborator

//[ BYTE DEFS ]//
using Byte       = ui8;
using ByteBuffer = std::vector<Byte>;
using ByteView   = std::span<const Byte>;
using ByteCount  = std::size_t;
using ByteOffset = std::size_t;

// NOTE: ByteView never owns anything. Any ByteView handed around in the ingest pipeline
// points into the UploadCandidate payload and is only valid as long as that candidate lives!
