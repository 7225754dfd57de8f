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

#if defined(_WIN32) || defined(_WIN64)
#define WARDEN_PLATFORM_WINDOWS 1
#elif defined(__linux__)
#define WARDEN_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define WARDEN_PLATFORM_APPLE 1
#endif

#if !defined(WARDEN_PLATFORM_LINUX) && !defined(WARDEN_PLATFORM_APPLE)
#error "libwarden relies on POSIX file and process APIs (open/fchmod/posix_spawn)."
#endif

// Visibility
#define WARDEN_API __attribute__((visibility("default")))
