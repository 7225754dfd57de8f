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

#include <boost/filesystem/path.hpp>
#include <boost/log/trivial.hpp>
#include <optional>
#include <string>
#include <string_view>

#include <libwarden/common/api/entry.hpp>

/*
 * LOGGER
 *
 * Thin wrapper around boost logger.
 *
 *   console -> std::clog, coloured (stdout belongs to the CLI result line)
 *   file    -> $WARDEN_LOG_DIR, else $HOME/.cache/warden/logs. Plain text, owner-only directory.
 *
 * Anything derived from an upload (filenames, content types, ...) MUST go through
 * libwarden::utils::log_safe before it reaches one of the log helpers.
 *
 */

// Force ANSI Colors (Ignoring Terminal Themes)
#define RESET  "\033[0m\033[39m\033[49m" // Reset all styles and colors
#define BOLD   "\033[1m"                 // Bold text
#define RED    "\033[38;5;124m"          // Gruvbox Red (#cc241d)
#define GREEN  "\033[38;5;142m"          // Gruvbox Green (#98971a)
#define YELLOW "\033[38;5;214m"          // Gruvbox Yellow (#d79921)
#define BLUE   "\033[38;5;109m"          // Gruvbox Blue (#458588)
#define PURPLE "\033[38;5;141m"          // Gruvbox Purple (#b16286) -> For TRACE logs

constexpr const char* ANSI_REGEX    = "\033\\[[0-9;]*m";
constexpr const char* REL_PATH_LOGS = ".cache/warden/logs";

#define LOG_FMT(str) BOLD str RESET

#define LOG_CATEGORIES                  \
  X(SANITIZE, "#SANITIZE_LOG       ")   \
  X(EXTENSION, "#EXTENSION_LOG      ")  \
  X(SIGNATURE, "#SIGNATURE_LOG      ")  \
  X(SCANNER, "#SCANNER_LOG        ")    \
  X(TEMPFILE, "#TEMPFILE_LOG       ")   \
  X(PIPELINE, "#PIPELINE_LOG       ")   \
  X(TRANSCRIBE, "#TRANSCRIBE_LOG     ") \
  X(CONFIG, "#CONFIG_LOG         ")     \
  X(HEALTH, "#HEALTH_LOG         ")     \
  X(CLI, "#CLI_LOG            ")

// Generate string constants
#define X(name, str) constexpr const char* name##_LOG = LOG_FMT(str);
LOG_CATEGORIES
#undef X
#undef LOG_FMT

namespace libwarden::log
{

// In priority order
enum SeverityLevel
{
  __ERROR__,
  __WARNING__,
  __TRACE__,
  __INFO__,
  __DEBUG__
};

// Tag types, one per category. `NONE` logs without a prefix.
struct NONE
{
};

#define X(name, str) \
  struct name        \
  {                  \
  };
LOG_CATEGORIES
#undef X

template <typename Tag> constexpr auto log_prefix() -> const char* { return ""; }

#define X(name, str) \
  template <> constexpr auto log_prefix<name>() -> const char* { return name##_LOG; }
LOG_CATEGORIES
#undef X

// Case-insensitive, accepts WARN as well as WARNING
auto parse_log_level(std::string_view name) -> std::optional<SeverityLevel>;
auto to_boost_severity(SeverityLevel level) -> boost::log::trivial::severity_level;

// Where the file sink writes, nullopt when neither WARDEN_LOG_DIR nor HOME is set
auto log_directory() -> std::optional<boost::filesystem::path>;

auto strip_ansi(const std::string& input) -> std::string;
auto get_current_timestamp() -> std::string;

// Safe to call more than once, sinks are only ever added by the first call
void init_logging();
void set_log_level(SeverityLevel level);

} // namespace libwarden::log
