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

#include <array>
#include <boost/filesystem/operations.hpp>
#include <boost/make_shared.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/regex.hpp>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <libwarden/common/macros.hpp>
#include <libwarden/common/types.hpp>
#include <libwarden/log-macros.hpp>
#include <libwarden/utils/math/entry.hpp>
#include <libwarden/utils/string/entry.hpp>
#include <mutex>
#include <sstream>

namespace libwarden::log
{

namespace
{

namespace bfs     = boost::filesystem;
namespace trivial = boost::log::trivial;
namespace sinks   = boost::log::sinks;
namespace expr    = boost::log::expressions;
namespace kw      = boost::log::keywords;

struct LevelInfo
{
  std::string_view        name;
  SeverityLevel           level;
  trivial::severity_level severity;
  const char*             colour;
  const char*             label;
};

constexpr std::array<LevelInfo, 5> LEVELS = {{
  {"ERROR", __ERROR__, trivial::error, RED, "[ERROR]   "},
  {"WARNING", __WARNING__, trivial::warning, YELLOW, "[WARN]    "},
  {"TRACE", __TRACE__, trivial::trace, PURPLE, "[TRACE]   "},
  {"INFO", __INFO__, trivial::info, GREEN, "[INFO]    "},
  {"DEBUG", __DEBUG__, trivial::debug, BLUE, "[DEBUG]   "},
}};

constexpr ByteCount LOG_ROTATION_SIZE = 10 * ONE_MIB;

auto info_for(trivial::severity_level severity) -> const LevelInfo&
{
  for (const auto& info : LEVELS)
  {
    if (info.severity == severity)
      return info;
  }
  return LEVELS[3];
}

auto record_severity(const boost::log::record_view& rec) -> trivial::severity_level
{
  const auto severity = rec[trivial::severity];
  return severity ? severity.get() : trivial::info;
}

auto record_message(const boost::log::record_view& rec) -> std::string
{
  const auto message = rec[expr::smessage];
  return message ? message.get() : std::string{};
}

void format_console(const boost::log::record_view& rec, boost::log::formatting_ostream& strm)
{
  const auto& info = info_for(record_severity(rec));
  strm << BOLD << "[" << get_current_timestamp() << "] " << info.colour << info.label << RESET
       << record_message(rec);
}

// No colours, plus the thread so concurrent uploads can be told apart
void format_file(const boost::log::record_view& rec, boost::log::formatting_ostream& strm)
{
  using thread_id = boost::log::attributes::current_thread_id::value_type;

  const auto& info = info_for(record_severity(rec));
  strm << "[" << get_current_timestamp() << "] " << info.label;
  if (const auto tid = boost::log::extract<thread_id>("ThreadID", rec))
    strm << "[" << tid.get() << "] ";
  strm << strip_ansi(record_message(rec));
}

void add_file_sink()
{
  const auto log_dir = log_directory();
  if (!log_dir)
  {
    std::cerr << "WARNING: Neither WARDEN_LOG_DIR nor HOME is set. File logging disabled.\n";
    return;
  }

  boost::system::error_code ec;
  bfs::create_directories(*log_dir, ec);
  if (ec)
  {
    std::cerr << "ERROR: Failed to create log directory: " << log_dir->string() << " ("
              << ec.message() << "). File logging disabled." << std::endl;
    return;
  }

  // Logs carry upload names and digests, keep them away from other users
  bfs::permissions(*log_dir, bfs::owner_all, ec);
  if (ec)
    std::cerr << "WARNING: Cannot restrict permissions of " << log_dir->string() << " ("
              << ec.message() << ")\n";

  using text_sink = sinks::synchronous_sink<sinks::text_file_backend>;
  auto file_sink  = boost::make_shared<text_sink>(
    kw::file_name     = (*log_dir / "warden_%Y-%m-%d_%H-%M-%S.log").string(),
    kw::rotation_size = LOG_ROTATION_SIZE, kw::auto_flush = true);

  file_sink->set_formatter(&format_file);
  boost::log::core::get()->add_sink(file_sink);
}

} // namespace

auto parse_log_level(std::string_view name) -> std::optional<SeverityLevel>
{
  std::string upper(name);
  for (char& c : upper)
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

  if (upper == "WARN")
    return __WARNING__;

  for (const auto& info : LEVELS)
  {
    if (info.name == upper)
      return info.level;
  }
  return std::nullopt;
}

auto to_boost_severity(SeverityLevel level) -> trivial::severity_level
{
  for (const auto& info : LEVELS)
  {
    if (info.level == level)
      return info.severity;
  }
  return trivial::info;
}

auto log_directory() -> std::optional<bfs::path>
{
  if (const char* dir = std::getenv(macros::ENV_LOG_DIR.data()); dir && *dir)
    return bfs::path(dir);

  if (const char* home = std::getenv("HOME"); home && *home)
    return bfs::path(home) / REL_PATH_LOGS;

  return std::nullopt;
}

auto strip_ansi(const std::string& input) -> std::string
{
  static const boost::regex ansi_regex(ANSI_REGEX);
  return boost::regex_replace(input, ansi_regex, "");
}

auto get_current_timestamp() -> std::string
{
  using namespace std::chrono;

  const auto        now    = system_clock::now();
  const auto        now_ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
  const std::time_t t      = system_clock::to_time_t(now);
  std::tm           local{};
  localtime_r(&t, &local);

  std::ostringstream oss;
  oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << now_ms.count();
  return oss.str();
}

void init_logging()
{
  static std::once_flag sinks_once;

  std::call_once(sinks_once,
                 []
                 {
                   auto console = boost::log::add_console_log(std::clog);
                   console->set_formatter(&format_console);
                   add_file_sink();
                   boost::log::add_common_attributes();
                 });

  const char* env_level = std::getenv(macros::ENV_LOG_LEVEL.data());
  if (!env_level)
  {
    set_log_level(__INFO__);
    return;
  }

  if (const auto level = parse_log_level(env_level))
  {
    set_log_level(*level);
  }
  else
  {
    set_log_level(__INFO__);
    WARN<CONFIG>("Invalid %1% '%2%', falling back to INFO", macros::ENV_LOG_LEVEL,
                 utils::log_safe(env_level, 16));
  }
}

void set_log_level(SeverityLevel level)
{
  boost::log::core::get()->set_filter(trivial::severity >= to_boost_severity(level));
}

} // namespace libwarden::log
