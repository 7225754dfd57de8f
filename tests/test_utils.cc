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

#include <gtest/gtest.h>

#include <array>
#include <boost/log/core.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/make_shared.hpp>
#include <cstdlib>
#include <libwarden/logger.hpp>
#include <sstream>
#include <libwarden/utils/cmd-line/parser.hpp>
#include <libwarden/utils/digest/entry.hpp>
#include <libwarden/utils/math/entry.hpp>
#include <libwarden/utils/string/entry.hpp>

#include "helpers.hpp"

using namespace libwarden::utils;
using warden_test::bytes;

TEST(LogSafeTest, ControlCharactersAreReplaced)
{
  EXPECT_EQ(log_safe("evil\r\nINFO forged\x1b[31m\x7f"), "evil__INFO forged_[31m_");
  EXPECT_EQ(log_safe(std::string("a\0b", 3)), "a_b");
}

TEST(LogSafeTest, LongInputIsTruncated)
{
  const std::string exact(255, 'a');
  EXPECT_EQ(log_safe(exact), exact);

  const std::string longer(300, 'b');
  const auto        out = log_safe(longer);
  EXPECT_EQ(out.size(), 255u + 3u);
  EXPECT_EQ(out.substr(255), "...");

  EXPECT_EQ(log_safe("abcdef", 3), "abc...");
}

TEST(StringUtilsTest, LowerTrimAndPrefix)
{
  EXPECT_EQ(to_lower_ascii("Track.MP3"), "track.mp3");
  EXPECT_EQ(trim("  \n text \t"), "text");
  EXPECT_EQ(trim("   "), "");
  EXPECT_TRUE(starts_with_icase("<SCRIPT src=x>", "<script"));
  EXPECT_FALSE(starts_with_icase("<scr", "<script"));
}

TEST(MathUtilsTest, HumanReadableSizes)
{
  EXPECT_EQ(math::bytesFormat(512), "512.00 B");
  EXPECT_EQ(math::bytesFormat(1536), "1.50 KiB");
  EXPECT_EQ(math::bytesFormat(25 * ONE_MIB), "25.00 MiB");
  EXPECT_DOUBLE_EQ(math::ratio(1, 4), 0.25);
  EXPECT_DOUBLE_EQ(math::ratio(3, 0), 0.0);
}

TEST(DigestTest, KnownSha256Vectors)
{
  EXPECT_EQ(digest::compute_sha256_hex(bytes("abc")).value(),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(digest::compute_sha256_hex(ByteView{}).value(),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(LoggerTest, LevelNamesParseCaseInsensitively)
{
  using namespace libwarden::log;

  EXPECT_EQ(parse_log_level("debug"), __DEBUG__);
  EXPECT_EQ(parse_log_level("Warn"), __WARNING__);
  EXPECT_EQ(parse_log_level("WARNING"), __WARNING__);
  EXPECT_EQ(parse_log_level("ERROR"), __ERROR__);
  EXPECT_FALSE(parse_log_level("verbose").has_value());
  EXPECT_EQ(to_boost_severity(__TRACE__), boost::log::trivial::trace);
}

TEST(LoggerTest, StripsColourCodes)
{
  EXPECT_EQ(libwarden::log::strip_ansi(std::string(RED) + "rejected" + RESET), "rejected");
}

TEST(LoggerTest, InvalidEnvironmentLevelIsLoggedSafely)
{
  namespace sinks = boost::log::sinks;
  using libwarden::log::__INFO__;

  warden_test::ScopedTempDir logs;
  ::setenv("WARDEN_LOG_DIR", logs.path().c_str(), 1);
  ::setenv("WARDEN_LOG_LEVEL", "\x1b[31mbad\r\nlevel", 1);

  auto captured = boost::make_shared<std::ostringstream>();
  auto backend  = boost::make_shared<sinks::text_ostream_backend>();
  backend->add_stream(captured);
  auto sink = boost::make_shared<sinks::synchronous_sink<sinks::text_ostream_backend>>(backend);
  boost::log::core::get()->add_sink(sink);

  libwarden::log::init_logging();

  boost::log::core::get()->remove_sink(sink);
  ::unsetenv("WARDEN_LOG_LEVEL");
  ::unsetenv("WARDEN_LOG_DIR");
  libwarden::log::set_log_level(__INFO__);

  const auto text = captured->str();
  const auto pos  = text.find("Invalid WARDEN_LOG_LEVEL");
  ASSERT_NE(pos, std::string::npos);

  // The category prefix before `pos` carries our own colour codes, the echoed value must not
  const auto line = text.substr(pos, text.find('\n', pos) - pos);
  EXPECT_NE(line.find("'_[31mbad__level'"), std::string::npos);
  EXPECT_EQ(line.find('\x1b'), std::string::npos);
  EXPECT_EQ(line.find('\r'), std::string::npos);
}

namespace
{

using libwarden::utils::cmdline::ArgKind;
using libwarden::utils::cmdline::CmdLineParser;

template <std::size_t N> auto parse(std::array<const char*, N> args) -> CmdLineParser
{
  CmdLineParser parser({const_cast<char* const*>(args.data()), args.size()});
  parser.register_args({
    {"file", ArgKind::Value, "<path>", "input"},
    {"retries", ArgKind::Value, "<n>", "attempts"},
    {"health", ArgKind::Flag, "", "report"},
    {"help", ArgKind::Flag, "", "usage"},
  });
  return parser;
}

} // namespace

TEST(CmdLineParserTest, ReadsValuesAndFlags)
{
  const auto parser =
    parse(std::array{"warden-ingest", "--file=/tmp/a.wav", "--health", "--retries=4"});

  EXPECT_EQ(parser.get<std::string>("file"), "/tmp/a.wav");
  EXPECT_EQ(parser.get<int>("retries"), 4);
  EXPECT_TRUE(parser.has("health"));
  EXPECT_FALSE(parser.has("help"));
  EXPECT_EQ(parser.get_or<std::string>("missing", "x"), "x");
}

TEST(CmdLineParserTest, ShortHelpMapsToHelp)
{
  EXPECT_TRUE(parse(std::array{"warden-ingest", "-h"}).has("help"));
}

TEST(CmdLineParserTest, RejectsMisuse)
{
  EXPECT_THROW(parse(std::array{"warden-ingest", "--bogus"}), std::invalid_argument);
  EXPECT_THROW(parse(std::array{"warden-ingest", "--file"}), std::invalid_argument);
  EXPECT_THROW(parse(std::array{"warden-ingest", "--health=yes"}), std::invalid_argument);
  EXPECT_THROW(parse(std::array{"warden-ingest", "positional"}), std::invalid_argument);
  EXPECT_THROW(parse(std::array{"warden-ingest", "--retries=many"}).get<int>("retries"),
               std::invalid_argument);
}
