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

#include <boost/format.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_feature.hpp>
#include <ostream>
#include <string_view>
#include <type_traits>
#include <utility>

#include <libwarden/logger.hpp>

#define INIT_WARDEN_LOGGER()                                                                     \
  libwarden::log::init_logging();                                                                \
  libwarden::log::INFO<libwarden::log::NONE>(                                                    \
    "Warden logger initialized! Check WARDEN_LOG_LEVEL (environment variable) for which log " \
    "level this session is on!!");

/* ------------ LOGGING HELPERS --------------- */

template <typename T, typename = void> struct is_streamable : std::false_type
{
};

template <typename T>
struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<T>())>>
    : std::true_type
{
};

template <typename... Args> constexpr bool all_streamable_v = (is_streamable<Args>::value && ...);

namespace libwarden::log
{

// Format strings use boost::format positional placeholders: "%1% rejected (%2%)"
// A mismatched argument count never throws, the message is logged as far as it got.
template <typename... Args>
inline auto format_message(std::string_view fmt, Args&&... args) -> std::string
{
  boost::format f{std::string(fmt)};
  f.exceptions(boost::io::no_error_bits);
  (f % ... % std::forward<Args>(args));
  return f.str();
}

template <typename Tag, typename... Args>
inline void emit(SeverityLevel level, std::string_view fmt, Args&&... args)
{
  static_assert(all_streamable_v<Args...>,
                "One or more arguments passed to the log helpers cannot be streamed into "
                "boost::format. Consider converting types like std::filesystem::path to a "
                "string using .string().");

  auto& logger = boost::log::trivial::logger::get();
  BOOST_LOG_SEV(logger, to_boost_severity(level))
    << log_prefix<Tag>() << format_message(fmt, std::forward<Args>(args)...);
}

template <typename Tag, typename... Args> inline void INFO(std::string_view fmt, Args&&... args)
{
  emit<Tag>(__INFO__, fmt, std::forward<Args>(args)...);
}

template <typename Tag, typename... Args> inline void WARN(std::string_view fmt, Args&&... args)
{
  emit<Tag>(__WARNING__, fmt, std::forward<Args>(args)...);
}

template <typename Tag, typename... Args> inline void ERROR(std::string_view fmt, Args&&... args)
{
  emit<Tag>(__ERROR__, fmt, std::forward<Args>(args)...);
}

template <typename Tag, typename... Args> inline void DBG(std::string_view fmt, Args&&... args)
{
  emit<Tag>(__DEBUG__, fmt, std::forward<Args>(args)...);
}

template <typename Tag, typename... Args> inline void TRACE(std::string_view fmt, Args&&... args)
{
  emit<Tag>(__TRACE__, fmt, std::forward<Args>(args)...);
}

} // namespace libwarden::log
