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

#include <algorithm>
#include <charconv>
#include <initializer_list>
#include <iostream>
#include <map>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <libwarden/common/api/entry.hpp>

/*
 * `--key=value` / `--flag` command line parser for warden-ingest.
 *
 *   CmdLineParser parser(argv);       -> splits argv, throws on anything that is not --key[=value]
 *   parser.register_args({...});     -> checks every given key against what the tool understands
 *   parser.get<T>("key")             -> typed lookup
 *
 * Nothing is looked up before register_args() has accepted the command line.
 */

namespace libwarden::utils::cmdline
{

enum class ArgKind
{
  Flag,  // --health
  Value, // --file=<path>
};

struct CmdArg
{
  std::string name;
  ArgKind     kind;
  std::string value_name; // shown in usage, Value args only
  std::string description;
};

class WARDEN_API CmdLineParser
{
public:
  explicit CmdLineParser(std::span<char* const> argv)
  {
    for (std::size_t i = 1; i < argv.size(); ++i)
    {
      const std::string_view arg = argv[i];
      if (arg == "-h")
      {
        m_given.emplace("help", std::nullopt);
        continue;
      }

      if (!arg.starts_with("--") || arg.size() == 2)
        throw std::invalid_argument("Invalid argument format: " + std::string(arg));

      const auto eq_pos = arg.find('=');
      if (eq_pos == std::string_view::npos)
        m_given.insert_or_assign(std::string(arg.substr(2)), std::nullopt);
      else
        m_given.insert_or_assign(std::string(arg.substr(2, eq_pos - 2)),
                                 std::string(arg.substr(eq_pos + 1)));
    }
  }

  // Throws std::invalid_argument for unknown keys, flags carrying a value and values without one
  void register_args(std::initializer_list<CmdArg> args)
  {
    m_known.assign(args.begin(), args.end());

    for (const auto& [key, value] : m_given)
    {
      const auto* arg = find(key);
      if (!arg)
        throw std::invalid_argument("Unrecognized argument --" + key);
      if (arg->kind == ArgKind::Value && !value)
        throw std::invalid_argument("--" + key + " needs a value (--" + key + "=" +
                                    arg->value_name + ")");
      if (arg->kind == ArgKind::Flag && value)
        throw std::invalid_argument("--" + key + " does not take a value");
    }
  }

  template <typename T> auto get(const std::string& key) const -> std::optional<T>
  {
    const auto it = m_given.find(key);
    if (it == m_given.end() || !it->second)
      return std::nullopt;

    auto parsed = parse_value<T>(*it->second);
    if (!parsed)
      throw std::invalid_argument("Malformed value for --" + key);
    return parsed;
  }

  template <typename T> auto get_or(const std::string& key, T fallback) const -> T
  {
    return get<T>(key).value_or(std::move(fallback));
  }

  [[nodiscard]] auto has(const std::string& key) const -> bool { return m_given.contains(key); }

  void print_usage(std::ostream& os = std::cerr) const
  {
    os << "Usage: warden-ingest [options]\n";
    for (const auto& arg : m_known)
    {
      os << "  --" << arg.name;
      if (arg.kind == ArgKind::Value)
        os << "=" << arg.value_name;
      os << "\n      " << arg.description << "\n";
    }
  }

private:
  std::map<std::string, std::optional<std::string>> m_given;
  std::vector<CmdArg>                               m_known;

  [[nodiscard]] auto find(const std::string& key) const -> const CmdArg*
  {
    const auto it = std::ranges::find(m_known, key, &CmdArg::name);
    return it == m_known.end() ? nullptr : &*it;
  }

  template <typename T> static auto parse_value(const std::string& s) -> std::optional<T>
  {
    if constexpr (std::is_same_v<T, std::string>)
    {
      return s;
    }
    else if constexpr (std::is_integral_v<T>)
    {
      T out{};
      auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
      if (ec == std::errc() && ptr == s.data() + s.size())
        return out;
      return std::nullopt;
    }
    else
    {
      std::istringstream iss(s);
      T                  out;
      iss >> out;
      if (!iss.fail())
        return out;
      return std::nullopt;
    }
  }
};

} // namespace libwarden::utils::cmdline
