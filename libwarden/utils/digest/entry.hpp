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

#include <array>
#include <libwarden/common/types.hpp>
#include <memory>
#include <openssl/evp.h>
#include <optional>
#include <string_view>

namespace libwarden::utils::digest
{

namespace detail
{

struct MdCtxDeleter
{
  void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

inline auto to_hex(const unsigned char* data, std::size_t len) -> HexDigest
{
  static constexpr std::string_view HEX = "0123456789abcdef";

  HexDigest out;
  out.reserve(len * 2);
  for (std::size_t i = 0; i < len; ++i)
  {
    out.push_back(HEX[data[i] >> 4]);
    out.push_back(HEX[data[i] & 0x0F]);
  }
  return out;
}

} // namespace detail

// Lower-case hex SHA-256 of an in-memory payload, nullopt if OpenSSL refuses at any step
inline auto compute_sha256_hex(ByteView data) -> std::optional<HexDigest>
{
  const std::unique_ptr<EVP_MD_CTX, detail::MdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
    return std::nullopt;

  if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1)
    return std::nullopt;

  std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
  unsigned int                                md_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), md.data(), &md_len) != 1)
    return std::nullopt;

  return detail::to_hex(md.data(), md_len);
}

} // namespace libwarden::utils::digest
