// docgraph/cache/body_hash.cpp - SHA-256 body hashing via OpenSSL EVP
#include "docgraph/cache/body_hash.hpp"

#include <fmt/format.h>
#include <openssl/evp.h>

#include <cctype>
#include <memory>
#include <stdexcept>

namespace docgraph
{

namespace
{

struct DigestContextDeleter
{
  void operator()(EVP_MD_CTX * ctx) const { EVP_MD_CTX_free(ctx); }
};

}  // namespace

std::string normalize_body(std::string_view body)
{
  std::string out;
  out.reserve(body.size());
  for (const char c : body) {
    if (std::isspace(static_cast<unsigned char>(c)) == 0) {
      out += c;
    }
  }
  return out;
}

std::string compute_hash(std::string_view body)
{
  const std::string normalized = normalize_body(body);

  std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new() failed");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (
    EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
    EVP_DigestUpdate(ctx.get(), normalized.data(), normalized.size()) != 1 ||
    EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
    throw std::runtime_error("SHA-256 digest failed");
  }

  std::string hex;
  hex.reserve(static_cast<size_t>(len) * 2);
  for (unsigned int i = 0; i < len; ++i) {
    hex += fmt::format("{:02x}", digest[i]);
  }
  return hex;
}

}  // namespace docgraph
