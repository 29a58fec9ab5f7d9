#include "identity.hpp"
#include "errors.hpp"

#include <openssl/evp.h>

namespace {
constexpr std::size_t kPeerIdLength = 32;
constexpr char kHexDigits[] = "0123456789abcdef";
} // namespace

std::string derive_peer_id(std::string_view name, std::string_view endpoint,
                           std::string_view source_address) {
  std::string input;
  input.reserve(name.size() + endpoint.size() + source_address.size() + 2);
  input.append(name).append(":").append(endpoint).append(":").append(
      source_address);

  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int md_len = 0;
  if (EVP_Digest(input.data(), input.size(), md, &md_len, EVP_sha256(),
                 nullptr) != 1) {
    throw InternalError("SHA-256 digest failed");
  }

  std::string id;
  id.reserve(kPeerIdLength);
  for (unsigned int i = 0; i < md_len && id.size() < kPeerIdLength; ++i) {
    id.push_back(kHexDigits[md[i] >> 4]);
    id.push_back(kHexDigits[md[i] & 0x0f]);
  }
  return id;
}

std::string resolve_peer_id(const std::optional<std::string>& requested,
                            std::string_view name, std::string_view endpoint,
                            std::string_view source_address) {
  if (requested && !requested->empty())
    return *requested;
  return derive_peer_id(name, endpoint, source_address);
}
