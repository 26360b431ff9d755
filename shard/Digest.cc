#include "shard/Digest.hh"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>
#include <string>

namespace shard {

std::string sha1_hex(std::string_view bytes) {
  unsigned char hash[SHA_DIGEST_LENGTH];
  SHA1(reinterpret_cast<const unsigned char *>(bytes.data()), bytes.size(),
       hash);

  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (unsigned char byte : hash) {
    oss << std::setw(2) << static_cast<int>(byte);
  }
  return oss.str();
}

std::string stable_id(std::string_view key, size_t index,
                      std::string_view text) {
  std::string payload;
  payload.reserve(key.size() + text.size() + 24);  // NOLINT
  payload.append(key.data(), key.size());
  payload += '|';
  payload += std::to_string(index);
  payload += '|';
  payload.append(text.data(), text.size());
  return sha1_hex(payload);
}

}  // namespace shard
