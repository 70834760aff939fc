#include "pairgate/security/crypto.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace pairgate::security {

namespace {

std::vector<unsigned char> random_bytes(const std::size_t count) {
  std::vector<unsigned char> data(count);
  if (count > 0 && RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return data;
}

std::string to_hex(const unsigned char *data, const std::size_t size) {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < size; ++i) {
    stream << std::setw(2) << static_cast<int>(data[i]);
  }
  return stream.str();
}

bool is_base64url_char(const char ch) {
  return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') ||
         ch == '-' || ch == '_';
}

} // namespace

std::string random_hex(const std::size_t bytes) {
  const auto data = random_bytes(bytes);
  return to_hex(data.data(), data.size());
}

std::string random_id() {
  auto data = random_bytes(16);
  data[6] = static_cast<unsigned char>((data[6] & 0x0F) | 0x40);
  data[8] = static_cast<unsigned char>((data[8] & 0x3F) | 0x80);
  const std::string hex = to_hex(data.data(), data.size());
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
         hex.substr(16, 4) + "-" + hex.substr(20);
}

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);
  return to_hex(digest, sizeof(digest));
}

std::string hmac_sha256(const std::string &key, const std::string &data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  const unsigned char *out =
      HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
           reinterpret_cast<const unsigned char *>(data.data()), data.size(), digest, &digest_len);
  if (out == nullptr) {
    throw std::runtime_error("HMAC-SHA256 failed");
  }
  return std::string(reinterpret_cast<const char *>(digest), digest_len);
}

std::string base64url_encode(const std::string &bytes) {
  if (bytes.empty()) {
    return "";
  }
  const int output_len = 4 * static_cast<int>((bytes.size() + 2) / 3);
  std::string output(static_cast<std::size_t>(output_len), '\0');
  EVP_EncodeBlock(reinterpret_cast<unsigned char *>(output.data()),
                  reinterpret_cast<const unsigned char *>(bytes.data()),
                  static_cast<int>(bytes.size()));
  while (!output.empty() && output.back() == '=') {
    output.pop_back();
  }
  for (char &ch : output) {
    if (ch == '+') {
      ch = '-';
    } else if (ch == '/') {
      ch = '_';
    }
  }
  return output;
}

common::Result<std::string> base64url_decode(const std::string &text) {
  if (text.empty()) {
    return common::Result<std::string>::success("");
  }
  if (text.size() % 4 == 1) {
    return common::Result<std::string>::failure("invalid base64url length");
  }

  std::string padded;
  padded.reserve(text.size() + 3);
  for (const char ch : text) {
    if (!is_base64url_char(ch)) {
      return common::Result<std::string>::failure("invalid base64url character");
    }
    padded.push_back(ch == '-' ? '+' : (ch == '_' ? '/' : ch));
  }
  const std::size_t padding = (4 - padded.size() % 4) % 4;
  padded.append(padding, '=');

  std::vector<unsigned char> decoded(padded.size());
  const int len =
      EVP_DecodeBlock(decoded.data(), reinterpret_cast<const unsigned char *>(padded.data()),
                      static_cast<int>(padded.size()));
  if (len < 0 || static_cast<std::size_t>(len) < padding) {
    return common::Result<std::string>::failure("invalid base64url input");
  }
  // EVP_DecodeBlock counts the padding bytes as zero output
  decoded.resize(static_cast<std::size_t>(len) - padding);
  return common::Result<std::string>::success(
      std::string(reinterpret_cast<const char *>(decoded.data()), decoded.size()));
}

bool constant_time_equals(const std::string &a, const std::string &b) {
  unsigned char hash_a[SHA256_DIGEST_LENGTH];
  unsigned char hash_b[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(a.data()), a.size(), hash_a);
  SHA256(reinterpret_cast<const unsigned char *>(b.data()), b.size(), hash_b);
  return CRYPTO_memcmp(hash_a, hash_b, SHA256_DIGEST_LENGTH) == 0;
}

} // namespace pairgate::security
