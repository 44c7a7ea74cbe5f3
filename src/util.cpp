#include "peerlink/util.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <fstream>
#include <stdexcept>

namespace peerlink {

void ensure(bool ok, const char* msg) {
  if (!ok) throw std::runtime_error(msg);
}

void rand_bytes(std::uint8_t* out, std::size_t n) {
  if (n == 0) return;
  ensure(RAND_bytes(out, (int)n) == 1, "RAND_bytes failed");
}

Bytes rand_bytes(std::size_t n) {
  Bytes out(n);
  rand_bytes(out.data(), n);
  return out;
}

Bytes sha256(const Bytes& data) {
  Bytes out(32);
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  ensure(ctx != nullptr, "EVP_MD_CTX_new failed");
  unsigned int len = 0;
  bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
            EVP_DigestUpdate(ctx, data.data(), data.size()) == 1 &&
            EVP_DigestFinal_ex(ctx, out.data(), &len) == 1;
  EVP_MD_CTX_free(ctx);
  ensure(ok, "sha256 digest failed");
  ensure(len == 32, "sha256 length mismatch");
  return out;
}

std::string to_hex(const Bytes& data) {
  static const char digits[] = "0123456789abcdef";
  std::string s;
  s.reserve(data.size() * 2);
  for (std::uint8_t b : data) {
    s.push_back(digits[b >> 4]);
    s.push_back(digits[b & 0x0F]);
  }
  return s;
}

bool read_file(const std::string& path, Bytes& out) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  f.seekg(0, std::ios::end);
  std::streamsize n = f.tellg();
  if (n < 0) return false;
  f.seekg(0, std::ios::beg);
  out.resize((std::size_t)n);
  if (n > 0) f.read((char*)out.data(), n);
  return (bool)f;
}

} // namespace peerlink
