#pragma once
#include "peerlink.hpp"
#include <string>
#include <cstddef>
#include <cstdint>

namespace peerlink {

void ensure(bool ok, const char* msg);

void rand_bytes(std::uint8_t* out, std::size_t n);
Bytes rand_bytes(std::size_t n);

Bytes sha256(const Bytes& data);
std::string to_hex(const Bytes& data);

bool read_file(const std::string& path, Bytes& out);

} // namespace peerlink
