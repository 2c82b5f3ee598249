#pragma once

#include <cstddef>
#include <string>

namespace vault::server {

// Hex string of `byte_count` bytes from the OpenSSL CSPRNG. Throws std::runtime_error if the
// generator is not seeded.
std::string random_hex(std::size_t byte_count);

}  // namespace vault::server
