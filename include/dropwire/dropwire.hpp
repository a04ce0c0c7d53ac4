#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace dropwire {
using Bytes = std::vector<std::uint8_t>;

static constexpr std::uint8_t kVersion = 2;
static constexpr std::uint16_t kDefaultPort = 9876;
static constexpr std::size_t kChunkSize = 64 * 1024;
static constexpr std::size_t kDigestLen = 32;   // SHA-256
static constexpr std::size_t kPublicKeyLen = 32; // X25519
} // namespace dropwire
