#pragma once
#include <cstdint>
#include <vector>

#include "util/error.hpp"

namespace zip
{

// gzip container, best compression. The stream carries its own end marker and
// CRC, so decompress needs no external length.
airgap::Error compress(const std::vector<std::uint8_t> &in, std::vector<std::uint8_t> &out);

// Exact inverse of compress. Corrupt, truncated or trailing input yields
// CompressionError and leaves out empty.
airgap::Error decompress(const std::vector<std::uint8_t> &in, std::vector<std::uint8_t> &out);

}  // namespace zip
