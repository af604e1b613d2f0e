#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "chunk_config.hpp"

namespace QrTransfer {
namespace Chunks {

// One size-bounded slice of a transfer. Every chunk of a transfer carries the
// fingerprint of the whole transcoded payload, so membership can be checked
// as soon as a single chunk is scanned.
struct Chunk {
    std::uint32_t version = Config::ChunkConfig::FORMAT_VERSION;
    std::uint32_t index = 0; // 1-based position within the transfer
    std::uint32_t total = 0; // Number of chunks in the transfer
    std::string fingerprint;
    std::string slice;

    Chunk() = default;

    Chunk(std::uint32_t chunk_index, std::uint32_t chunk_total, std::string chunk_fingerprint, std::string chunk_slice)
        : index(chunk_index),
          total(chunk_total),
          fingerprint(std::move(chunk_fingerprint)),
          slice(std::move(chunk_slice)) {}

    // True if this chunk belongs to the same transfer as `other`
    bool sameTransfer(const Chunk& other) const;
};

bool operator==(const Chunk& lhs, const Chunk& rhs);
bool operator!=(const Chunk& lhs, const Chunk& rhs);

} // namespace Chunks
} // namespace QrTransfer
