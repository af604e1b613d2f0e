#pragma once

#include <string>
#include <vector>
#include <cstddef>

#include "chunk.hpp"
#include "chunk_config.hpp"

namespace QrTransfer
{
    namespace Chunks
    {

        class ChunkSplitter
        {
        public:
            // Split a transcoded payload into ceil(length / max_chunk_size) chunks, in
            // index order, all sharing the fingerprint of the full payload.
            // An empty payload still yields one chunk with an empty slice.
            // Throws std::invalid_argument if max_chunk_size is 0 or the payload needs
            // more chunks than a 32-bit index can address.
            static std::vector<Chunk> split(const std::string &transcoded,
                                            size_t max_chunk_size = Config::ChunkConfig::MAX_CHUNK_SIZE);
        };

    } // namespace Chunks
} // namespace QrTransfer
