#pragma once

#include <optional>
#include <string>
#include <vector>
#include <cstddef>

#include <nlohmann/json.hpp>

#include "chunk.hpp"
#include "chunk_config.hpp"
#include "reassembler.hpp"

namespace QrTransfer
{

    class TransferCodec
    {
    public:
        // --- Export path ---

        // Serialize, gzip and base64 the value, then split it into chunks of at most
        // max_chunk_size characters. Logs a warning above recommended_max_chunks chunks.
        // Throws std::invalid_argument if the value cannot be serialized or its
        // serialized text is larger than ChunkConfig::MAX_INFLATED_SIZE.
        static std::vector<Chunks::Chunk> compressAndChunk(const nlohmann::json &data,
                                                           size_t max_chunk_size = Config::ChunkConfig::MAX_CHUNK_SIZE,
                                                           size_t recommended_max_chunks = Config::ChunkConfig::RECOMMENDED_MAX_CHUNKS);

        // Text for one QR symbol
        static std::string encodeChunkToWire(const Chunks::Chunk &chunk);

        // --- Import path ---

        // std::nullopt if the scanned text is not a chunk
        static std::optional<Chunks::Chunk> decodeChunkFromWire(const std::string &text);

        // std::nullopt on any validation or decoding failure
        static std::optional<nlohmann::json> reassembleChunks(const std::vector<Chunks::Chunk> &chunks);

        // Same as reassembleChunks but reports why a set was refused
        static Chunks::ReassemblyResult reassembleChunksDetailed(const std::vector<Chunks::Chunk> &chunks);

        // --- Feedback ---

        // Total slice length as "N bytes" or "X.Y KB"
        static std::string reportedSize(const std::vector<Chunks::Chunk> &chunks);
    };

} // namespace QrTransfer
