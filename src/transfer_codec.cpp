#include "transfer_codec.hpp"
#include "base64_transcoder.hpp"
#include "chunk_splitter.hpp"
#include "chunk_wire_codec.hpp"
#include "compressor.hpp"
#include "payload_serializer.hpp"
#include <iomanip> // For std::setprecision
#include <iostream>
#include <sstream>
#include <stdexcept> // For std::invalid_argument

namespace QrTransfer
{

    std::vector<Chunks::Chunk> TransferCodec::compressAndChunk(const nlohmann::json &data, size_t max_chunk_size,
                                                       size_t recommended_max_chunks)
    {
        const std::string serialized = Codec::PayloadSerializer::serialize(data);
        // The import side refuses to inflate past this, so such an export could never be read back
        if (serialized.size() > Config::ChunkConfig::MAX_INFLATED_SIZE)
        {
            throw std::invalid_argument("Serialized payload of " + std::to_string(serialized.size()) +
                                        " bytes exceeds the " + std::to_string(Config::ChunkConfig::MAX_INFLATED_SIZE) +
                                        " byte transfer limit.");
        }
        const std::vector<unsigned char> compressed = Codec::Compressor::compress(serialized);
        const std::string transcoded = Codec::Base64Transcoder::encode(compressed);

        std::vector<Chunks::Chunk> chunks = Chunks::ChunkSplitter::split(transcoded, max_chunk_size);

        std::cout << "Exported " << serialized.size() << " bytes as " << transcoded.size()
                  << " transcoded characters in " << chunks.size() << " chunk(s)." << std::endl;
        if (chunks.size() > recommended_max_chunks)
        {
            std::cerr << "Warning: export needs " << chunks.size() << " QR codes, more than the recommended "
                      << recommended_max_chunks << "." << std::endl;
        }
        return chunks;
    }

    std::string TransferCodec::encodeChunkToWire(const Chunks::Chunk &chunk)
    {
        return Wire::ChunkWireCodec::encode(chunk);
    }

    std::optional<Chunks::Chunk> TransferCodec::decodeChunkFromWire(const std::string &text)
    {
        return Wire::ChunkWireCodec::decode(text);
    }

    std::optional<nlohmann::json> TransferCodec::reassembleChunks(const std::vector<Chunks::Chunk> &chunks)
    {
        return Chunks::Reassembler::reassemble(chunks).value;
    }

    Chunks::ReassemblyResult TransferCodec::reassembleChunksDetailed(const std::vector<Chunks::Chunk> &chunks)
    {
        return Chunks::Reassembler::reassemble(chunks);
    }

    std::string TransferCodec::reportedSize(const std::vector<Chunks::Chunk> &chunks)
    {
        size_t total_bytes = 0;
        for (const auto &chunk : chunks)
        {
            total_bytes += chunk.slice.size();
        }

        std::ostringstream ss;
        if (total_bytes < 1024)
        {
            ss << total_bytes << " bytes";
        }
        else
        {
            ss << std::fixed << std::setprecision(1) << (static_cast<double>(total_bytes) / 1024.0) << " KB";
        }
        return ss.str();
    }

} // namespace QrTransfer
