#include "chunk_splitter.hpp"
#include "fingerprint_utility.hpp"
#include <algorithm> // For std::min
#include <cstdint>
#include <limits>
#include <stdexcept> // For std::invalid_argument

namespace QrTransfer
{
    namespace Chunks
    {

        std::vector<Chunk> ChunkSplitter::split(const std::string &transcoded, size_t max_chunk_size)
        {
            if (max_chunk_size == 0)
            {
                throw std::invalid_argument("Chunk size must be greater than zero.");
            }

            size_t total_chunks = transcoded.size() / max_chunk_size +
                                  (transcoded.size() % max_chunk_size != 0 ? 1 : 0);
            if (total_chunks == 0)
            {
                total_chunks = 1;
            }
            if (total_chunks > std::numeric_limits<std::uint32_t>::max())
            {
                throw std::invalid_argument("Payload needs too many chunks: " + std::to_string(total_chunks));
            }

            // Computed once over the whole payload, never per slice
            const std::string fingerprint = Integrity::FingerprintUtility::generateFingerprint(transcoded);

            std::vector<Chunk> chunks;
            chunks.reserve(total_chunks);
            for (size_t i = 0; i < total_chunks; ++i)
            {
                const size_t offset = i * max_chunk_size;
                const size_t len = std::min(max_chunk_size, transcoded.size() - std::min(offset, transcoded.size()));

                chunks.emplace_back(static_cast<std::uint32_t>(i + 1),
                                    static_cast<std::uint32_t>(total_chunks),
                                    fingerprint,
                                    transcoded.substr(std::min(offset, transcoded.size()), len));
            }
            return chunks;
        }

    } // namespace Chunks
} // namespace QrTransfer
