#include "reassembler.hpp"
#include "base64_transcoder.hpp"
#include "chunk_config.hpp"
#include "compressor.hpp"
#include "fingerprint_utility.hpp"
#include "payload_serializer.hpp"
#include <algorithm> // For std::sort
#include <iostream>  // For logging
#include <stdexcept>
#include <string>

namespace QrTransfer
{
    namespace Chunks
    {

        ReassemblyResult ReassemblyResult::success(nlohmann::json recovered)
        {
            ReassemblyResult result;
            result.value = std::move(recovered);
            return result;
        }

        ReassemblyResult ReassemblyResult::failure(TransferError reason)
        {
            ReassemblyResult result;
            result.error = reason;
            return result;
        }

        ReassemblyResult Reassembler::reassemble(std::vector<Chunk> chunks)
        {
            if (chunks.empty())
            {
                std::cerr << "Reassembly failed: no chunks supplied" << std::endl;
                return ReassemblyResult::failure(TransferError::EmptySet);
            }

            const std::string expected_fingerprint = chunks.front().fingerprint;
            const std::uint32_t expected_total = chunks.front().total;
            const std::uint32_t expected_version = chunks.front().version;

            if (chunks.size() != expected_total)
            {
                std::cerr << "Missing chunks: got " << chunks.size() << ", expected " << expected_total << std::endl;
                return ReassemblyResult::failure(TransferError::IncompleteSet);
            }

            // Scan order is not trusted
            std::sort(chunks.begin(), chunks.end(),
                      [](const Chunk &a, const Chunk &b)
                      { return a.index < b.index; });

            for (const Chunk &chunk : chunks)
            {
                if (chunk.fingerprint != expected_fingerprint || chunk.total != expected_total)
                {
                    std::cerr << "Chunk " << chunk.index << " belongs to another transfer ("
                              << chunk.fingerprint << "/" << chunk.total << " vs "
                              << expected_fingerprint << "/" << expected_total << ")" << std::endl;
                    return ReassemblyResult::failure(TransferError::CrossTransferMixing);
                }
                if (chunk.version != expected_version || chunk.version != Config::ChunkConfig::FORMAT_VERSION)
                {
                    std::cerr << "Unsupported chunk format version " << chunk.version << std::endl;
                    return ReassemblyResult::failure(TransferError::UnsupportedVersion);
                }
            }

            // A duplicate index with a missing one passes the count check but not this one
            for (size_t k = 0; k < chunks.size(); ++k)
            {
                if (chunks[k].index != k + 1)
                {
                    std::cerr << "Missing chunk " << (k + 1) << std::endl;
                    return ReassemblyResult::failure(TransferError::IndexGapOrDuplicate);
                }
            }

            std::string transcoded;
            for (const Chunk &chunk : chunks)
            {
                transcoded += chunk.slice;
            }

            // The declared fingerprint is only a claim until the joined slices hash to it
            if (Integrity::FingerprintUtility::generateFingerprint(transcoded) != expected_fingerprint)
            {
                std::cerr << "Final hash validation failed for transfer " << expected_fingerprint << std::endl;
                return ReassemblyResult::failure(TransferError::FinalIntegrityFailure);
            }

            try
            {
                const std::vector<unsigned char> compressed = Codec::Base64Transcoder::decode(transcoded);
                const std::string serialized = Codec::Compressor::decompress(compressed);
                return ReassemblyResult::success(Codec::PayloadSerializer::deserialize(serialized));
            }
            catch (const std::exception &e)
            {
                std::cerr << "Failed to decompress/parse transfer " << expected_fingerprint << ": " << e.what() << std::endl;
                return ReassemblyResult::failure(TransferError::DecodeFailure);
            }
        }

    } // namespace Chunks
} // namespace QrTransfer
