#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "chunk.hpp"
#include "reassembler.hpp"

namespace QrTransfer
{
    namespace Session
    {

        enum class ScanState
        {
            Empty,
            Collecting,
            Complete
        };

        enum class ScanOutcome
        {
            Started,   // First chunk of a transfer
            Added,     // New index for the current transfer
            Duplicate, // Index already received, ignored
            Completed, // Every index of the transfer is now present
            Restarted, // Chunk from another transfer replaced the previous set
            Rejected   // Not usable: malformed scan, bad index/total, or over the ceiling
        };

        std::string toString(ScanState state);
        std::string toString(ScanOutcome outcome);

        struct ScanProgress
        {
            ScanState state = ScanState::Empty;
            std::string fingerprint;
            std::uint32_t total = 0;
            size_t received = 0;
            std::vector<std::uint32_t> missing; // Ascending
        };

        // Accumulates chunks scanned one at a time until a transfer is complete.
        // A transfer is keyed by (fingerprint, total); a chunk with a different key
        // discards whatever was collected so far. The codec itself stays stateless.
        class ScanSession
        {
        public:
            explicit ScanSession(size_t max_chunk_count);

            // Completed takes precedence over Started/Added/Restarted when the chunk
            // finishes the transfer.
            ScanOutcome accept(const Chunks::Chunk &chunk);

            // Decode raw scanned text first. Undecodable text is Rejected and leaves the
            // session untouched.
            ScanOutcome acceptWire(const std::string &text);

            ScanProgress progress() const;

            // IncompleteSet unless the session is Complete
            Chunks::ReassemblyResult reassemble() const;

            // Discard everything (cancellation)
            void reset();

        private:
            ScanState stateLocked() const;

            std::string fingerprint;
            std::uint32_t total = 0;
            std::map<std::uint32_t, Chunks::Chunk> received; // index -> chunk
            size_t max_chunk_count;
            mutable std::mutex mtx; // Mutex for thread-safe access to the collected chunks
        };

    } // namespace Session
} // namespace QrTransfer
