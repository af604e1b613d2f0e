#include "scan_session.hpp"
#include "chunk_config.hpp"
#include "chunk_wire_codec.hpp"
#include <iostream> // For logging

namespace QrTransfer
{
    namespace Session
    {

        std::string toString(ScanState state)
        {
            switch (state)
            {
            case ScanState::Empty:
                return "Empty";
            case ScanState::Collecting:
                return "Collecting";
            case ScanState::Complete:
                return "Complete";
            }
            return "Unknown";
        }

        std::string toString(ScanOutcome outcome)
        {
            switch (outcome)
            {
            case ScanOutcome::Started:
                return "Started";
            case ScanOutcome::Added:
                return "Added";
            case ScanOutcome::Duplicate:
                return "Duplicate";
            case ScanOutcome::Completed:
                return "Completed";
            case ScanOutcome::Restarted:
                return "Restarted";
            case ScanOutcome::Rejected:
                return "Rejected";
            }
            return "Unknown";
        }

        ScanSession::ScanSession(size_t max_chunk_count) : max_chunk_count(max_chunk_count)
        {
            std::cout << "ScanSession initialized (max " << max_chunk_count << " chunks)." << std::endl;
        }

        ScanState ScanSession::stateLocked() const
        {
            if (received.empty())
            {
                return ScanState::Empty;
            }
            return received.size() == total ? ScanState::Complete : ScanState::Collecting;
        }

        ScanOutcome ScanSession::accept(const Chunks::Chunk &chunk)
        {
            if (chunk.version != Config::ChunkConfig::FORMAT_VERSION)
            {
                std::cerr << "Rejected chunk with unsupported version " << chunk.version << std::endl;
                return ScanOutcome::Rejected;
            }
            if (chunk.total == 0 || chunk.index == 0 || chunk.index > chunk.total)
            {
                std::cerr << "Rejected chunk " << chunk.index << "/" << chunk.total << ": index out of range" << std::endl;
                return ScanOutcome::Rejected;
            }
            if (chunk.total > max_chunk_count)
            {
                std::cerr << "Rejected transfer of " << chunk.total << " chunks, limit is " << max_chunk_count << std::endl;
                return ScanOutcome::Rejected;
            }

            std::lock_guard<std::mutex> lock(mtx);

            ScanOutcome outcome = ScanOutcome::Added;
            if (received.empty())
            {
                outcome = ScanOutcome::Started;
            }
            else if (!chunk.sameTransfer(received.begin()->second))
            {
                std::cout << "New transfer " << chunk.fingerprint << " replaces " << fingerprint
                          << " (" << received.size() << "/" << total << " chunks discarded)" << std::endl;
                received.clear();
                outcome = ScanOutcome::Restarted;
            }
            else if (received.count(chunk.index) != 0)
            {
                return ScanOutcome::Duplicate;
            }

            fingerprint = chunk.fingerprint;
            total = chunk.total;
            received.emplace(chunk.index, chunk);

            if (received.size() == total)
            {
                std::cout << "Transfer " << fingerprint << " complete (" << total << " chunks)." << std::endl;
                return ScanOutcome::Completed;
            }
            return outcome;
        }

        ScanOutcome ScanSession::acceptWire(const std::string &text)
        {
            std::optional<Chunks::Chunk> chunk = Wire::ChunkWireCodec::decode(text);
            if (!chunk)
            {
                return ScanOutcome::Rejected;
            }
            return accept(*chunk);
        }

        ScanProgress ScanSession::progress() const
        {
            std::lock_guard<std::mutex> lock(mtx);
            ScanProgress p;
            p.state = stateLocked();
            if (p.state == ScanState::Empty)
            {
                return p;
            }
            p.fingerprint = fingerprint;
            p.total = total;
            p.received = received.size();
            for (std::uint32_t i = 1; i <= total; ++i)
            {
                if (received.count(i) == 0)
                {
                    p.missing.push_back(i);
                }
            }
            return p;
        }

        Chunks::ReassemblyResult ScanSession::reassemble() const
        {
            std::vector<Chunks::Chunk> chunks;
            {
                std::lock_guard<std::mutex> lock(mtx);
                if (stateLocked() != ScanState::Complete)
                {
                    return Chunks::ReassemblyResult::failure(TransferError::IncompleteSet);
                }
                chunks.reserve(received.size());
                for (const auto &entry : received)
                {
                    chunks.push_back(entry.second);
                }
            }
            return Chunks::Reassembler::reassemble(std::move(chunks));
        }

        void ScanSession::reset()
        {
            std::lock_guard<std::mutex> lock(mtx);
            received.clear();
            fingerprint.clear();
            total = 0;
        }

    } // namespace Session
} // namespace QrTransfer
