#pragma once

#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunk.hpp"
#include "transfer_error.hpp"

namespace QrTransfer
{
    namespace Chunks
    {

        // Outcome of a reassembly attempt: either the recovered value or the reason
        // the chunk set was refused.
        struct ReassemblyResult
        {
            std::optional<nlohmann::json> value;
            TransferError error = TransferError::None;

            bool ok() const { return error == TransferError::None && value.has_value(); }

            static ReassemblyResult success(nlohmann::json recovered);
            static ReassemblyResult failure(TransferError reason);
        };

        class Reassembler
        {
        public:
            // Validate a candidate chunk set and decode it back into the original value.
            // Chunks may be in any order. Checks, in order: non-empty, count matches the
            // declared total, all chunks share fingerprint/total/version, indices are
            // exactly 1..total, the joined payload hashes to the declared fingerprint,
            // and the payload decodes. Never throws.
            static ReassemblyResult reassemble(std::vector<Chunk> chunks);
        };

    } // namespace Chunks
} // namespace QrTransfer
