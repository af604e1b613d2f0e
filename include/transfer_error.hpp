#pragma once

#include <string>

namespace QrTransfer
{

    // Reasons a scanned chunk or a chunk set is refused.
    // None of these are fatal: callers are expected to prompt for a rescan.
    enum class TransferError
    {
        None,
        MalformedScan,         // Scanned text is not a chunk
        EmptySet,              // No chunks were supplied
        IncompleteSet,         // Chunk count differs from the declared total
        CrossTransferMixing,   // Chunks carry different fingerprints or totals
        UnsupportedVersion,    // Chunk format revision is not understood
        IndexGapOrDuplicate,   // Sorted indices are not exactly 1..total
        FinalIntegrityFailure, // Fingerprint of the joined payload does not match
        DecodeFailure          // base64, gzip or JSON decoding failed
    };

    std::string toString(TransferError error);

} // namespace QrTransfer
