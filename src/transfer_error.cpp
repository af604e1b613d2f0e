#include "transfer_error.hpp"

namespace QrTransfer
{

    std::string toString(TransferError error)
    {
        switch (error)
        {
        case TransferError::None:
            return "None";
        case TransferError::MalformedScan:
            return "MalformedScan";
        case TransferError::EmptySet:
            return "EmptySet";
        case TransferError::IncompleteSet:
            return "IncompleteSet";
        case TransferError::CrossTransferMixing:
            return "CrossTransferMixing";
        case TransferError::UnsupportedVersion:
            return "UnsupportedVersion";
        case TransferError::IndexGapOrDuplicate:
            return "IndexGapOrDuplicate";
        case TransferError::FinalIntegrityFailure:
            return "FinalIntegrityFailure";
        case TransferError::DecodeFailure:
            return "DecodeFailure";
        }
        return "Unknown";
    }

} // namespace QrTransfer
