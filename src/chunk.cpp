#include "chunk.hpp"

namespace QrTransfer
{
    namespace Chunks
    {

        bool Chunk::sameTransfer(const Chunk &other) const
        {
            return fingerprint == other.fingerprint && total == other.total;
        }

        bool operator==(const Chunk &lhs, const Chunk &rhs)
        {
            return lhs.version == rhs.version &&
                   lhs.index == rhs.index &&
                   lhs.total == rhs.total &&
                   lhs.fingerprint == rhs.fingerprint &&
                   lhs.slice == rhs.slice;
        }

        bool operator!=(const Chunk &lhs, const Chunk &rhs)
        {
            return !(lhs == rhs);
        }

    } // namespace Chunks
} // namespace QrTransfer
