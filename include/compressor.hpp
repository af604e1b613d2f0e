#pragma once

#include <string>
#include <vector>

namespace QrTransfer
{
    namespace Codec
    {

        // gzip compression of serialized payloads (zlib)
        class Compressor
        {
        public:
            // Throws std::runtime_error if zlib fails
            static std::vector<unsigned char> compress(const std::string &text);

            // Throws std::runtime_error on a corrupt, truncated or oversized stream,
            // or when bytes follow the end of the gzip member.
            static std::string decompress(const std::vector<unsigned char> &compressed);
        };

    } // namespace Codec
} // namespace QrTransfer
