#pragma once

#include <string>
#include <vector>

namespace QrTransfer
{
    namespace Codec
    {

        // Maps compressed bytes to the standard base64 alphabet so they survive
        // text-only QR payloads.
        class Base64Transcoder
        {
        public:
            static std::string encode(const std::vector<unsigned char> &bytes);

            // Strict decoding: the length must be a multiple of 4, only the base64
            // alphabet is allowed, and '=' may only pad the last two positions.
            // Throws std::runtime_error otherwise.
            static std::vector<unsigned char> decode(const std::string &text);
        };

    } // namespace Codec
} // namespace QrTransfer
