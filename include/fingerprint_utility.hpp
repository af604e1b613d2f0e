#pragma once

#include <string>
#include <cstddef>

namespace QrTransfer
{
    namespace Integrity
    {

        class FingerprintUtility
        {
        public:
            // Length of every fingerprint produced by generateFingerprint
            static constexpr size_t FINGERPRINT_LENGTH = 8;

            // 32-bit polynomial rolling hash (hash * 31 + byte) of the whole string,
            // absolute value rendered in base 36 and left-padded with '0' to
            // FINGERPRINT_LENGTH characters.
            //
            // Not a cryptographic digest. It detects accidental corruption and mis-scans
            // and correlates chunks of one transfer; crafted collisions are trivial.
            // Anything exposed to an adversary needs a real digest or a signature.
            static std::string generateFingerprint(const std::string &payload);
        };

    } // namespace Integrity
} // namespace QrTransfer
