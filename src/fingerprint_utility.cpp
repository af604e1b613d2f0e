#include "fingerprint_utility.hpp"
#include <cstdint>
#include <algorithm> // For std::reverse

namespace QrTransfer
{
    namespace Integrity
    {

        namespace
        {
            const char BASE36_DIGITS[] = "0123456789abcdefghijklmnopqrstuvwxyz";
        }

        std::string FingerprintUtility::generateFingerprint(const std::string &payload)
        {
            // Unsigned arithmetic wraps modulo 2^32
            std::uint32_t hash = 0;
            for (unsigned char c : payload)
            {
                hash = hash * 31u + c;
            }

            // Reinterpret as signed 32-bit and take the magnitude in 64 bits so that
            // INT32_MIN maps to 2147483648 instead of overflowing.
            const std::int32_t signed_hash = static_cast<std::int32_t>(hash);
            std::int64_t magnitude = signed_hash;
            if (magnitude < 0)
            {
                magnitude = -magnitude;
            }

            std::string digits;
            do
            {
                digits.push_back(BASE36_DIGITS[magnitude % 36]);
                magnitude /= 36;
            } while (magnitude > 0);
            std::reverse(digits.begin(), digits.end());

            if (digits.size() > FINGERPRINT_LENGTH)
            {
                digits.resize(FINGERPRINT_LENGTH);
            }
            return std::string(FINGERPRINT_LENGTH - digits.size(), '0') + digits;
        }

    } // namespace Integrity
} // namespace QrTransfer
