#include "base64_transcoder.hpp"
#include <limits>
#include <stdexcept> // For std::runtime_error

// OpenSSL base64 block codec
#include <openssl/evp.h>

namespace QrTransfer
{
    namespace Codec
    {

        namespace
        {
            bool isBase64Symbol(char c)
            {
                return (c >= 'A' && c <= 'Z') ||
                       (c >= 'a' && c <= 'z') ||
                       (c >= '0' && c <= '9') ||
                       c == '+' || c == '/';
            }
        }

        std::string Base64Transcoder::encode(const std::vector<unsigned char> &bytes)
        {
            if (bytes.empty())
            {
                return std::string();
            }
            if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max() / 4 * 3))
            {
                throw std::runtime_error("Payload too large to encode as base64.");
            }

            // 4 output characters per 3 input bytes, plus the NUL EVP_EncodeBlock writes
            std::vector<unsigned char> buffer(4 * ((bytes.size() + 2) / 3) + 1);
            const int written = EVP_EncodeBlock(buffer.data(), bytes.data(), static_cast<int>(bytes.size()));
            if (written < 0)
            {
                throw std::runtime_error("Failed to encode payload as base64.");
            }
            return std::string(reinterpret_cast<const char *>(buffer.data()), static_cast<size_t>(written));
        }

        std::vector<unsigned char> Base64Transcoder::decode(const std::string &text)
        {
            if (text.empty())
            {
                return std::vector<unsigned char>();
            }
            if (text.size() % 4 != 0)
            {
                throw std::runtime_error("Base64 length " + std::to_string(text.size()) + " is not a multiple of 4.");
            }
            if (text.size() > static_cast<size_t>(std::numeric_limits<int>::max()))
            {
                throw std::runtime_error("Base64 payload too large.");
            }

            // EVP_DecodeBlock treats '=' as zero bits wherever it appears, so the
            // alphabet and the padding position are checked here.
            size_t padding = 0;
            for (size_t i = 0; i < text.size(); ++i)
            {
                const char c = text[i];
                if (c == '=')
                {
                    if (i + 2 < text.size())
                    {
                        throw std::runtime_error("Base64 padding at position " + std::to_string(i));
                    }
                    ++padding;
                }
                else if (padding > 0 || !isBase64Symbol(c))
                {
                    throw std::runtime_error("Invalid base64 character at position " + std::to_string(i));
                }
            }

            std::vector<unsigned char> buffer(text.size() / 4 * 3);
            const int decoded = EVP_DecodeBlock(buffer.data(),
                                                reinterpret_cast<const unsigned char *>(text.data()),
                                                static_cast<int>(text.size()));
            if (decoded < 0 || static_cast<size_t>(decoded) != buffer.size())
            {
                throw std::runtime_error("Failed to decode base64 payload.");
            }

            // EVP_DecodeBlock emits a zero byte for every padding character
            buffer.resize(buffer.size() - padding);
            return buffer;
        }

    } // namespace Codec
} // namespace QrTransfer
