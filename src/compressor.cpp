#include "compressor.hpp"
#include "chunk_config.hpp"
#include <limits>
#include <stdexcept> // For std::runtime_error

#include <zlib.h>

namespace QrTransfer
{
    namespace Codec
    {

        namespace
        {
            // 15 bits of window plus 16 selects the gzip container instead of zlib's
            const int GZIP_WINDOW_BITS = 15 + 16;
            const int MEMORY_LEVEL = 8;
            const size_t OUTPUT_BLOCK_SIZE = 16 * 1024;
        }

        std::vector<unsigned char> Compressor::compress(const std::string &text)
        {
            if (text.size() > std::numeric_limits<uInt>::max())
            {
                throw std::runtime_error("Payload too large to compress: " + std::to_string(text.size()) + " bytes");
            }

            z_stream stream{};
            if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, GZIP_WINDOW_BITS, MEMORY_LEVEL,
                             Z_DEFAULT_STRATEGY) != Z_OK)
            {
                throw std::runtime_error("Failed to initialize deflate stream.");
            }

            std::vector<unsigned char> output(deflateBound(&stream, static_cast<uLong>(text.size())));
            stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(text.data()));
            stream.avail_in = static_cast<uInt>(text.size());
            stream.next_out = output.data();
            stream.avail_out = static_cast<uInt>(output.size());

            // deflateBound guarantees a single Z_FINISH call is enough
            const int rc = deflate(&stream, Z_FINISH);
            const uLong written = stream.total_out;
            deflateEnd(&stream);
            if (rc != Z_STREAM_END)
            {
                throw std::runtime_error("Failed to deflate payload (zlib code " + std::to_string(rc) + ").");
            }

            output.resize(static_cast<size_t>(written));
            return output;
        }

        std::string Compressor::decompress(const std::vector<unsigned char> &compressed)
        {
            if (compressed.empty())
            {
                throw std::runtime_error("Compressed payload is empty.");
            }
            if (compressed.size() > std::numeric_limits<uInt>::max())
            {
                throw std::runtime_error("Compressed payload too large.");
            }

            z_stream stream{};
            if (inflateInit2(&stream, GZIP_WINDOW_BITS) != Z_OK)
            {
                throw std::runtime_error("Failed to initialize inflate stream.");
            }

            stream.next_in = const_cast<Bytef *>(compressed.data());
            stream.avail_in = static_cast<uInt>(compressed.size());

            std::string output;
            std::vector<unsigned char> block(OUTPUT_BLOCK_SIZE);
            int rc = Z_OK;
            while (rc != Z_STREAM_END)
            {
                stream.next_out = block.data();
                stream.avail_out = static_cast<uInt>(block.size());

                rc = inflate(&stream, Z_NO_FLUSH);
                if (rc != Z_OK && rc != Z_STREAM_END)
                {
                    const std::string reason = stream.msg ? stream.msg : "zlib code " + std::to_string(rc);
                    inflateEnd(&stream);
                    throw std::runtime_error("Failed to inflate payload: " + reason);
                }

                const size_t produced = block.size() - stream.avail_out;
                if (output.size() + produced > Config::ChunkConfig::MAX_INFLATED_SIZE)
                {
                    inflateEnd(&stream);
                    throw std::runtime_error("Inflated payload exceeds " +
                                             std::to_string(Config::ChunkConfig::MAX_INFLATED_SIZE) + " bytes.");
                }
                output.append(reinterpret_cast<const char *>(block.data()), produced);

                // Input exhausted without reaching the end of the gzip member
                if (rc == Z_OK && stream.avail_in == 0 && produced == 0)
                {
                    inflateEnd(&stream);
                    throw std::runtime_error("Compressed payload is truncated.");
                }
            }

            const uInt trailing = stream.avail_in;
            inflateEnd(&stream);
            if (trailing != 0)
            {
                throw std::runtime_error("Unexpected " + std::to_string(trailing) + " bytes after compressed payload.");
            }
            return output;
        }

    } // namespace Codec
} // namespace QrTransfer
