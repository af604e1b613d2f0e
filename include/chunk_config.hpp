#pragma once

#include <string>
#include <cstddef>    // For size_t
#include <cstdint>
#include <filesystem> // For std::filesystem::path

namespace QrTransfer
{
    namespace Config
    {

        class ChunkConfig
        {
        public:
            // Maximum number of transcoded characters carried by one chunk.
            // QR v40 at error correction level H holds ~1273 bytes, the rest is
            // left for the wire envelope.
            static constexpr size_t MAX_CHUNK_SIZE = 1200;

            // Wire format revision written into every chunk
            static constexpr std::uint32_t FORMAT_VERSION = 1;

            // Exports above this many chunks still succeed but are logged as a warning
            static constexpr size_t RECOMMENDED_MAX_CHUNKS = 8;

            // Upper bound for an inflated payload
            static constexpr size_t MAX_INFLATED_SIZE = 16 * 1024 * 1024;

            // Name of the optional settings file looked up in the working directory
            static const std::string DEFAULT_CONFIG_FILE_NAME;

            // Service settings, overridable from a JSON file
            std::uint16_t port = 8080;
            size_t max_chunk_count = 64;
            size_t recommended_max_chunks = RECOMMENDED_MAX_CHUNKS;

            ChunkConfig() = default;

            // Load settings from a JSON file. Keys that are absent keep their defaults.
            // Throws std::runtime_error if the file cannot be read or parsed.
            static ChunkConfig load(const std::filesystem::path &config_path);

            // Load from the given path if it exists, otherwise return the defaults
            static ChunkConfig loadOrDefault(const std::filesystem::path &config_path);
        };

    } // namespace Config
} // namespace QrTransfer
