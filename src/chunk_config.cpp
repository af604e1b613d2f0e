#include "chunk_config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>  // For logging
#include <stdexcept> // For std::runtime_error

namespace fs = std::filesystem;

namespace QrTransfer
{
    namespace Config
    {

        const std::string ChunkConfig::DEFAULT_CONFIG_FILE_NAME = "qr_transfer.json";

        ChunkConfig ChunkConfig::load(const fs::path &config_path)
        {
            std::ifstream ifs(config_path);
            if (!ifs.is_open())
            {
                throw std::runtime_error("Failed to open config file for reading: " + config_path.string());
            }

            nlohmann::json j;
            try
            {
                ifs >> j;
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw std::runtime_error("Error parsing JSON config file " + config_path.string() + ": " + e.what());
            }
            ifs.close();

            if (!j.is_object())
            {
                throw std::runtime_error("Config file " + config_path.string() + " must contain a JSON object");
            }

            ChunkConfig config;
            try
            {
                if (j.contains("port"))
                {
                    j.at("port").get_to(config.port);
                }
                if (j.contains("max_chunk_count"))
                {
                    j.at("max_chunk_count").get_to(config.max_chunk_count);
                }
                if (j.contains("recommended_max_chunks"))
                {
                    j.at("recommended_max_chunks").get_to(config.recommended_max_chunks);
                }
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error("Invalid value in config file " + config_path.string() + ": " + e.what());
            }

            if (config.max_chunk_count == 0)
            {
                throw std::runtime_error("max_chunk_count must be at least 1");
            }

            std::cout << "Loaded config from " << config_path << std::endl;
            return config;
        }

        ChunkConfig ChunkConfig::loadOrDefault(const fs::path &config_path)
        {
            if (!fs::exists(config_path))
            {
                std::cout << "No config file at " << config_path << ", using defaults." << std::endl;
                return ChunkConfig();
            }
            return load(config_path);
        }

    } // namespace Config
} // namespace QrTransfer
