#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace QrTransfer
{
    namespace Codec
    {

        class PayloadSerializer
        {
        public:
            // Compact JSON text. Object keys come out sorted, so equal values always
            // produce the same text.
            // Throws std::invalid_argument if the value cannot be represented (e.g. a
            // string holding invalid UTF-8).
            static std::string serialize(const nlohmann::json &value);

            // Throws std::runtime_error on malformed text
            static nlohmann::json deserialize(const std::string &text);
        };

    } // namespace Codec
} // namespace QrTransfer
