#include "payload_serializer.hpp"
#include <stdexcept> // For std::runtime_error, std::invalid_argument

namespace QrTransfer
{
    namespace Codec
    {

        std::string PayloadSerializer::serialize(const nlohmann::json &value)
        {
            try
            {
                return value.dump();
            }
            catch (const nlohmann::json::type_error &e)
            {
                throw std::invalid_argument(std::string("Payload is not serializable: ") + e.what());
            }
        }

        nlohmann::json PayloadSerializer::deserialize(const std::string &text)
        {
            try
            {
                return nlohmann::json::parse(text);
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw std::runtime_error(std::string("Error parsing payload JSON: ") + e.what());
            }
        }

    } // namespace Codec
} // namespace QrTransfer
