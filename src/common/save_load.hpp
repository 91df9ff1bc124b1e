#ifndef STRATA_COMMON_SAVE_LOAD_HPP
#define STRATA_COMMON_SAVE_LOAD_HPP
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace Strata::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;

    namespace Detail {
        inline std::string to_lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char character) {
                return static_cast<char>(std::tolower(character));
            });
            return value;
        }

        // Optional lookups: absent keys yield nullopt, present keys of the wrong type throw.
        template <class Numeric>
        std::optional<Numeric> find_numeric(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            static_assert(std::is_arithmetic_v<Numeric>, "Numeric type required for property tree extraction.");
            const auto child = tree.get_child_optional(key);
            if (!child) {
                return std::nullopt;
            }
            const auto value = child->get_value_optional<Numeric>();
            if (!value) {
                std::ostringstream message;
                message << "Field '" << key << "' in " << context << " is not a valid number ('"
                        << child->data() << "').";
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        inline std::optional<bool> find_boolean(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto child = tree.get_child_optional(key);
            if (!child) {
                return std::nullopt;
            }
            const auto lowered = to_lower(child->data());
            if (lowered == "true" || lowered == "1") return true;
            if (lowered == "false" || lowered == "0") return false;
            std::ostringstream message;
            message << "Field '" << key << "' in " << context << " is not a boolean ('" << child->data() << "').";
            throw std::runtime_error(message.str());
        }

        inline std::optional<std::string> find_string(const PropertyTree& tree, const std::string& key)
        {
            const auto child = tree.get_child_optional(key);
            if (!child) {
                return std::nullopt;
            }
            return child->data();
        }
    }

    inline void write_json_file(const std::filesystem::path& path, const PropertyTree& tree)
    {
        std::ofstream stream(path);
        if (!stream) {
            std::ostringstream message;
            message << "Failed to open '" << path.string() << "' for writing.";
            throw std::runtime_error(message.str());
        }
        boost::property_tree::write_json(stream, tree, true);
    }

    inline PropertyTree read_json_file(const std::filesystem::path& path)
    {
        PropertyTree tree;
        try {
            boost::property_tree::read_json(path.string(), tree);
        } catch (const boost::property_tree::json_parser_error& error) {
            throw std::runtime_error("Failed to parse JSON file '" + path.string() + "': " + error.what());
        }
        return tree;
    }
}
#endif // STRATA_COMMON_SAVE_LOAD_HPP
