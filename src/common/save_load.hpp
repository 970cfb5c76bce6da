#ifndef PASTICHE_COMMON_SAVE_LOAD_HPP
#define PASTICHE_COMMON_SAVE_LOAD_HPP
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace Pastiche::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;

    namespace Detail {
        inline std::string to_lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char character) {
                return static_cast<char>(std::tolower(character));
            });
            return value;
        }

        template <class Numeric>
        Numeric get_numeric(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            static_assert(std::is_arithmetic_v<Numeric>, "Numeric type required for property tree extraction.");
            const auto child = tree.get_child_optional(key);
            if (!child) {
                std::ostringstream message;
                message << "Missing numeric field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            auto value = child->get_value_optional<Numeric>();
            if constexpr (std::is_unsigned_v<Numeric>) {
                // Stream extraction wraps "-1" into a large unsigned value.
                const auto& text = child->data();
                const auto first = std::find_if_not(text.begin(), text.end(), [](unsigned char character) {
                    return std::isspace(character) != 0;
                });
                if (first != text.end() && *first == '-') {
                    value.reset();
                }
            }
            if (!value) {
                std::ostringstream message;
                message << "Field '" << key << "' in " << context << " is not numeric";
                if constexpr (std::is_unsigned_v<Numeric>) {
                    message << " or is negative";
                }
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        inline std::string get_string(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto value = tree.get_optional<std::string>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing string field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        template <class T>
        std::vector<T> read_array(const PropertyTree& tree, const std::string& context)
        {
            std::vector<T> values;
            values.reserve(tree.size());
            for (const auto& child : tree) {
                try {
                    values.push_back(child.second.get_value<T>());
                } catch (const boost::property_tree::ptree_bad_data&) {
                    std::ostringstream message;
                    message << "Invalid array element in " << context;
                    throw std::runtime_error(message.str());
                }
            }
            return values;
        }

        template <class T>
        PropertyTree write_array(const std::vector<T>& values)
        {
            PropertyTree array;
            for (const auto& value : values) {
                PropertyTree element;
                element.put("", value);
                array.push_back({"", element});
            }
            return array;
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
        stream.flush();
        if (!stream) {
            throw std::runtime_error("Failed to write '" + path.string() + "'.");
        }
    }

    // Writes next to `path` then renames over it, so readers see either the old
    // or the new document and never a truncated one.
    inline void replace_json_file(const std::filesystem::path& path, const PropertyTree& tree)
    {
        auto staging = path;
        staging += ".partial";
        write_json_file(staging, tree);
        std::error_code error;
        std::filesystem::rename(staging, path, error);
        if (error) {
            throw std::runtime_error("Failed to replace '" + path.string() + "': " + error.message());
        }
    }

    inline PropertyTree read_json_file(const std::filesystem::path& path)
    {
        PropertyTree tree;
        try {
            boost::property_tree::read_json(path.string(), tree);
        } catch (const boost::property_tree::json_parser_error& error) {
            throw std::runtime_error("Failed to parse '" + path.string() + "': " + error.what());
        }
        return tree;
    }
}
#endif // PASTICHE_COMMON_SAVE_LOAD_HPP
