#pragma once

#include <cstdint>
#include <functional>
#include <limits>
#include <type_traits>
#include <mutex>
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <filesystem>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

namespace shared_opts {
class Options {
public:
    using Provider = std::function<void(CLI::App&, const nlohmann::json&)>;

    enum class ParseResult { Ok, Help, Version, Error };

    static void add_provider(Provider p);
    /// Parse argv, after loading the JSON file named by -c/--config (if any) and
    /// letting every registered provider add its options with config-derived defaults.
    static ParseResult load_and_parse(int argc, char** argv, std::string& err);
    // Directory of the loaded config file (if any). Useful for resolving relative paths in providers.
    static std::optional<std::filesystem::path> get_config_dir();
    // Full path to loaded config file (if any)
    static std::optional<std::filesystem::path> get_config_file();

    /// Read `j[section][key]` as T; nullopt when the key is absent.
    /// \throws std::invalid_argument when the value has the wrong JSON type or is out of T's range.
    template <typename T>
    static std::optional<T> config_value(const nlohmann::json& j, const std::string& section, const std::string& key) {
        if (!j.is_object() || !j.contains(section) || !j[section].is_object()) return std::nullopt;
        const auto& s = j[section];
        if (!s.contains(key)) return std::nullopt;
        const auto& v = s[key];
        if constexpr (std::is_same_v<T, std::string>) {
            if (v.is_string()) return v.get<std::string>();
        } else if constexpr (std::is_same_v<T, bool>) {
            if (v.is_boolean()) return v.get<bool>();
        } else if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T>) {
            // Negative JSON integers are not unsigned and must not wrap around.
            if (v.is_number_unsigned() && v.get<std::uint64_t>() <= std::numeric_limits<T>::max()) return v.get<T>();
        } else if constexpr (std::is_integral_v<T>) {
            if (v.is_number_unsigned()) {
                if (v.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<T>::max())) return v.get<T>();
            } else if (v.is_number_integer()) {
                const auto n = v.get<std::int64_t>();
                if (n >= std::numeric_limits<T>::min() && n <= std::numeric_limits<T>::max()) return v.get<T>();
            }
        } else if constexpr (std::is_floating_point_v<T>) {
            if (v.is_number()) return v.get<T>();
        }
        throw std::invalid_argument("config: " + section + "." + key + " has an invalid value " + v.dump());
    }

private:
    static std::mutex& providers_mutex();
};
}
