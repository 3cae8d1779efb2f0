#pragma once
/**
 * @file settings.hpp
 * @brief Dotted-key settings mapping consumed by the conductor and collaborators.
 */

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace didagent::config {

/// A single setting: string, bool, integer, real, or list of strings.
using SettingValue = std::variant<std::string, bool, std::int64_t, double, std::vector<std::string>>;

/** @class Settings
 *  @brief Ordered map of dotted keys ("admin.port") to values.
 *
 *  Typed getters return std::nullopt when the key is missing or the stored
 *  value cannot be read as the requested type. Strings are leniently
 *  coerced where operators commonly write them by hand (booleans, ports).
 */
class Settings {
public:
    using Map = std::map<std::string, SettingValue, std::less<>>;

    Settings() = default;
    Settings(std::initializer_list<Map::value_type> init) : values_(init) {}

    void set(std::string key, SettingValue value);
    bool erase(std::string_view key);
    [[nodiscard]] bool contains(std::string_view key) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }
    [[nodiscard]] const Map& values() const noexcept { return values_; }

    /// Raw access; nullptr when absent.
    [[nodiscard]] const SettingValue* find(std::string_view key) const noexcept;

    [[nodiscard]] std::optional<std::string>              get_string(std::string_view key) const;
    [[nodiscard]] std::optional<bool>                     get_bool(std::string_view key) const;
    [[nodiscard]] std::optional<std::int64_t>             get_int(std::string_view key) const;
    [[nodiscard]] std::optional<double>                   get_double(std::string_view key) const;
    [[nodiscard]] std::optional<std::vector<std::string>> get_list(std::string_view key) const;

    [[nodiscard]] std::string  get_string_or(std::string_view key, std::string_view fallback) const;
    [[nodiscard]] bool         get_bool_or(std::string_view key, bool fallback) const;
    [[nodiscard]] std::int64_t get_int_or(std::string_view key, std::int64_t fallback) const;
    [[nodiscard]] double       get_double_or(std::string_view key, double fallback) const;

    /// Truthiness of an arbitrary value (false when absent, empty or zero).
    [[nodiscard]] bool truthy(std::string_view key) const;

    /// Overlay @p other on top of this mapping (other wins).
    void merge(const Settings& other);

private:
    Map values_;
};

/// Human-readable rendering of a value (lists as "[a, b]").
std::string to_string(const SettingValue& v);

} // namespace didagent::config
