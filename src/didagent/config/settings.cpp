/**
 * @file settings.cpp
 * @brief Typed reads and coercions for Settings.
 */
#include "didagent/config/settings.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace didagent::config {

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<bool> parse_bool(std::string_view s) {
    const auto l = lower(s);
    if (l == "true" || l == "yes" || l == "on" || l == "1") return true;
    if (l == "false" || l == "no" || l == "off" || l == "0" || l.empty()) return false;
    return std::nullopt;
}

std::optional<std::int64_t> parse_int(std::string_view s) {
    std::int64_t v = 0;
    const auto* end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, v);
    if (ec != std::errc{} || ptr != end) return std::nullopt;
    return v;
}

} // namespace

void Settings::set(std::string key, SettingValue value) {
    values_.insert_or_assign(std::move(key), std::move(value));
}

bool Settings::erase(std::string_view key) {
    auto it = values_.find(key);
    if (it == values_.end()) return false;
    values_.erase(it);
    return true;
}

bool Settings::contains(std::string_view key) const noexcept {
    return values_.find(key) != values_.end();
}

const SettingValue* Settings::find(std::string_view key) const noexcept {
    auto it = values_.find(key);
    return it == values_.end() ? nullptr : &it->second;
}

std::optional<std::string> Settings::get_string(std::string_view key) const {
    const auto* v = find(key);
    if (!v) return std::nullopt;
    if (const auto* s = std::get_if<std::string>(v)) return *s;
    return to_string(*v);
}

std::optional<bool> Settings::get_bool(std::string_view key) const {
    const auto* v = find(key);
    if (!v) return std::nullopt;
    if (const auto* b = std::get_if<bool>(v)) return *b;
    if (const auto* i = std::get_if<std::int64_t>(v)) return *i != 0;
    if (const auto* s = std::get_if<std::string>(v)) return parse_bool(*s);
    return std::nullopt;
}

std::optional<std::int64_t> Settings::get_int(std::string_view key) const {
    const auto* v = find(key);
    if (!v) return std::nullopt;
    if (const auto* i = std::get_if<std::int64_t>(v)) return *i;
    if (const auto* s = std::get_if<std::string>(v)) return parse_int(*s);
    return std::nullopt;
}

std::optional<double> Settings::get_double(std::string_view key) const {
    const auto* v = find(key);
    if (!v) return std::nullopt;
    if (const auto* d = std::get_if<double>(v)) return *d;
    if (const auto* i = std::get_if<std::int64_t>(v)) return static_cast<double>(*i);
    if (const auto* s = std::get_if<std::string>(v)) {
        double out = 0.0;
        const auto* end = s->data() + s->size();
        const auto [ptr, ec] = std::from_chars(s->data(), end, out);
        if (ec == std::errc{} && ptr == end) return out;
    }
    return std::nullopt;
}

std::optional<std::vector<std::string>> Settings::get_list(std::string_view key) const {
    const auto* v = find(key);
    if (!v) return std::nullopt;
    if (const auto* l = std::get_if<std::vector<std::string>>(v)) return *l;
    // A lone string is a one-element list.
    if (const auto* s = std::get_if<std::string>(v)) {
        if (s->empty()) return std::vector<std::string>{};
        return std::vector<std::string>{*s};
    }
    return std::nullopt;
}

std::string Settings::get_string_or(std::string_view key, std::string_view fallback) const {
    auto v = get_string(key);
    return v ? *v : std::string(fallback);
}

bool Settings::get_bool_or(std::string_view key, bool fallback) const {
    return get_bool(key).value_or(fallback);
}

std::int64_t Settings::get_int_or(std::string_view key, std::int64_t fallback) const {
    return get_int(key).value_or(fallback);
}

double Settings::get_double_or(std::string_view key, double fallback) const {
    return get_double(key).value_or(fallback);
}

bool Settings::truthy(std::string_view key) const {
    const auto* v = find(key);
    if (!v) return false;
    return std::visit([](const auto& x) -> bool {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, bool>) return x;
        else if constexpr (std::is_same_v<T, std::string>) return parse_bool(x).value_or(true);
        else if constexpr (std::is_same_v<T, std::vector<std::string>>) return !x.empty();
        else return x != 0;
    }, *v);
}

void Settings::merge(const Settings& other) {
    for (const auto& [k, v] : other.values_) values_.insert_or_assign(k, v);
}

std::string to_string(const SettingValue& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::string>) return x;
        else if constexpr (std::is_same_v<T, bool>) return x ? "true" : "false";
        else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            std::string out = "[";
            for (std::size_t i = 0; i < x.size(); ++i) {
                if (i) out += ", ";
                out += x[i];
            }
            return out + "]";
        } else {
            return std::to_string(x);
        }
    }, v);
}

} // namespace didagent::config
