/**
 * @file config_loader.cpp
 * @brief Line-oriented settings parser.
 */
#include "didagent/config/config_loader.hpp"

#include <charconv>
#include <fstream>
#include <sstream>

namespace didagent::config {

namespace {

std::string_view trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string unquote(std::string_view s) {
    if (s.size() >= 2 && ((s.front() == '"' && s.back() == '"') ||
                          (s.front() == '\'' && s.back() == '\''))) {
        return std::string(s.substr(1, s.size() - 2));
    }
    return std::string(s);
}

} // namespace

std::string ConfigError::describe() const {
    std::string out = source;
    if (line) out += ":" + std::to_string(line);
    return out + ": " + reason;
}

didagent_detail::expected<SettingValue, std::string> Loader::parse_value(std::string_view raw) {
    const auto v = trim(raw);

    if (!v.empty() && v.front() == '[') {
        if (v.back() != ']') return didagent_detail::unexpected(std::string("unterminated list"));
        std::vector<std::string> items;
        auto body = v.substr(1, v.size() - 2);
        while (!trim(body).empty()) {
            const auto comma = body.find(',');
            const auto item = trim(body.substr(0, comma));
            if (!item.empty()) items.push_back(unquote(item));
            if (comma == std::string_view::npos) break;
            body = body.substr(comma + 1);
        }
        return SettingValue{std::move(items)};
    }

    if (v == "true")  return SettingValue{true};
    if (v == "false") return SettingValue{false};

    std::int64_t n = 0;
    const auto* end = v.data() + v.size();
    if (!v.empty()) {
        const auto [ptr, ec] = std::from_chars(v.data(), end, n);
        if (ec == std::errc{} && ptr == end) return SettingValue{n};
    }
    return SettingValue{unquote(v)};
}

didagent_detail::expected<Settings, ConfigError> Loader::parse(std::string_view text, std::string_view source) {
    Settings out;
    std::size_t lineno = 0;
    std::istringstream in{std::string(text)};
    std::string line;
    while (std::getline(in, line)) {
        ++lineno;
        const auto l = trim(line);
        if (l.empty() || l.front() == '#') continue;

        const auto eq = l.find('=');
        if (eq == std::string_view::npos) {
            return didagent_detail::unexpected(ConfigError{std::string(source), lineno, "expected 'key = value'"});
        }
        const auto key = trim(l.substr(0, eq));
        if (key.empty()) {
            return didagent_detail::unexpected(ConfigError{std::string(source), lineno, "empty key"});
        }
        auto value = parse_value(l.substr(eq + 1));
        if (!value) {
            return didagent_detail::unexpected(ConfigError{std::string(source), lineno, value.error()});
        }
        out.set(std::string(key), std::move(*value));
    }
    return out;
}

didagent_detail::expected<Settings, ConfigError> Loader::load_from_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        return didagent_detail::unexpected(ConfigError{path, 0, "cannot open file"});
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    return parse(ss.str(), path);
}

didagent_detail::expected<Settings, ConfigError> Loader::from_overrides(const std::vector<std::string>& args) {
    std::string joined;
    for (const auto& a : args) {
        if (a.find('=') == std::string::npos) {
            return didagent_detail::unexpected(ConfigError{"<args>", 0, "override without '=': " + a});
        }
        joined += a;
        joined += '\n';
    }
    return parse(joined, "<args>");
}

} // namespace didagent::config
