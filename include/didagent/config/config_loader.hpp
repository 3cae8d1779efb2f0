#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: flat "key = value" files and command-line overrides.
 */

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "didagent/compat/expected.hpp"
#include "didagent/config/settings.hpp"

namespace didagent::config {

    /** @struct ConfigError
     *  @brief Why a settings source could not be parsed.
     */
    struct ConfigError {
        std::string source;   ///< File path or "<args>"
        std::size_t line{0};  ///< 1-based line (0 when not line-specific)
        std::string reason;   ///< Human-readable reason

        std::string describe() const;
    };

    /** @class Loader
     *  @brief Source of agent settings.
     *
     *  File grammar, one entry per line:
     *  @code
     *  # comment
     *  admin.enabled = true
     *  admin.port = 8031
     *  admin.webhook_urls = [http://localhost:8022/webhooks, http://audit/hook]
     *  default_label = "Alice Agent"
     *  @endcode
     *  Integers become int64, true/false become bool, bracketed values become
     *  string lists, quotes are stripped from strings.
     */
    class Loader {
    public:
        /**
         * @brief Parse a settings file.
         * @param path File path.
         * @return Settings or the first parse error.
         */
        static didagent_detail::expected<Settings, ConfigError> load_from_file(const std::string& path);

        /**
         * @brief Parse settings text already in memory.
         * @param text File contents.
         * @param source Name used in error reports.
         */
        static didagent_detail::expected<Settings, ConfigError> parse(std::string_view text,
                                                                      std::string_view source = "<text>");

        /**
         * @brief Parse "key=value" overrides (same value grammar as files).
         * @param args Tokens, typically argv tail.
         */
        static didagent_detail::expected<Settings, ConfigError> from_overrides(const std::vector<std::string>& args);

        /// Parse a single value token into a typed SettingValue.
        static didagent_detail::expected<SettingValue, std::string> parse_value(std::string_view raw);
    };

} // namespace didagent::config
