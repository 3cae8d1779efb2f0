#pragma once
/**
 * @file logging.hpp
 * @brief spdlog setup and the human-readable startup banner.
 */

#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "didagent/config/settings.hpp"
#include "didagent/config/wallet.hpp"

namespace didagent::config {

    /**
     * @brief Apply "log.level" (trace|debug|info|warn|error|critical|off) and the log pattern.
     * @return false if the level name was not recognized (info is used).
     */
    bool configure_logging(const Settings& settings);

    /** @struct BannerInfo
     *  @brief What the banner shows.
     */
    struct BannerInfo {
        std::string label;
        std::vector<std::string> inbound_transports;
        std::map<std::string, std::vector<std::string>> outbound_transports;
        std::optional<PublicDid> public_did;
        std::optional<std::string> admin; ///< Admin address, absent when disabled
    };

    /// Print the startup banner to @p out.
    void print_banner(std::ostream& out, const BannerInfo& info);

} // namespace didagent::config
