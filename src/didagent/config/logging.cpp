/**
 * @file logging.cpp
 * @brief Logging configuration and banner rendering.
 */
#include "didagent/config/logging.hpp"

#include <algorithm>
#include <ostream>

#include <spdlog/spdlog.h>

#include "didagent/config/constants.hpp"
#include "didagent/version.hpp"

namespace didagent::config {

    using namespace didagent::config::constants;

    namespace {
        constexpr std::size_t kBannerWidth = 60;

        std::string row(const std::string& text, std::size_t indent = 0) {
            std::string body(indent, ' ');
            body += text;
            if (body.size() > kBannerWidth - 4) body.resize(kBannerWidth - 4);
            return "::" + body + std::string(kBannerWidth - 4 - body.size(), ' ') + "::\n";
        }

        std::string centered(const std::string& text) {
            const auto w = kBannerWidth - 4;
            const auto t = text.substr(0, w);
            const auto left = (w - t.size()) / 2;
            return "::" + std::string(left, ' ') + t + std::string(w - t.size() - left, ' ') + "::\n";
        }
    } // namespace

    bool configure_logging(const Settings& settings) {
        const auto name = settings.get_string_or(KEY_LOG_LEVEL, "info");
        auto level = spdlog::level::from_str(name);
        bool ok = true;
        // from_str maps unknown names to "off"; only accept "off" when asked for.
        if (level == spdlog::level::off && name != "off") {
            level = spdlog::level::info;
            ok = false;
        }
        spdlog::set_level(level);
        spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e %^%-5l%$ [%t] %v");
        if (!ok) spdlog::warn("Unknown log level '{}', using info", name);
        return ok;
    }

    void print_banner(std::ostream& out, const BannerInfo& info) {
        const std::string rule = std::string(kBannerWidth, ':') + "\n";
        const std::string blank = row("");

        out << "\n" << rule;
        out << centered(info.label.empty() ? std::string("(no label)") : info.label);
        out << blank;
        out << row("Inbound Transports:", 1) << blank;
        if (info.inbound_transports.empty()) out << row("- none", 3);
        for (const auto& t : info.inbound_transports) out << row("- " + t, 3);
        out << blank;
        out << row("Outbound Transports:", 1) << blank;
        if (info.outbound_transports.empty()) out << row("- none", 3);
        for (const auto& [name, schemes] : info.outbound_transports) {
            std::string s;
            for (const auto& sc : schemes) s += (s.empty() ? "" : ", ") + sc;
            out << row("- " + name + " (" + s + ")", 3);
        }
        out << blank;
        if (info.public_did) {
            out << row("Public DID Information:", 1) << blank;
            out << row("- DID: " + info.public_did->did, 3) << blank;
        }
        out << row("Administration API:", 1) << blank;
        out << row("- " + (info.admin ? *info.admin : std::string("not enabled")), 3);
        out << blank;
        const std::string ver = std::string("ver: ") + version_string;
        out << row(ver, kBannerWidth - 4 - ver.size());
        out << rule << "\n";
        out.flush();
    }

} // namespace didagent::config
