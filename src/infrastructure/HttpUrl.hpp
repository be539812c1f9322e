/**
 * @file HttpUrl.hpp
 * @brief Splits absolute http(s) URLs into the parts cpp-httplib expects.
 */

#pragma once
#include <cctype>
#include <optional>
#include <string>

namespace docingest::infrastructure {

struct HttpUrl {
    std::string origin;   ///< "scheme://host[:port]", accepted by httplib::Client.
    std::string target;   ///< Path and query, "/" when absent. Fragment dropped.

    static std::optional<HttpUrl> Parse(const std::string& url) {
        const auto schemeEnd = url.find("://");
        if (schemeEnd == std::string::npos) return std::nullopt;

        std::string scheme = url.substr(0, schemeEnd);
        for (auto& c : scheme) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (scheme != "http" && scheme != "https") return std::nullopt;

        const auto hostStart = schemeEnd + 3;
        auto pathStart = url.find_first_of("/?#", hostStart);
        std::string host = url.substr(hostStart, pathStart == std::string::npos ? std::string::npos : pathStart - hostStart);
        if (host.empty()) return std::nullopt;

        HttpUrl parsed;
        parsed.origin = scheme + "://" + host;
        if (pathStart == std::string::npos) {
            parsed.target = "/";
        } else {
            parsed.target = url.substr(pathStart);
            auto fragment = parsed.target.find('#');
            if (fragment != std::string::npos) parsed.target.erase(fragment);
            if (parsed.target.empty() || parsed.target.front() != '/') parsed.target.insert(0, "/");
        }
        return parsed;
    }
};

} // namespace docingest::infrastructure
