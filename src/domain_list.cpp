#include "domain_list.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace webblock {

const std::vector<std::string> DomainList::kDefaultDomains = {
    "facebook.com",
    "twitter.com",
    "instagram.com",
};

std::vector<std::string> DomainList::load(const std::string& path, bool use_defaults_if_missing) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (!use_defaults_if_missing) {
            throw std::runtime_error("Domain file not found: " + path);
        }
        Logger::info("DomainList", "Domain file " + path + " not found, using built-in default list");
        return kDefaultDomains;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open domain file: " + path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Error reading domain file: " + path);
    }

    auto domains = parse(buffer.str());
    Logger::debug("DomainList", "Loaded " + std::to_string(domains.size()) + " domain(s) from " + path);
    return domains;
}

std::vector<std::string> DomainList::parse(const std::string& content) {
    std::vector<std::string> domains;
    std::set<std::string> seen;

    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        std::string domain = normalize(line);
        if (domain.empty()) {
            continue;
        }
        if (seen.insert(domain).second) {
            domains.push_back(domain);
        }
    }

    return domains;
}

std::vector<std::string> DomainList::expand(const std::vector<std::string>& domains,
                                            const std::vector<std::string>& prefixes) {
    std::vector<std::string> expanded;
    std::set<std::string> seen;

    auto add = [&](const std::string& domain) {
        if (seen.insert(domain).second) {
            expanded.push_back(domain);
        }
    };

    for (const auto& domain : domains) {
        add(domain);
        for (const auto& prefix : prefixes) {
            add(prefix + "." + domain);
        }
    }

    return expanded;
}

std::string DomainList::normalize(const std::string& line) {
    std::string text = line;

    auto hash = text.find('#');
    if (hash != std::string::npos) {
        text.erase(hash);
    }

    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(text.begin(), text.end(), is_space);
    auto end = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
    if (begin >= end) {
        return "";
    }
    text = std::string(begin, end);

    // Fully qualified form "example.com." names the same host
    while (!text.empty() && text.back() == '.') {
        text.pop_back();
    }

    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return text;
}

} // namespace webblock
