/**
 * @file domain_list.hpp
 * @brief Loading of the list of domains to block
 * @author web-blocker Development Team
 * @date 2026
 */

#pragma once

#include <string>
#include <vector>

namespace webblock {

/**
 * @class DomainList
 * @brief Reads the blocked-domain file and applies subdomain expansion
 *
 * The file holds one domain per line. Blank lines and lines starting with
 * '#' are skipped, trailing comments are stripped, and duplicates are
 * removed keeping the first occurrence. Source order is kept for
 * reporting only.
 */
class DomainList {
public:
    /// Domains blocked when no domain file is present
    static const std::vector<std::string> kDefaultDomains;

    /**
     * @brief Load the domain file
     * @param path Path of the domain file
     * @param use_defaults_if_missing Return kDefaultDomains when the file does not exist
     * @return Domains from the file, or kDefaultDomains if it does not exist
     *         and use_defaults_if_missing is set
     * @throws std::runtime_error if the file cannot be read, or does not
     *         exist and use_defaults_if_missing is false
     *
     * An existing but empty file yields an empty list; the caller decides
     * what to do with it.
     */
    static std::vector<std::string> load(const std::string& path, bool use_defaults_if_missing = true);

    /**
     * @brief Parse domain file content
     * @param content Text with one domain per line
     * @return Normalized, de-duplicated domains in source order
     */
    static std::vector<std::string> parse(const std::string& content);

    /**
     * @brief Add "prefix.domain" for every prefix after each domain
     * @param domains Base domains
     * @param prefixes Subdomain labels such as "www"
     * @return Base domains interleaved with their expansions, de-duplicated
     */
    static std::vector<std::string> expand(const std::vector<std::string>& domains,
                                           const std::vector<std::string>& prefixes);

    /**
     * @brief Normalize one line of the domain file
     * @param line Raw line
     * @return Lower-case domain without surrounding whitespace, comment or
     *         trailing dot; empty if the line holds no domain
     */
    static std::string normalize(const std::string& line);
};

} // namespace webblock
