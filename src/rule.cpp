#include "rule.hpp"
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace webblock {

namespace {

// iptables rejects comments longer than 256 bytes including the terminator
constexpr std::size_t kMaxCommentLength = 255;

} // namespace

const std::vector<Protocol>& blockedProtocols() {
    static const std::vector<Protocol> protocols = {Protocol::Tcp, Protocol::Udp};
    return protocols;
}

std::string protocolToString(Protocol protocol) {
    switch (protocol) {
        case Protocol::Tcp:
            return "tcp";
        case Protocol::Udp:
            return "udp";
        default:
            throw std::runtime_error("Unknown protocol");
    }
}

std::string familyToString(AddressFamily family) {
    switch (family) {
        case AddressFamily::IPv4:
            return "ipv4";
        case AddressFamily::IPv6:
            return "ipv6";
        default:
            throw std::runtime_error("Unknown address family");
    }
}

std::string sanitizeComment(const std::string& comment) {
    std::string sanitized;
    sanitized.reserve(comment.size());
    for (char c : comment) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' ||
            c == ':' || c == ',' || c == '-') {
            sanitized += c;
        } else {
            sanitized += '_';
        }
    }
    if (sanitized.size() > kMaxCommentLength) {
        sanitized.resize(kMaxCommentLength);
    }
    return sanitized;
}

Rule::Rule(std::string chain, AddressFamily family, std::string comment)
    : chain_(std::move(chain))
    , family_(family)
    , comment_(sanitizeComment(comment)) {}

std::vector<std::string> Rule::buildIptablesCommand() const {
    std::vector<std::string> args = {"-A", chain_};
    auto spec = buildRuleSpec();
    args.insert(args.end(), spec.begin(), spec.end());
    return args;
}

std::string Rule::toRestoreLine() const {
    // iptables-restore tokenizes on whitespace; the sanitized comment never
    // contains spaces or quotes, so arguments can be joined as-is
    std::ostringstream line;
    line << "-A " << chain_;
    for (const auto& arg : buildRuleSpec()) {
        line << " " << arg;
    }
    return line.str();
}

void Rule::addCommentArgs(std::vector<std::string>& args) const {
    if (comment_.empty()) {
        return;
    }
    args.push_back("-m");
    args.push_back("comment");
    args.push_back("--comment");
    args.push_back(comment_);
}

DropRule::DropRule(const std::string& chain,
                   const std::string& address,
                   AddressFamily family,
                   Protocol protocol,
                   const std::string& comment)
    : Rule(chain, family, comment)
    , address_(address)
    , protocol_(protocol) {
    if (address_.empty()) {
        throw std::invalid_argument("Drop rule requires a destination address");
    }
}

std::vector<std::string> DropRule::buildRuleSpec() const {
    std::vector<std::string> args;

    // Match the destination address of outgoing packets
    args.push_back("-d");
    args.push_back(address_);

    args.push_back("-p");
    args.push_back(protocolToString(protocol_));

    addCommentArgs(args);

    args.push_back("-j");
    args.push_back("DROP");
    return args;
}

std::string DropRule::describe() const {
    return "DROP out " + protocolToString(protocol_) + " dst=" + address_;
}

} // namespace webblock
