#include "resolver.hpp"
#include "logger.hpp"
#include <arpa/inet.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <memory>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace webblock {

namespace {

const char* const kComponent = "SystemResolver";

// State of one asynchronous lookup. getaddrinfo_a() keeps pointers to the
// name and hints until the request has finished, so they live together.
struct PendingLookup {
    std::string name;
    struct addrinfo hints{};
    struct gaicb request{};
};

std::vector<HostAddress> collectAddresses(const struct addrinfo* list) {
    std::vector<HostAddress> addresses;

    for (const struct addrinfo* p = list; p != nullptr; p = p->ai_next) {
        char buf[INET6_ADDRSTRLEN];
        const void* addr = nullptr;
        AddressFamily family = AddressFamily::IPv4;

        if (p->ai_family == AF_INET) {
            addr = &reinterpret_cast<const struct sockaddr_in*>(p->ai_addr)->sin_addr;
        } else if (p->ai_family == AF_INET6) {
            addr = &reinterpret_cast<const struct sockaddr_in6*>(p->ai_addr)->sin6_addr;
            family = AddressFamily::IPv6;
        }

        if (addr == nullptr || inet_ntop(p->ai_family, addr, buf, sizeof(buf)) == nullptr) {
            continue;
        }

        HostAddress host{std::string(buf), family};
        if (std::find(addresses.begin(), addresses.end(), host) == addresses.end()) {
            addresses.push_back(host);
        }
    }

    return addresses;
}

std::string describeError(int code) {
    if (code == EAI_SYSTEM) {
        return std::string("system error: ") + std::strerror(errno);
    }
    return gai_strerror(code);
}

} // namespace

SystemResolver::SystemResolver(std::chrono::milliseconds timeout, bool include_ipv6)
    : timeout_(timeout)
    , include_ipv6_(include_ipv6) {}

ResolveResult SystemResolver::resolve(const std::string& domain) {
    if (domain.empty()) {
        return ResolveResult::failure("empty domain name");
    }

    auto lookup = std::make_unique<PendingLookup>();
    lookup->name = domain;
    lookup->hints.ai_family = include_ipv6_ ? AF_UNSPEC : AF_INET;
    lookup->hints.ai_socktype = SOCK_STREAM;
    lookup->request.ar_name = lookup->name.c_str();
    lookup->request.ar_request = &lookup->hints;

    struct gaicb* requests[1] = {&lookup->request};
    int rc = getaddrinfo_a(GAI_NOWAIT, requests, 1, nullptr);
    if (rc != 0) {
        return ResolveResult::failure("could not start lookup: " + describeError(rc));
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    const struct gaicb* const wait_list[1] = {&lookup->request};

    while (gai_error(&lookup->request) == EAI_INPROGRESS) {
        auto remaining = std::chrono::duration_cast<std::chrono::nanoseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        struct timespec ts;
        ts.tv_sec = static_cast<time_t>(remaining.count() / 1000000000LL);
        ts.tv_nsec = static_cast<long>(remaining.count() % 1000000000LL);

        rc = gai_suspend(wait_list, 1, &ts);
        // EAI_INTR: interrupted by a signal, EAI_AGAIN: timed out; the loop
        // condition and the deadline sort out both
        if (rc != 0 && rc != EAI_INTR && rc != EAI_AGAIN && rc != EAI_ALLDONE) {
            Logger::debug(kComponent, "gai_suspend for " + domain + " returned: " + describeError(rc));
        }
    }

    int status = gai_error(&lookup->request);
    if (status == EAI_INPROGRESS) {
        int cancelled = gai_cancel(&lookup->request);
        if (cancelled != EAI_ALLDONE) {
            if (cancelled == EAI_NOTCANCELED) {
                // The lookup thread still references the request; it is handed
                // over and reclaimed when the process exits
                static_cast<void>(lookup.release());
            }
            return ResolveResult::failure("lookup timed out after " +
                                          std::to_string(timeout_.count()) + " ms");
        }
        // Finished between the deadline and the cancel; use the answer
        status = gai_error(&lookup->request);
    }

    if (status != 0) {
        return ResolveResult::failure(describeError(status));
    }

    ResolveResult result;
    result.success = true;
    result.addresses = collectAddresses(lookup->request.ar_result);
    freeaddrinfo(lookup->request.ar_result);

    if (result.addresses.empty()) {
        result.success = false;
        result.error = "no usable addresses returned";
    }

    Logger::debug(kComponent, domain + " resolved to " + std::to_string(result.addresses.size()) + " address(es)");
    return result;
}

} // namespace webblock
