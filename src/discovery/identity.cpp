#include "pushpop/discovery/identity.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/ip/network_v4.hpp>
#include <boost/asio/ip/network_v6.hpp>

#include <algorithm>
#include <bitset>
#include <cerrno>
#include <cstring>
#include <memory>
#include <optional>
#include <regex>

#include <ifaddrs.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace pushpop::discovery {
namespace ip = boost::asio::ip;

namespace {

template<typename Bytes>
unsigned short prefix_from_mask(const Bytes& mask) {
    unsigned short bits = 0;
    for (unsigned char byte : mask) {
        bits += static_cast<unsigned short>(std::bitset<8>(byte).count());
    }
    return bits;
}

} // namespace

bool LocalNetwork::contains(const ip::address& candidate) const {
    if (address.is_v4() && candidate.is_v4()) {
        const unsigned short prefix = std::min<unsigned short>(prefix_length, 32);
        return ip::make_network_v4(address.to_v4(), prefix).network() ==
               ip::make_network_v4(candidate.to_v4(), prefix).network();
    }
    if (address.is_v6() && candidate.is_v6()) {
        // Compare bytes only; the interface side carries a scope id, the
        // advertised address usually does not.
        const unsigned short prefix = std::min<unsigned short>(prefix_length, 128);
        return ip::make_network_v6(address.to_v6(), prefix).network().to_bytes() ==
               ip::make_network_v6(candidate.to_v6(), prefix).network().to_bytes();
    }
    return false;
}

Result<std::vector<LocalNetwork>> local_networks() {
    struct ifaddrs* list = nullptr;
    if (getifaddrs(&list) != 0) {
        return Err<std::vector<LocalNetwork>>(ErrorKind::Transport,
            std::string("cannot list network interfaces: ") + std::strerror(errno));
    }
    std::unique_ptr<struct ifaddrs, decltype(&freeifaddrs)> guard(list, &freeifaddrs);

    std::vector<LocalNetwork> networks;
    for (struct ifaddrs* ifa = list; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || !ifa->ifa_netmask) {
            continue;
        }

        if (ifa->ifa_addr->sa_family == AF_INET) {
            const auto* addr = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
            const auto* mask = reinterpret_cast<const sockaddr_in*>(ifa->ifa_netmask);
            ip::address_v4::bytes_type addr_bytes{};
            ip::address_v4::bytes_type mask_bytes{};
            std::memcpy(addr_bytes.data(), &addr->sin_addr, addr_bytes.size());
            std::memcpy(mask_bytes.data(), &mask->sin_addr, mask_bytes.size());
            networks.push_back(LocalNetwork{ip::address_v4(addr_bytes), prefix_from_mask(mask_bytes)});
        } else if (ifa->ifa_addr->sa_family == AF_INET6) {
            const auto* addr = reinterpret_cast<const sockaddr_in6*>(ifa->ifa_addr);
            const auto* mask = reinterpret_cast<const sockaddr_in6*>(ifa->ifa_netmask);
            ip::address_v6::bytes_type addr_bytes{};
            ip::address_v6::bytes_type mask_bytes{};
            std::memcpy(addr_bytes.data(), &addr->sin6_addr, addr_bytes.size());
            std::memcpy(mask_bytes.data(), &mask->sin6_addr, mask_bytes.size());
            networks.push_back(LocalNetwork{ip::address_v6(addr_bytes, addr->sin6_scope_id),
                                            prefix_from_mask(mask_bytes)});
        }
    }

    spdlog::debug("Found {} local networks", networks.size());
    return Ok(std::move(networks));
}

std::optional<std::string> advertised_address(const std::vector<LocalNetwork>& networks) {
    for (const auto& network : networks) {
        if (network.address.is_v4() && !network.address.is_loopback()) {
            return network.address.to_string();
        }
    }
    for (const auto& network : networks) {
        if (network.address.is_v6() && !network.address.is_loopback() &&
            !network.address.to_v6().is_link_local()) {
            return network.address.to_string();
        }
    }
    return std::nullopt;
}

Result<std::string> extract_username(const std::vector<std::string>& txt) {
    static const std::regex kPair(R"((\w+)=(\w+))");
    for (const auto& record : txt) {
        std::smatch match;
        if (!std::regex_search(record, match, kPair)) {
            continue;
        }
        if (match[1] == "user") {
            return Ok(match[2].str());
        }
    }
    return Err<std::string>(ErrorKind::Protocol, "no user=<name> record in TXT data");
}

Result<std::string> find_reachable_address(const std::vector<std::string>& candidates,
                                           const std::vector<LocalNetwork>& networks) {
    for (const auto& network : networks) {
        for (const auto& text : candidates) {
            boost::system::error_code ec;
            const auto candidate = ip::make_address(text, ec);
            if (ec) {
                spdlog::debug("Skipping unparseable address '{}'", text);
                continue;
            }
            if (network.contains(candidate)) {
                return Ok(candidate.to_string());
            }
        }
    }
    return Err<std::string>(ErrorKind::Transport,
        "no advertised address is on a local network (peers must be given as IP addresses)");
}

std::string TransferOffer::base_url() const {
    if (reachable_address.find(':') != std::string::npos) {
        return "http://[" + reachable_address + "]:" + std::to_string(port) + "/";
    }
    return "http://" + reachable_address + ":" + std::to_string(port) + "/";
}

Result<TransferOffer> find_offer(ServiceBrowser& browser,
                                 const std::string& username,
                                 const std::vector<LocalNetwork>& networks) {
    std::optional<TransferOffer> offer;

    auto browsed = browser.browse(kServiceType, [&](const ServiceEntry& entry) {
        spdlog::debug("Found '{}' on port {}", entry.instance, entry.port);

        auto user = extract_username(entry.txt);
        if (user.is_error()) {
            spdlog::debug("Ignoring '{}': {}", entry.instance, user.error().message);
            return true;
        }
        if (user.value() != username) {
            return true;
        }

        auto address = find_reachable_address(entry.addresses, networks);
        if (address.is_error()) {
            spdlog::debug("Ignoring '{}': {}", entry.instance, address.error().message);
            return true;
        }

        offer = TransferOffer{entry.instance, user.value(), address.value(), entry.port};
        return false;
    });

    if (browsed.is_error()) {
        return Err<TransferOffer, Error>(browsed.error());
    }
    if (!offer) {
        return Err<TransferOffer>(ErrorKind::Transport, "no reachable offer from user " + username);
    }
    spdlog::info("{} offers {} at {}", offer->advertised_user, offer->display_name, offer->base_url());
    return Ok(*offer);
}

} // namespace pushpop::discovery
