#pragma once

#include "pushpop/core/result.hpp"
#include "pushpop/discovery/service.hpp"

#include <boost/asio/ip/address.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pushpop::discovery {

/**
 * @brief Address and prefix length of one local interface
 */
struct LocalNetwork {
    boost::asio::ip::address address;
    unsigned short prefix_length = 0;

    /// True if @p candidate lies in the same subnet.
    bool contains(const boost::asio::ip::address& candidate) const;
};

/**
 * @brief Enumerate the IPv4/IPv6 networks of the local interfaces
 */
Result<std::vector<LocalNetwork>> local_networks();

/**
 * @brief Address to give receivers for this host
 *
 * First non-loopback IPv4 address, else the first IPv6 address that is
 * neither loopback nor link-local. nullopt if there is none.
 */
std::optional<std::string> advertised_address(const std::vector<LocalNetwork>& networks);

/**
 * @brief Value of the first "user=<name>" TXT record
 *
 * Each record is matched against (\w+)=(\w+); records that do not match
 * are skipped. Protocol error if no user record exists.
 */
Result<std::string> extract_username(const std::vector<std::string>& txt);

/**
 * @brief First candidate address inside one of @p networks
 *
 * Unparseable candidates are skipped.
 */
Result<std::string> find_reachable_address(const std::vector<std::string>& candidates,
                                           const std::vector<LocalNetwork>& networks);

/**
 * @brief A sender's offer, reachable from this host
 */
struct TransferOffer {
    std::string display_name;
    std::string advertised_user;
    std::string reachable_address;
    uint16_t port = 0;

    /// http://<address>:<port>/, with IPv6 addresses bracketed
    std::string base_url() const;
};

/**
 * @brief Browse @p browser for the first offer made by @p username
 *        that has an address on a local network
 */
Result<TransferOffer> find_offer(ServiceBrowser& browser,
                                 const std::string& username,
                                 const std::vector<LocalNetwork>& networks);

} // namespace pushpop::discovery
