#pragma once

#include "pushpop/core/result.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace pushpop::discovery {

/// DNS-SD service type the sender announces.
constexpr const char* kServiceType = "_pushpop._tcp";

/**
 * @brief One resolved service instance
 *
 * instance is the shared file's name; txt holds "key=value" records,
 * of which "user=<name>" identifies the sender.
 */
struct ServiceEntry {
    std::string instance;
    std::vector<std::string> addresses;
    uint16_t port = 0;
    std::vector<std::string> txt;
};

/// Return false to stop browsing.
using EntryCallback = std::function<bool(const ServiceEntry&)>;

class ServiceBrowser {
public:
    virtual ~ServiceBrowser() = default;

    /**
     * @brief Deliver entries of @p service_type until the callback stops
     *        the browse or no more entries are available
     */
    virtual Result<void> browse(const std::string& service_type, const EntryCallback& on_entry) = 0;
};

class ServiceAnnouncer {
public:
    virtual ~ServiceAnnouncer() = default;

    virtual Result<void> announce(const std::string& instance,
                                  uint16_t port,
                                  const std::vector<std::string>& txt) = 0;

    virtual void withdraw() = 0;
};

/**
 * @brief Browser over a fixed list of entries (from the command line)
 */
class StaticServiceBrowser : public ServiceBrowser {
public:
    explicit StaticServiceBrowser(std::vector<ServiceEntry> entries) : entries_(std::move(entries)) {}

    Result<void> browse(const std::string& service_type, const EntryCallback& on_entry) override;

private:
    std::vector<ServiceEntry> entries_;
};

/**
 * @brief Announcer that only logs what would be published
 *
 * Nothing is sent on the network: no mDNS record is registered, so
 * receivers cannot browse for this sender and must be given its address
 * with --peer.
 */
class LoggingAnnouncer : public ServiceAnnouncer {
public:
    Result<void> announce(const std::string& instance,
                          uint16_t port,
                          const std::vector<std::string>& txt) override;

    void withdraw() override;

    bool announced() const { return announced_; }

private:
    std::string instance_;
    bool announced_ = false;
};

/**
 * @brief Parse "user@host:port/name" into an entry
 *
 * IPv6 hosts are bracketed: "alice@[fe80::1]:4000/photo.jpg".
 */
Result<ServiceEntry> parse_peer_spec(const std::string& text);

} // namespace pushpop::discovery
