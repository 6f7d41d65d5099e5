#include "pushpop/discovery/service.hpp"
#include "pushpop/network/http_client.hpp"

#include <spdlog/spdlog.h>

namespace pushpop::discovery {

Result<void> StaticServiceBrowser::browse(const std::string& service_type, const EntryCallback& on_entry) {
    spdlog::debug("Browsing {} over {} configured peers", service_type, entries_.size());
    for (const auto& entry : entries_) {
        if (!on_entry(entry)) {
            break;
        }
    }
    return Ok();
}

Result<void> LoggingAnnouncer::announce(const std::string& instance,
                                        uint16_t port,
                                        const std::vector<std::string>& txt) {
    std::string records;
    for (const auto& record : txt) {
        if (!records.empty()) {
            records += " ";
        }
        records += record;
    }
    spdlog::info("Announcing '{}' as {} on port {} [{}]", instance, kServiceType, port, records);
    instance_ = instance;
    announced_ = true;
    return Ok();
}

void LoggingAnnouncer::withdraw() {
    if (!announced_) {
        return;
    }
    spdlog::info("Withdrawing '{}'", instance_);
    announced_ = false;
}

Result<ServiceEntry> parse_peer_spec(const std::string& text) {
    const auto at = text.find('@');
    if (at == std::string::npos || at == 0) {
        return Err<ServiceEntry>(ErrorKind::Config, "peer must look like user@host:port/name: " + text);
    }
    const auto slash = text.find('/', at);
    if (slash == std::string::npos || slash + 1 == text.size()) {
        return Err<ServiceEntry>(ErrorKind::Config, "peer is missing the file name: " + text);
    }

    const std::string authority = text.substr(at + 1, slash - at - 1);
    const auto colon = authority.rfind(':');
    const auto bracket = authority.rfind(']');
    if (colon == std::string::npos || (bracket != std::string::npos && colon < bracket)) {
        return Err<ServiceEntry>(ErrorKind::Config, "peer is missing the port: " + text);
    }

    auto url = network::Url::parse("http://" + authority + "/");
    if (url.is_error()) {
        return Err<ServiceEntry, Error>(url.error());
    }

    ServiceEntry entry;
    entry.instance = text.substr(slash + 1);
    entry.addresses.push_back(url.value().host);
    entry.port = url.value().port;
    entry.txt.push_back("user=" + text.substr(0, at));
    return Ok(entry);
}

} // namespace pushpop::discovery
