/**
 * @file host_info.cpp
 * @brief host:port parsing
 */

#include "streamiq/cluster/host_info.hpp"

#include <cctype>

#include "streamiq/core/errors.hpp"

namespace streamiq {

HostInfo HostInfo::parse(const std::string& address) {
    auto colon = address.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == address.size()) {
        throw ConfigError("Invalid host:port address '" + address + "'");
    }

    auto host = address.substr(0, colon);
    auto port_text = address.substr(colon + 1);

    long port = 0;
    for (char c : port_text) {
        if (!std::isdigit(static_cast<unsigned char>(c)) || port > 65535) {
            throw ConfigError("Invalid port in address '" + address + "'");
        }
        port = port * 10 + (c - '0');
    }
    if (port > 65535) {
        throw ConfigError("Port out of range in address '" + address + "'");
    }

    return {std::move(host), static_cast<int>(port)};
}

} // namespace streamiq
