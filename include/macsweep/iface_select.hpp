#ifndef MACSWEEP_IFACE_SELECT_HPP
#define MACSWEEP_IFACE_SELECT_HPP

#include <macsweep/address.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct InterfaceBinding {
    std::string name;
    IPv4 addr;
    IPv4 mask;
};

// Local interface state, queried fresh on every call.
class NetworkInfo {
  public:
    virtual ~NetworkInfo() = default;

    // Interface backing the default IPv4 route.
    virtual std::optional<std::string> default_gateway_iface() = 0;

    // Interface names in enumeration order.
    virtual std::vector<std::string> interfaces() = 0;

    virtual std::vector<IPv4Subnet> ipv4_addrs(const std::string& iface) = 0;
};

// Case-insensitive match against common VPN and virtual adapter names.
bool is_vpn_iface(std::string_view name);

// Picks the interface whose subnet gets swept: the default route interface
// unless it looks like a VPN, then the first non-VPN interface with a
// non-loopback IPv4 address, then the default route interface regardless.
// Returns std::nullopt if none has a usable IPv4 binding. Never throws.
std::optional<InterfaceBinding> select_interface(NetworkInfo& info);

#endif
