#include <macsweep/iface_select.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <exception>

static constexpr const char* vpn_keywords[] = {
    "vpn",
    "anyconnect",
    "tap",
    "tun",
    "ppp",
    "virtual",
    "vnic",
    "openvpn"
};

bool is_vpn_iface(std::string_view name) {
    if (name.empty()) {
        return false;
    }
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    for (auto keyword : vpn_keywords) {
        if (lower.find(keyword) != std::string::npos) {
            return true;
        }
    }
    return false;
}

static std::optional<std::string> choose_iface(NetworkInfo& info) {
    auto gateway = info.default_gateway_iface();
    if (gateway && !gateway->empty() && !is_vpn_iface(*gateway)) {
        return gateway;
    }
    if (gateway) {
        spdlog::debug("default route interface {} looks like a VPN, looking further", *gateway);
    }

    for (const auto& name : info.interfaces()) {
        if (is_vpn_iface(name)) {
            continue;
        }
        auto addrs = info.ipv4_addrs(name);
        if (addrs.empty()) {
            continue;
        }
        if (!is_loopback(addrs.front().addr) && addrs.front().addr != IPv4{}) {
            return name;
        }
    }

    if (gateway && !gateway->empty()) {
        return gateway;
    }
    return std::nullopt;
}

std::optional<InterfaceBinding> select_interface(NetworkInfo& info) {
    try {
        auto name = choose_iface(info);
        if (!name) {
            spdlog::info("no usable network interface found");
            return std::nullopt;
        }
        auto addrs = info.ipv4_addrs(*name);
        if (addrs.empty()) {
            spdlog::info("interface {} has no IPv4 address", *name);
            return std::nullopt;
        }
        const auto& subnet = addrs.front();
        if (subnet.addr == IPv4{}) {
            spdlog::info("interface {} has no usable IPv4 binding", *name);
            return std::nullopt;
        }
        return InterfaceBinding{*name, subnet.addr, subnet.mask};
    } catch (const std::exception& e) {
        spdlog::warn("failed to enumerate network interfaces: {}", e.what());
        return std::nullopt;
    }
}
