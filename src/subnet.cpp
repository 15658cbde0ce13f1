#include <macsweep/subnet.hpp>

#include <spdlog/spdlog.h>

static constexpr uint32_t MAX_HOSTS = 254;

TargetSet slash24_targets(const IPv4& addr) {
    TargetSet ret;
    ret.reserve(MAX_HOSTS);
    for (unsigned host = 1; host <= MAX_HOSTS; ++host) {
        ret.push_back(IPv4{addr[0], addr[1], addr[2], static_cast<uint8_t>(host)});
    }
    return ret;
}

TargetSet enumerate_targets(const IPv4& addr, const IPv4& mask) {
    const auto ip_val = ipv4_to_host(addr);
    const auto mask_val = ipv4_to_host(mask);
    const auto network_val = ip_val & mask_val;
    const auto broadcast_val = network_val | ~mask_val;

    // A non-contiguous mask can reach /24 by bit count while spanning more
    // than 256 addresses, so the span is checked as well.
    if (prefix_len_from_mask(mask) < 24 || broadcast_val - network_val > MAX_HOSTS + 1) {
        spdlog::warn("{}/{} is larger than a /24, only probing {}.0/24",
                     format_ipv4(addr), prefix_len_from_mask(mask),
                     fmt::format("{}.{}.{}", addr[0], addr[1], addr[2]));
        return slash24_targets(addr);
    }

    TargetSet ret;
    if (broadcast_val - network_val < 2) {
        return ret;
    }
    ret.reserve(broadcast_val - network_val - 1);
    for (uint32_t t = network_val + 1; t < broadcast_val; ++t) {
        ret.push_back(ipv4_from_host(t));
    }
    return ret;
}
