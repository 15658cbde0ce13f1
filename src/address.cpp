#include <macsweep/address.hpp>

#include <spdlog/fmt/fmt.h>

static int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    } else if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    } else {
        return -1;
    }
}

uint32_t ipv4_to_host(const IPv4& addr) noexcept {
    return (static_cast<uint32_t>(addr[0]) << 24)
        | (static_cast<uint32_t>(addr[1]) << 16)
        | (static_cast<uint32_t>(addr[2]) << 8)
        | static_cast<uint32_t>(addr[3]);
}

IPv4 ipv4_from_host(uint32_t val) noexcept {
    return IPv4{
        static_cast<uint8_t>(val >> 24),
        static_cast<uint8_t>(val >> 16),
        static_cast<uint8_t>(val >> 8),
        static_cast<uint8_t>(val)
    };
}

std::optional<IPv4> parse_ipv4(std::string_view s) {
    IPv4 ret{};
    size_t octet = 0;
    size_t digits = 0;
    unsigned val = 0;
    for (auto c : s) {
        if (c >= '0' && c <= '9') {
            if (++digits > 3) {
                return std::nullopt;
            }
            val = (val * 10) + static_cast<unsigned>(c - '0');
        } else if (c == '.') {
            if (digits == 0 || val > 255 || octet == 3) {
                return std::nullopt;
            }
            ret[octet++] = static_cast<uint8_t>(val);
            digits = 0;
            val = 0;
        } else {
            return std::nullopt;
        }
    }
    if (octet != 3 || digits == 0 || val > 255) {
        return std::nullopt;
    }
    ret[3] = static_cast<uint8_t>(val);
    return ret;
}

std::string format_ipv4(const IPv4& addr) {
    return fmt::format("{}.{}.{}.{}", addr[0], addr[1], addr[2], addr[3]);
}

uint8_t prefix_len_from_mask(const IPv4& mask) noexcept {
    return static_cast<uint8_t>(__builtin_popcount(ipv4_to_host(mask)));
}

bool is_loopback(const IPv4& addr) noexcept {
    return addr[0] == 127;
}

std::optional<MAC> parse_mac(std::string_view s) {
    MAC ret{};
    char sep = '\0';
    size_t octet = 0;
    size_t digits = 0;
    unsigned val = 0;
    for (auto c : s) {
        if (c == ':' || c == '-') {
            if (digits == 0 || octet == 5) {
                return std::nullopt;
            }
            if (sep == '\0') {
                sep = c;
            } else if (sep != c) {
                return std::nullopt;
            }
            ret[octet++] = static_cast<uint8_t>(val);
            digits = 0;
            val = 0;
            continue;
        }
        auto nibble = hex_value(c);
        if (nibble < 0 || ++digits > 2) {
            return std::nullopt;
        }
        val = (val << 4) | static_cast<unsigned>(nibble);
    }
    if (octet != 5 || digits == 0) {
        return std::nullopt;
    }
    ret[5] = static_cast<uint8_t>(val);
    return ret;
}

std::string format_mac(const MAC& mac) {
    return fmt::format("{:02x}:{:02x}:{:02x}:{:02x}:{:02x}:{:02x}",
                       mac[0], mac[1], mac[2], mac[3], mac[4], mac[5]);
}
