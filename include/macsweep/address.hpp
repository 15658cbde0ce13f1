#ifndef MACSWEEP_ADDRESS_HPP
#define MACSWEEP_ADDRESS_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Network byte order, i.e. {192, 168, 1, 10} for 192.168.1.10
using IPv4 = std::array<uint8_t, 4>;
using MAC = std::array<uint8_t, 6>;

struct IPv4Subnet {
    IPv4 addr;
    IPv4 mask;
};

uint32_t ipv4_to_host(const IPv4& addr) noexcept;
IPv4 ipv4_from_host(uint32_t val) noexcept;

// Strict dotted quad: four decimal octets of 1-3 digits, each <= 255.
std::optional<IPv4> parse_ipv4(std::string_view s);
std::string format_ipv4(const IPv4& addr);

// Number of one bits in the mask.
uint8_t prefix_len_from_mask(const IPv4& mask) noexcept;

bool is_loopback(const IPv4& addr) noexcept;

// Six octets of one or two hex digits joined by a single separator style
// (':' or '-').
std::optional<MAC> parse_mac(std::string_view s);

// Lowercase, colon separated, two digits per octet.
std::string format_mac(const MAC& mac);

#endif
