#ifndef MACSWEEP_SYSINFO_HPP
#define MACSWEEP_SYSINFO_HPP

#include <optional>
#include <string>
#include <string_view>

// Interface of the lowest metric default IPv4 route in /proc/net/route.
std::optional<std::string> default_route_iface();

// Same, reading a route table in /proc/net/route layout from `table`.
std::optional<std::string> parse_default_route(std::string_view table);

std::optional<std::string> read_text_file(const std::string& path);

#endif
