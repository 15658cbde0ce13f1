#ifndef MACSWEEP_NEIGHBOR_CACHE_HPP
#define MACSWEEP_NEIGHBOR_CACHE_HPP

#include <macsweep/address.hpp>

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

struct NeighborRecord {
    IPv4 ip;
    // canonical form, see format_mac()
    std::string mac;
};

// One layout of neighbor table text. The pattern is searched in each line;
// capture 1 is the IPv4 address and capture 2 the hardware address.
struct TableFormat {
    std::string name;
    std::regex pattern;
};

// windows, bsd, iproute, proc
const std::vector<TableFormat>& builtin_table_formats();

std::optional<TableFormat> find_table_format(std::string_view name);

class NeighborCacheParser {
  private:
    std::vector<TableFormat> formats_;

    std::optional<NeighborRecord> parse_line(std::string_view line) const;

  public:
    NeighborCacheParser();
    explicit NeighborCacheParser(std::vector<TableFormat> formats);

    std::vector<NeighborRecord> parse(std::string_view raw) const;
};

// Source of raw neighbor table text. An unavailable source yields an empty
// string.
class NeighborTable {
  public:
    virtual ~NeighborTable() = default;

    virtual std::string dump() = 0;
};

#endif
