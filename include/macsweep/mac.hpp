#ifndef MACSWEEP_MAC_HPP
#define MACSWEEP_MAC_HPP

#include <macsweep/address.hpp>
#include <macsweep/neighbor_cache.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct DevicePrefixRule {
    std::string prefix;
    std::string label;
};

struct MatchResult {
    std::string label;
    IPv4 ip;
    std::string mac;
};

// Drops every non-hex character and lowercases the rest.
std::string normalize_mac(std::string_view s);

bool mac_matches(std::string_view mac, std::string_view prefix);

// Throws std::invalid_argument unless the prefix normalizes to 1-12 hex
// digits and the label is non-empty.
void validate_rule(const DevicePrefixRule& rule);

const std::vector<DevicePrefixRule>& default_rules();

// Rules are tried in declaration order, the first match wins.
class MacMatcher {
  private:
    std::vector<DevicePrefixRule> rules_;
    std::vector<std::string> prefixes_;

  public:
    explicit MacMatcher(std::vector<DevicePrefixRule> rules);

    const std::vector<DevicePrefixRule>& rules() const;

    std::optional<std::string> classify(std::string_view mac) const;

    // Matches in record order.
    std::vector<MatchResult> match(const std::vector<NeighborRecord>& records) const;
};

#endif
