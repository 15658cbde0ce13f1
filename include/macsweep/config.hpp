#ifndef MACSWEEP_CONFIG_HPP
#define MACSWEEP_CONFIG_HPP

#include <macsweep/mac.hpp>
#include <macsweep/neighbor_cache.hpp>

#include <string>
#include <string_view>
#include <vector>

struct Config {
    std::vector<std::string> rules;
    std::string rules_file;
    std::vector<std::string> formats;
    std::string arp_command{"arp -an"};
    std::string arp_file;
    std::string fallback_subnet{"192.168.1.0"};
    int concurrency{60};
    int probe_timeout{200};
    int probe_deadline{1000};
    bool no_default_rules{false};
    bool passive{false};
    bool exit_status{false};
};

// PREFIX=LABEL
DevicePrefixRule parse_rule(std::string_view text);

// One `PREFIX LABEL...` rule per line. Blank lines and lines starting with '#'
// are skipped. Throws std::runtime_error if the file cannot be read and
// std::invalid_argument on a malformed line.
std::vector<DevicePrefixRule> load_rules_file(const std::string& path);
std::vector<DevicePrefixRule> parse_rules(std::string_view text);

// Defaults (unless disabled), then the rules file, then --rule options.
std::vector<DevicePrefixRule> build_rules(const Config& config);

// Throws std::invalid_argument on an unknown format name.
std::vector<TableFormat> build_formats(const Config& config);

#endif
