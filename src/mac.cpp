#include <macsweep/mac.hpp>

#include <spdlog/spdlog.h>

#include <cctype>
#include <stdexcept>
#include <utility>

std::string normalize_mac(std::string_view s) {
    std::string ret;
    ret.reserve(s.size());
    for (auto c : s) {
        if (std::isxdigit(static_cast<unsigned char>(c))) {
            ret.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return ret;
}

bool mac_matches(std::string_view mac, std::string_view prefix) {
    auto mac_n = normalize_mac(mac);
    auto prefix_n = normalize_mac(prefix);
    return mac_n.compare(0, prefix_n.size(), prefix_n) == 0 && mac_n.size() >= prefix_n.size();
}

void validate_rule(const DevicePrefixRule& rule) {
    auto prefix = normalize_mac(rule.prefix);
    if (prefix.size() < 4 || prefix.size() > 12) {
        throw std::invalid_argument(fmt::format("invalid MAC prefix '{}'", rule.prefix));
    }
    if (rule.label.empty()) {
        throw std::invalid_argument(fmt::format("missing label for MAC prefix '{}'", rule.prefix));
    }
}

const std::vector<DevicePrefixRule>& default_rules() {
    static const std::vector<DevicePrefixRule> rules = {
        {"94:83:c4", "GL Technologies"},
        {"28:cd:c1", "RaspberryPi"},
        {"2c:cf:67", "RaspberryPi"},
        {"88:a2:9e", "RaspberryPi"},
        {"8c:1f:64:34:a", "RaspberryPi"},
        {"d8:3a:dd", "RaspberryPi"},
        {"dc:a6:32", "RaspberryPi"},
        {"e4:5f:01", "RaspberryPi"},
        {"f0:40:af:9", "RaspberryPi"},
    };
    return rules;
}

MacMatcher::MacMatcher(std::vector<DevicePrefixRule> rules) : rules_(std::move(rules)) {
    prefixes_.reserve(rules_.size());
    for (const auto& rule : rules_) {
        validate_rule(rule);
        prefixes_.push_back(normalize_mac(rule.prefix));
    }
}

const std::vector<DevicePrefixRule>& MacMatcher::rules() const {
    return rules_;
}

std::optional<std::string> MacMatcher::classify(std::string_view mac) const {
    auto mac_n = normalize_mac(mac);
    for (size_t i = 0; i < rules_.size(); ++i) {
        const auto& prefix = prefixes_[i];
        if (mac_n.size() >= prefix.size() && mac_n.compare(0, prefix.size(), prefix) == 0) {
            return rules_[i].label;
        }
    }
    return std::nullopt;
}

std::vector<MatchResult> MacMatcher::match(const std::vector<NeighborRecord>& records) const {
    std::vector<MatchResult> ret;
    for (const auto& record : records) {
        if (auto label = classify(record.mac)) {
            spdlog::debug("{} {} matched {}", format_ipv4(record.ip), record.mac, *label);
            ret.push_back(MatchResult{std::move(*label), record.ip, record.mac});
        }
    }
    return ret;
}
