#include <macsweep/neighbor_cache.hpp>

#include <spdlog/spdlog.h>

#include <utility>

static const std::string IP_RE = R"((\d{1,3}(?:\.\d{1,3}){3}))";
static const std::string MAC_RE = R"(((?:[0-9A-Fa-f]{1,2}[:-]){5}[0-9A-Fa-f]{1,2})(?![0-9A-Fa-f:-]))";
static const std::string LEAD_RE = R"((?:^|[^\d.]))";

// Capture 1 is the IP, capture 2 the MAC.
static TableFormat make_format(std::string name, const std::string& before_ip, const std::string& between) {
    auto pattern = before_ip + IP_RE + between + MAC_RE;
    return TableFormat{std::move(name), std::regex(pattern, std::regex::ECMAScript | std::regex::optimize)};
}

const std::vector<TableFormat>& builtin_table_formats() {
    static const std::vector<TableFormat> formats = {
        // 192.168.1.1           94-83-c4-01-02-03     dynamic
        make_format("windows", LEAD_RE, R"(\s+)"),
        // ? (192.168.1.1) at 94:83:c4:01:02:03 [ether] on eth0
        make_format("bsd", R"(\()", R"(\)\s+at\s+)"),
        // 192.168.1.1 dev eth0 lladdr 94:83:c4:01:02:03 REACHABLE
        make_format("iproute", LEAD_RE, R"(\s.*\blladdr\s+)"),
        // 192.168.1.1      0x1         0x2         94:83:c4:01:02:03     *        eth0
        make_format("proc", LEAD_RE, R"(\s+0x[0-9A-Fa-f]+\s+0x[0-9A-Fa-f]+\s+)"),
    };
    return formats;
}

std::optional<TableFormat> find_table_format(std::string_view name) {
    for (const auto& format : builtin_table_formats()) {
        if (format.name == name) {
            return format;
        }
    }
    return std::nullopt;
}

NeighborCacheParser::NeighborCacheParser() : formats_(builtin_table_formats()) {}

NeighborCacheParser::NeighborCacheParser(std::vector<TableFormat> formats)
    : formats_(std::move(formats)) {}

std::optional<NeighborRecord> NeighborCacheParser::parse_line(std::string_view line) const {
    std::match_results<std::string_view::const_iterator> m;
    for (const auto& format : formats_) {
        if (!std::regex_search(line.begin(), line.end(), m, format.pattern)) {
            continue;
        }
        auto ip = parse_ipv4(line.substr(static_cast<size_t>(m.position(1)), static_cast<size_t>(m.length(1))));
        auto mac = parse_mac(line.substr(static_cast<size_t>(m.position(2)), static_cast<size_t>(m.length(2))));
        if (!ip || !mac) {
            spdlog::trace("skipping malformed {} entry: {}", format.name, line);
            continue;
        }
        return NeighborRecord{*ip, format_mac(*mac)};
    }
    return std::nullopt;
}

std::vector<NeighborRecord> NeighborCacheParser::parse(std::string_view raw) const {
    std::vector<NeighborRecord> ret;
    while (!raw.empty()) {
        auto pos = raw.find('\n');
        auto line = raw.substr(0, pos);
        raw = pos == std::string_view::npos ? std::string_view{} : raw.substr(pos + 1);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (line.empty()) {
            continue;
        }
        if (auto record = parse_line(line)) {
            ret.push_back(std::move(*record));
        }
    }
    spdlog::debug("parsed {} neighbor records", ret.size());
    return ret;
}
