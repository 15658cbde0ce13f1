#include <macsweep/sysinfo.hpp>
#include <macsweep/utils.hpp>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>

static constexpr unsigned RTF_UP_FLAG = 0x1;

static bool parse_hex(std::string_view s, unsigned long& out) {
    if (s.empty() || s.size() > 8) {
        return false;
    }
    unsigned long val = 0;
    for (auto c : s) {
        if (c >= '0' && c <= '9') {
            val = (val << 4) | static_cast<unsigned long>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            val = (val << 4) | static_cast<unsigned long>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            val = (val << 4) | static_cast<unsigned long>(c - 'A' + 10);
        } else {
            return false;
        }
    }
    out = val;
    return true;
}

std::optional<std::string> parse_default_route(std::string_view table) {
    std::optional<std::string> ret;
    unsigned long best_metric = std::numeric_limits<unsigned long>::max();
    std::istringstream file{std::string(table)};
    std::string line;
    // header
    std::getline(file, line);
    while (std::getline(file, line)) {
        std::istringstream fields{line};
        std::string iface, dest, gateway, flags, refcnt, use, metric, mask;
        if (!(fields >> iface >> dest >> gateway >> flags >> refcnt >> use >> metric >> mask)) {
            continue;
        }
        unsigned long dest_val = 0;
        unsigned long mask_val = 0;
        unsigned long flags_val = 0;
        if (!parse_hex(dest, dest_val) || !parse_hex(mask, mask_val) || !parse_hex(flags, flags_val)) {
            continue;
        }
        if (dest_val != 0 || mask_val != 0 || (flags_val & RTF_UP_FLAG) == 0) {
            continue;
        }
        unsigned long metric_val = 0;
        for (auto c : trim(metric)) {
            if (c < '0' || c > '9') {
                metric_val = std::numeric_limits<unsigned long>::max();
                break;
            }
            metric_val = (metric_val * 10) + static_cast<unsigned long>(c - '0');
        }
        if (!ret || metric_val < best_metric) {
            ret = iface;
            best_metric = metric_val;
        }
    }
    return ret;
}

std::optional<std::string> default_route_iface() {
    auto table = read_text_file("/proc/net/route");
    if (!table) {
        return std::nullopt;
    }
    auto iface = parse_default_route(*table);
    if (iface) {
        spdlog::debug("default route via {}", *iface);
    } else {
        spdlog::debug("no default IPv4 route");
    }
    return iface;
}

std::optional<std::string> read_text_file(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::warn("{} does not exist", path);
        return std::nullopt;
    }
    std::ifstream file{path};
    if (!file) {
        spdlog::warn("failed to open {}", path);
        return std::nullopt;
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}
