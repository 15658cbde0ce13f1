#include <macsweep/system.hpp>
#include <macsweep/device.hpp>
#include <macsweep/process.hpp>
#include <macsweep/sysinfo.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

CommandNeighborTable::CommandNeighborTable(const std::string& cmd, std::chrono::milliseconds timeout)
    : argv_(split_command(cmd)),
      timeout_(timeout) {
}

std::string CommandNeighborTable::dump() {
    if (argv_.empty()) {
        spdlog::warn("no neighbor table command configured");
        return std::string();
    }
    auto result = run_process(argv_, timeout_, true);
    if (!result.started) {
        return std::string();
    } else if (result.timed_out) {
        spdlog::warn("{} timed out", argv_.front());
        return std::string();
    } else if (result.exit_code != 0) {
        spdlog::warn("{} exited with status {}", argv_.front(), result.exit_code);
        return std::string();
    }
    return std::move(result.output);
}

FileNeighborTable::FileNeighborTable(std::string path) : path_(std::move(path)) {}

std::string FileNeighborTable::dump() {
    auto text = read_text_file(path_);
    if (!text) {
        return std::string();
    }
    return std::move(*text);
}

void PingProber::probe(const IPv4& target, const SweepOptions& opts) {
    auto secs = static_cast<double>(opts.timeout.count()) / 1000.0;
    std::vector<std::string> argv = {
        "ping",
        "-c", std::to_string(std::max(opts.count, 1)),
        "-W", fmt::format("{:g}", secs),
        format_ipv4(target)
    };
    auto result = run_process(argv, opts.deadline, false);
    spdlog::trace("ping {}: started={} timed_out={} status={}",
                  argv.back(), result.started, result.timed_out, result.exit_code);
}

std::optional<std::string> SystemNetworkInfo::default_gateway_iface() {
    return default_route_iface();
}

std::vector<std::string> SystemNetworkInfo::interfaces() {
    return list_devices();
}

std::vector<IPv4Subnet> SystemNetworkInfo::ipv4_addrs(const std::string& iface) {
    return Device{iface}.ipv4_addrs();
}
