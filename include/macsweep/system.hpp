#ifndef MACSWEEP_SYSTEM_HPP
#define MACSWEEP_SYSTEM_HPP

#include <macsweep/iface_select.hpp>
#include <macsweep/neighbor_cache.hpp>
#include <macsweep/probe_sweep.hpp>

#include <chrono>
#include <string>
#include <vector>

// Neighbor table read from the output of a command such as `arp -an`.
class CommandNeighborTable : public NeighborTable {
  private:
    std::vector<std::string> argv_;
    std::chrono::milliseconds timeout_;

  public:
    explicit CommandNeighborTable(const std::string& cmd,
                                  std::chrono::milliseconds timeout = std::chrono::seconds(5));

    std::string dump() override;
};

// Neighbor table read from a file such as /proc/net/arp.
class FileNeighborTable : public NeighborTable {
  private:
    std::string path_;

  public:
    explicit FileNeighborTable(std::string path);

    std::string dump() override;
};

// Probes with `ping -c <count> -W <seconds> <target>`.
class PingProber : public Prober {
  public:
    void probe(const IPv4& target, const SweepOptions& opts) override;
};

// Interfaces from libpcap, addresses from getifaddrs, default route from
// /proc/net/route.
class SystemNetworkInfo : public NetworkInfo {
  public:
    std::optional<std::string> default_gateway_iface() override;
    std::vector<std::string> interfaces() override;
    std::vector<IPv4Subnet> ipv4_addrs(const std::string& iface) override;
};

#endif
