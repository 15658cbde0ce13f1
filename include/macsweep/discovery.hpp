#ifndef MACSWEEP_DISCOVERY_HPP
#define MACSWEEP_DISCOVERY_HPP

#include <macsweep/iface_select.hpp>
#include <macsweep/mac.hpp>
#include <macsweep/neighbor_cache.hpp>
#include <macsweep/probe_sweep.hpp>
#include <macsweep/subnet.hpp>

#include <optional>
#include <string>
#include <vector>

struct DiscoveryOptions {
    SweepOptions sweep;
    // swept when no interface can be resolved
    IPv4 fallback_subnet{192, 168, 1, 0};
    bool active{true};
};

enum class Phase {
    passive,
    active
};

struct DiscoveryReport {
    std::vector<MatchResult> matches;
    Phase phase{Phase::passive};
    std::optional<std::string> iface;
    size_t targets_probed{0};
    bool used_fallback{false};
};

// Reads the neighbor cache and matches it against the rules. If nothing
// matches, sweeps the local subnet once to populate the cache and reads it
// again.
class DiscoveryOrchestrator {
  private:
    NeighborTable* table_;
    Prober* prober_;
    NetworkInfo* net_;
    MacMatcher matcher_;
    NeighborCacheParser parser_;
    DiscoveryOptions opts_;

    std::vector<MatchResult> scan_cache();
    TargetSet sweep_targets(DiscoveryReport& report);

  public:
    DiscoveryOrchestrator(NeighborTable& table,
                          Prober& prober,
                          NetworkInfo& net,
                          MacMatcher matcher,
                          NeighborCacheParser parser,
                          const DiscoveryOptions& opts);

    DiscoveryReport run();
};

// "N. <label> <ip> <mac>" per match, or the single no-match line.
std::vector<std::string> format_report(const std::vector<MatchResult>& matches);

#endif
