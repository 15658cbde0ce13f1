#include <macsweep/discovery.hpp>

#include <spdlog/spdlog.h>

#include <utility>

DiscoveryOrchestrator::DiscoveryOrchestrator(NeighborTable& table,
                                             Prober& prober,
                                             NetworkInfo& net,
                                             MacMatcher matcher,
                                             NeighborCacheParser parser,
                                             const DiscoveryOptions& opts)
    : table_(&table),
      prober_(&prober),
      net_(&net),
      matcher_(std::move(matcher)),
      parser_(std::move(parser)),
      opts_(opts) {
}

std::vector<MatchResult> DiscoveryOrchestrator::scan_cache() {
    auto records = parser_.parse(table_->dump());
    return matcher_.match(records);
}

TargetSet DiscoveryOrchestrator::sweep_targets(DiscoveryReport& report) {
    auto binding = select_interface(*net_);
    if (binding) {
        spdlog::info("sweeping {}/{} on {}", format_ipv4(binding->addr),
                     prefix_len_from_mask(binding->mask), binding->name);
        report.iface = binding->name;
        return enumerate_targets(binding->addr, binding->mask);
    }
    spdlog::info("falling back to {}/24", format_ipv4(opts_.fallback_subnet));
    report.used_fallback = true;
    return slash24_targets(opts_.fallback_subnet);
}

DiscoveryReport DiscoveryOrchestrator::run() {
    DiscoveryReport report;
    report.matches = scan_cache();
    if (!report.matches.empty()) {
        spdlog::info("{} matches in the neighbor cache", report.matches.size());
        return report;
    }
    if (!opts_.active) {
        spdlog::info("no matches in the neighbor cache");
        return report;
    }

    spdlog::info("no matches in the neighbor cache, probing the local subnet");
    report.phase = Phase::active;
    auto targets = sweep_targets(report);
    ProbeSweep sweep{*prober_, opts_.sweep};
    sweep.run(targets);
    report.targets_probed = targets.size();

    report.matches = scan_cache();
    spdlog::info("{} matches after probing {} addresses", report.matches.size(), report.targets_probed);
    return report;
}

std::vector<std::string> format_report(const std::vector<MatchResult>& matches) {
    std::vector<std::string> ret;
    if (matches.empty()) {
        ret.emplace_back("No matches found for configured MAC prefixes");
        return ret;
    }
    ret.reserve(matches.size());
    for (size_t i = 0; i < matches.size(); ++i) {
        const auto& match = matches[i];
        ret.push_back(fmt::format("{}. {} {} {}", i + 1, match.label, format_ipv4(match.ip), match.mac));
    }
    return ret;
}
