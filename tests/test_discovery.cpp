#include <macsweep/discovery.hpp>

#include "fakes.hpp"

#include <gtest/gtest.h>

#include <algorithm>

static const IPv4 MASK24{255, 255, 255, 0};

static const char* CACHE_WITH_PI =
    "? (192.168.1.1) at 00:11:22:33:44:55 [ether] on eth0\n"
    "? (192.168.1.10) at 28:cd:c1:aa:bb:cc [ether] on eth0\n";

static const char* CACHE_WITHOUT_MATCH =
    "? (192.168.1.1) at 00:11:22:33:44:55 [ether] on eth0\n";

static DiscoveryOrchestrator make_orchestrator(NeighborTable& table, Prober& prober, NetworkInfo& net,
                                               bool active = true) {
    DiscoveryOptions opts;
    opts.active = active;
    return DiscoveryOrchestrator{table, prober, net, MacMatcher{default_rules()}, NeighborCacheParser{}, opts};
}

TEST(Discovery, MatchInCacheSkipsSweep) {
    FakeNeighborTable table{{CACHE_WITH_PI}};
    RecordingProber prober;
    FakeNetworkInfo net;
    net.add("eth0", IPv4{192, 168, 1, 50}, MASK24);

    auto report = make_orchestrator(table, prober, net).run();

    ASSERT_EQ(report.matches.size(), 1u);
    EXPECT_EQ(report.matches[0].label, "RaspberryPi");
    EXPECT_EQ(report.matches[0].ip, (IPv4{192, 168, 1, 10}));
    EXPECT_EQ(report.matches[0].mac, "28:cd:c1:aa:bb:cc");
    EXPECT_EQ(report.phase, Phase::passive);
    EXPECT_EQ(table.calls(), 1u);
    EXPECT_TRUE(prober.probed().empty());
}

TEST(Discovery, SweepPopulatesCache) {
    FakeNeighborTable table{{"", CACHE_WITH_PI}};
    RecordingProber prober;
    FakeNetworkInfo net;
    net.add("eth0", IPv4{192, 168, 1, 50}, MASK24);
    net.gateway = "eth0";

    auto report = make_orchestrator(table, prober, net).run();

    EXPECT_EQ(report.phase, Phase::active);
    EXPECT_EQ(report.iface.value_or(""), "eth0");
    EXPECT_FALSE(report.used_fallback);
    EXPECT_EQ(report.targets_probed, 254u);
    EXPECT_EQ(prober.probed().size(), 254u);
    EXPECT_EQ(table.calls(), 2u);
    ASSERT_EQ(report.matches.size(), 1u);
    EXPECT_EQ(report.matches[0].ip, (IPv4{192, 168, 1, 10}));
}

TEST(Discovery, FallbackSubnetWithoutInterface) {
    FakeNeighborTable table{{""}};
    RecordingProber prober;
    FakeNetworkInfo net;

    auto report = make_orchestrator(table, prober, net).run();

    EXPECT_EQ(report.phase, Phase::active);
    EXPECT_TRUE(report.used_fallback);
    EXPECT_FALSE(report.iface.has_value());
    auto probed = prober.probed();
    ASSERT_EQ(probed.size(), 254u);
    std::sort(probed.begin(), probed.end());
    EXPECT_EQ(probed, slash24_targets(IPv4{192, 168, 1, 0}));
    EXPECT_TRUE(report.matches.empty());
}

TEST(Discovery, EmptyAfterSweepIsStillAReport) {
    FakeNeighborTable table{{CACHE_WITHOUT_MATCH}};
    RecordingProber prober;
    FakeNetworkInfo net;
    net.add("eth0", IPv4{10, 0, 0, 5}, IPv4{255, 255, 255, 240});

    auto report = make_orchestrator(table, prober, net).run();

    EXPECT_EQ(report.phase, Phase::active);
    EXPECT_EQ(report.targets_probed, 14u);
    EXPECT_EQ(table.calls(), 2u);
    EXPECT_TRUE(report.matches.empty());
}

TEST(Discovery, PassiveOnlyNeverProbes) {
    FakeNeighborTable table{{""}};
    RecordingProber prober;
    FakeNetworkInfo net;
    net.add("eth0", IPv4{192, 168, 1, 50}, MASK24);

    auto report = make_orchestrator(table, prober, net, false).run();

    EXPECT_EQ(report.phase, Phase::passive);
    EXPECT_TRUE(report.matches.empty());
    EXPECT_TRUE(prober.probed().empty());
    EXPECT_EQ(table.calls(), 1u);
}

TEST(Discovery, ReportLines) {
    std::vector<MatchResult> matches = {
        {"GL Technologies", IPv4{192, 168, 8, 1}, "94:83:c4:01:02:03"},
        {"RaspberryPi", IPv4{192, 168, 8, 20}, "dc:a6:32:aa:bb:cc"},
    };
    auto lines = format_report(matches);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "1. GL Technologies 192.168.8.1 94:83:c4:01:02:03");
    EXPECT_EQ(lines[1], "2. RaspberryPi 192.168.8.20 dc:a6:32:aa:bb:cc");
}

TEST(Discovery, EmptyReportLine) {
    auto lines = format_report({});
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "No matches found for configured MAC prefixes");
}
