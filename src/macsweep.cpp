#include <macsweep/config.hpp>
#include <macsweep/discovery.hpp>
#include <macsweep/system.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stderr_color_sinks.h>

#include <chrono>
#include <cstdio>
#include <exception>
#include <memory>
#include <stdexcept>

static spdlog::level::level_enum parse_log_level(const std::string& log_level) {
    if (log_level == "trace") {
        return spdlog::level::trace;
    } else if (log_level == "debug") {
        return spdlog::level::debug;
    } else if (log_level == "info") {
        return spdlog::level::info;
    } else if (log_level == "warning") {
        return spdlog::level::warn;
    } else if (log_level == "error") {
        return spdlog::level::err;
    } else if (log_level == "off") {
        return spdlog::level::off;
    }
    return spdlog::level::warn;
}

static void init_logging(const std::string& log_level, const std::string& log_file) {
    spdlog::init_thread_pool(8192, 1);
    auto lvl = parse_log_level(log_level);
    if (!log_file.empty()) {
        auto logger = spdlog::create_async<spdlog::sinks::basic_file_sink_mt>("logfile", log_file);
        logger->set_level(lvl);
        spdlog::set_default_logger(std::move(logger));
    } else {
        auto logger = spdlog::create_async<spdlog::sinks::stderr_color_sink_mt>("console");
        logger->set_level(lvl);
        spdlog::set_default_logger(std::move(logger));
    }
}

static int discover(const Config& config) {
    auto fallback = parse_ipv4(config.fallback_subnet);
    if (!fallback) {
        throw std::invalid_argument(fmt::format("invalid fallback subnet '{}'", config.fallback_subnet));
    }

    DiscoveryOptions opts;
    opts.sweep.concurrency = config.concurrency;
    opts.sweep.timeout = std::chrono::milliseconds(config.probe_timeout);
    opts.sweep.deadline = std::chrono::milliseconds(config.probe_deadline);
    opts.fallback_subnet = *fallback;
    opts.active = !config.passive;

    MacMatcher matcher{build_rules(config)};
    if (matcher.rules().empty()) {
        spdlog::warn("no MAC prefix rules configured");
    }
    NeighborCacheParser parser{build_formats(config)};

    std::unique_ptr<NeighborTable> table;
    if (!config.arp_file.empty()) {
        table = std::make_unique<FileNeighborTable>(config.arp_file);
    } else {
        table = std::make_unique<CommandNeighborTable>(config.arp_command);
    }
    PingProber prober;
    SystemNetworkInfo net;

    DiscoveryOrchestrator orchestrator{*table, prober, net, std::move(matcher), std::move(parser), opts};
    auto report = orchestrator.run();
    for (const auto& line : format_report(report.matches)) {
        fmt::print("{}\n", line);
    }
    std::fflush(stdout);

    if (config.exit_status && report.matches.empty()) {
        return 1;
    }
    return 0;
}

int macsweep(int argc, const char* const* argv) {
    Config config;
    std::string log_level{"warning"};
    std::string log_file;

    CLI::App app("Find devices on the local network by MAC address prefix");
    app.add_option("-l,--log-level", log_level, "Logging level: trace, debug, info, warning, error, off")->capture_default_str()
        ->check(CLI::IsMember({"trace", "debug", "info", "warning", "error", "off"}));
    app.add_option("--log-file", log_file, "File to write logs to (stderr if not specified)");

    app.add_option("-r,--rule", config.rules, "Additional MAC prefix rule as PREFIX=LABEL");
    app.add_option("--rules-file", config.rules_file, "File with one 'PREFIX LABEL' rule per line")->check(CLI::ExistingFile);
    app.add_flag("--no-default-rules", config.no_default_rules, "Do not load the built-in MAC prefix rules");
    app.add_option("-f,--format", config.formats, "Neighbor table layout to parse (all built-in layouts if not specified)")
        ->check(CLI::IsMember({"windows", "bsd", "iproute", "proc"}));
    app.add_option("--arp-command", config.arp_command, "Command that lists the neighbor table")->capture_default_str();
    app.add_option("--arp-file", config.arp_file, "Read the neighbor table from a file such as /proc/net/arp instead of running a command");
    app.add_option("-c,--concurrency", config.concurrency, "Number of parallel probes")->capture_default_str()->check(CLI::Range(1, MAX_SWEEP_CONCURRENCY));
    app.add_option("--probe-timeout", config.probe_timeout, "Network timeout of a single probe in milliseconds")->capture_default_str()->check(CLI::PositiveNumber);
    app.add_option("--probe-deadline", config.probe_deadline, "Time in milliseconds after which a probe process is killed")->capture_default_str()->check(CLI::PositiveNumber);
    app.add_option("--fallback-subnet", config.fallback_subnet, "Subnet to probe when no interface can be resolved")->capture_default_str();
    app.add_flag("-p,--passive", config.passive, "Only read the neighbor table, never probe");
    app.add_flag("--exit-status", config.exit_status, "Exit with status 1 when no device matched");

    CLI11_PARSE(app, argc, argv);

    init_logging(log_level, log_file);

    return discover(config);
}

int main(int argc, char** argv) {
    int rc = 1;
    try {
        rc = macsweep(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
    }
    spdlog::shutdown();
    return rc;
}
