#include <macsweep/probe_sweep.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <system_error>
#include <thread>
#include <vector>

ProbeSweep::ProbeSweep(Prober& prober, const SweepOptions& opts)
    : prober_(&prober),
      opts_(opts) {
}

size_t ProbeSweep::worker_count(size_t num_targets) const {
    auto concurrency = static_cast<size_t>(std::clamp(opts_.concurrency, 1, MAX_SWEEP_CONCURRENCY));
    return std::min(concurrency, num_targets);
}

void ProbeSweep::work(WorkQueue<IPv4>& queue) {
    while (auto target = queue.try_pop()) {
        try {
            prober_->probe(*target, opts_);
        } catch (const std::exception& e) {
            spdlog::debug("probe of {} failed: {}", format_ipv4(*target), e.what());
        }
    }
}

void ProbeSweep::run(const TargetSet& targets) {
    if (targets.empty()) {
        return;
    }

    WorkQueue<IPv4> queue{targets};
    const auto num_workers = worker_count(targets.size());
    spdlog::info("probing {} addresses with {} workers", targets.size(), num_workers);

    std::vector<std::thread> workers;
    workers.reserve(num_workers);
    for (size_t i = 0; i < num_workers; ++i) {
        try {
            workers.emplace_back([this, &queue] { work(queue); });
        } catch (const std::system_error& e) {
            spdlog::warn("started {} of {} probe workers: {}", workers.size(), num_workers, e.what());
            break;
        }
    }

    if (workers.empty()) {
        work(queue);
    }
    for (auto& worker : workers) {
        worker.join();
    }
    spdlog::debug("probe sweep finished");
}
