#ifndef MACSWEEP_PROBE_SWEEP_HPP
#define MACSWEEP_PROBE_SWEEP_HPP

#include <macsweep/address.hpp>
#include <macsweep/subnet.hpp>
#include <macsweep/work_queue.hpp>

#include <chrono>

static constexpr int MAX_SWEEP_CONCURRENCY = 60;

struct SweepOptions {
    int concurrency{MAX_SWEEP_CONCURRENCY};
    // network timeout handed to the probe itself
    std::chrono::milliseconds timeout{200};
    // hard limit after which a probe is abandoned
    std::chrono::milliseconds deadline{1000};
    int count{1};
};

// Sends one reachability probe. The outcome is of no interest; the probe only
// exists to make the OS resolve the target's hardware address.
class Prober {
  public:
    virtual ~Prober() = default;

    virtual void probe(const IPv4& target, const SweepOptions& opts) = 0;
};

class ProbeSweep {
  private:
    Prober* prober_;
    SweepOptions opts_;

    void work(WorkQueue<IPv4>& queue);

  public:
    ProbeSweep(Prober& prober, const SweepOptions& opts);

    // Number of worker threads used for a sweep over `num_targets` addresses.
    size_t worker_count(size_t num_targets) const;

    // Blocks until every target has been probed once.
    void run(const TargetSet& targets);
};

#endif
