#ifndef MACSWEEP_TESTS_FAKES_HPP
#define MACSWEEP_TESTS_FAKES_HPP

#include <macsweep/iface_select.hpp>
#include <macsweep/neighbor_cache.hpp>
#include <macsweep/probe_sweep.hpp>

#include <algorithm>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Returns the queued dumps in order, then repeats the last one.
class FakeNeighborTable : public NeighborTable {
  private:
    std::vector<std::string> dumps_;
    size_t calls_{0};

  public:
    explicit FakeNeighborTable(std::vector<std::string> dumps) : dumps_(std::move(dumps)) {}

    std::string dump() override {
        ++calls_;
        if (dumps_.empty()) {
            return std::string();
        }
        auto idx = std::min(calls_, dumps_.size()) - 1;
        return dumps_[idx];
    }

    size_t calls() const {
        return calls_;
    }
};

class RecordingProber : public Prober {
  private:
    std::mutex mut_;
    std::vector<IPv4> probed_;
    std::function<void(const IPv4&)> on_probe_;

  public:
    RecordingProber() = default;
    explicit RecordingProber(std::function<void(const IPv4&)> on_probe) : on_probe_(std::move(on_probe)) {}

    void probe(const IPv4& target, const SweepOptions&) override {
        {
            std::lock_guard<std::mutex> lock{mut_};
            probed_.push_back(target);
        }
        if (on_probe_) {
            on_probe_(target);
        }
    }

    std::vector<IPv4> probed() {
        std::lock_guard<std::mutex> lock{mut_};
        return probed_;
    }
};

class FakeNetworkInfo : public NetworkInfo {
  public:
    std::optional<std::string> gateway;
    std::vector<std::string> names;
    std::map<std::string, std::vector<IPv4Subnet>> addrs;
    bool fail{false};

    std::optional<std::string> default_gateway_iface() override {
        if (fail) {
            throw std::runtime_error("route table unavailable");
        }
        return gateway;
    }

    std::vector<std::string> interfaces() override {
        if (fail) {
            throw std::runtime_error("interface list unavailable");
        }
        return names;
    }

    std::vector<IPv4Subnet> ipv4_addrs(const std::string& iface) override {
        auto it = addrs.find(iface);
        if (it == addrs.end()) {
            return {};
        }
        return it->second;
    }

    void add(const std::string& name, IPv4 addr, IPv4 mask) {
        names.push_back(name);
        addrs[name].push_back(IPv4Subnet{addr, mask});
    }
};

#endif
