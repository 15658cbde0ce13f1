#include <macsweep/device.hpp>
#include <macsweep/utils.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/types.h>
#include <ifaddrs.h>
#include <pcap.h>

#include <string_view>

static std::string_view iface_name(int id) {
    static thread_local char if_name[IF_NAMESIZE];
    if (id == 0) {
        return std::string_view();
    }
    auto name = if_indextoname(static_cast<unsigned>(id), if_name);
    if (name == nullptr) {
        return std::string_view();
    } else {
        return name;
    }
}

Device::Device(const std::string& name)
    : Device(name.c_str()) {}

Device::Device(const char* name)
    : id_(static_cast<int>(if_nametoindex(name))) {}

std::string Device::name() const {
    return std::string(iface_name(id_));
}

std::vector<IPv4Subnet> Device::ipv4_addrs() const {
    std::vector<IPv4Subnet> ret;
    auto name = iface_name(id_);
    if (name.empty()) {
        return ret;
    }
    struct ifaddrs* addrs;
    if (getifaddrs(&addrs) != 0) {
        spdlog::warn("failed to list addresses of {}: {}", name, strerror(errno));
        return ret;
    }
    auto guard = finally([addrs] { freeifaddrs(addrs); });
    for (auto addr = addrs; addr != nullptr; addr = addr->ifa_next) {
        if (addr->ifa_addr != nullptr && name == addr->ifa_name) {
            if (addr->ifa_addr->sa_family == AF_INET) {
                IPv4Subnet val{};
                std::memcpy(val.addr.data(), &((struct sockaddr_in *)addr->ifa_addr)->sin_addr.s_addr, 4);
                if (addr->ifa_netmask != nullptr) {
                    std::memcpy(val.mask.data(), &((struct sockaddr_in *)addr->ifa_netmask)->sin_addr.s_addr, 4);
                }
                ret.push_back(val);
            }
        }
    }
    return ret;
}

std::vector<std::string> list_devices() {
    std::vector<std::string> ret;
    char err_buf[PCAP_ERRBUF_SIZE];
    pcap_if_t* devs = nullptr;
    if (pcap_findalldevs(&devs, err_buf) != 0) {
        spdlog::warn("failed to enumerate interfaces: {}", err_buf);
        return ret;
    }
    auto guard = finally([devs] {
        if (devs != nullptr) {
            pcap_freealldevs(devs);
        }
    });
    for (auto dev = devs; dev != nullptr; dev = dev->next) {
        if (dev->name != nullptr) {
            ret.emplace_back(dev->name);
        }
    }
    return ret;
}
