#ifndef MACSWEEP_DEVICE_HPP
#define MACSWEEP_DEVICE_HPP

#include <macsweep/address.hpp>

#include <string>
#include <vector>

class Device {
  private:
    int id_;

  public:
    explicit Device(const std::string& name);
    explicit Device(const char* name);

    std::string name() const;

    std::vector<IPv4Subnet> ipv4_addrs() const;
};

// Names of the capture-capable interfaces in the order libpcap reports them.
// Empty if the enumeration fails.
std::vector<std::string> list_devices();

#endif
