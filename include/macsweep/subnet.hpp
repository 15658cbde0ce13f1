#ifndef MACSWEEP_SUBNET_HPP
#define MACSWEEP_SUBNET_HPP

#include <macsweep/address.hpp>

#include <vector>

// Ordered, without duplicates, at most 254 addresses.
using TargetSet = std::vector<IPv4>;

// Host addresses of the network containing `addr`. Networks larger than a /24
// are not enumerated in full: the result is clamped to the /24 block that
// contains `addr`.
TargetSet enumerate_targets(const IPv4& addr, const IPv4& mask);

// a.b.c.1 through a.b.c.254
TargetSet slash24_targets(const IPv4& addr);

#endif
