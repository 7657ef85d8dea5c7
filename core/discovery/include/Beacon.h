#pragma once

#include "Result.h"
#include <string>

namespace NetLink {

/**
 * @brief Presence announcement carried by one UDP datagram
 *
 * Encoded as a compact JSON object:
 * {"service":"netlink","version":1,"name":"host","port":5000,"instance":"..."}
 */
struct Beacon {
    std::string machineName;
    int port{0};
    std::string instanceId;
    int version{1};
};

class BeaconCodec {
public:
    static std::string encode(const Beacon& beacon);

    /**
     * @brief Parse a datagram payload
     *
     * Fails with ForeignBeacon when the JSON belongs to another service and
     * MalformedBeacon for anything that is not a well-formed beacon.
     */
    static nlk::Result<Beacon> decode(const std::string& payload);
};

} // namespace NetLink
