#pragma once

#include <string>
#include "record.hh"

namespace fleetcmd::node {

    // Address returned when a node reported nothing usable to reach it
    extern const std::string UNKNOWN_ADDRESS;

    enum class CloudProvider {
        NONE,
        EC2,
        RACKSPACE,
        EUCALYPTUS,
        OTHER
    };

    /**
     * Selects the single address used to reach a node from its reported attributes
     */
    class AddressResolver {
    public:

        /**
         * Resolution policy (first match wins):
         *    - cloud node with a public hostname -> public hostname
         *    - cloud node with a public ipv4 -> public ipv4
         *    - fqdn, then ipaddress
         * @returns: the address, or UNKNOWN_ADDRESS if nothing matches
         */
        static std::string resolve (const NodeRecord & rec);

        /**
         * @returns: the cloud provider of the node (NONE if the node has no cloud attribute)
         */
        static CloudProvider classify (const NodeRecord & rec);

        static bool isEc2 (const NodeRecord & rec);

        static bool isRackspace (const NodeRecord & rec);

        static bool isEucalyptus (const NodeRecord & rec);

    };

}
