#include "resolver.hh"

namespace fleetcmd::node {

    const std::string UNKNOWN_ADDRESS = "unknown";

    std::string AddressResolver::resolve (const NodeRecord & rec) {
        if (rec.isCloud ()) {
            auto hostname = rec.getAutomaticStr ("cloud.public_hostname");
            if (hostname != "") return hostname;

            auto ip = rec.getAutomaticStr ("cloud.public_ipv4");
            if (ip != "") return ip;
        }

        auto fqdn = rec.getAutomaticStr ("fqdn");
        if (fqdn != "") return fqdn;

        auto ip = rec.getAutomaticStr ("ipaddress");
        if (ip != "") return ip;

        return UNKNOWN_ADDRESS;
    }

    CloudProvider AddressResolver::classify (const NodeRecord & rec) {
        if (!rec.isCloud ()) return CloudProvider::NONE;

        auto provider = rec.getCloudProvider ();
        if (provider == "ec2") return CloudProvider::EC2;
        if (provider == "rackspace") return CloudProvider::RACKSPACE;
        if (provider == "eucalyptus") return CloudProvider::EUCALYPTUS;
        if (provider == "") return CloudProvider::NONE;

        return CloudProvider::OTHER;
    }

    bool AddressResolver::isEc2 (const NodeRecord & rec) {
        return classify (rec) == CloudProvider::EC2;
    }

    bool AddressResolver::isRackspace (const NodeRecord & rec) {
        return classify (rec) == CloudProvider::RACKSPACE;
    }

    bool AddressResolver::isEucalyptus (const NodeRecord & rec) {
        return classify (rec) == CloudProvider::EUCALYPTUS;
    }

}
