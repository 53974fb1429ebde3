#include "target.hh"
#include "resolver.hh"

namespace fleetcmd::node {

    NodeTarget::NodeTarget (const std::string & name, const std::string & address, const utils::SshOptions & ssh)
        : _name (name)
        , _address (address)
        , _ssh (ssh)
    {
        if (address == "" || address == UNKNOWN_ADDRESS) {
            this-> _address = UNKNOWN_ADDRESS;
            this-> _id = name;
        } else {
            this-> _id = address;
        }
    }

    NodeTarget NodeTarget::fromRecord (const NodeRecord & rec, const utils::SshOptions & ssh) {
        return NodeTarget (rec.getName (), AddressResolver::resolve (rec), ssh);
    }

    NodeTarget NodeTarget::fromAddress (const std::string & address, const utils::SshOptions & ssh) {
        return NodeTarget (address, address, ssh);
    }

    const std::string & NodeTarget::getId () const {
        return this-> _id;
    }

    const std::string & NodeTarget::getName () const {
        return this-> _name;
    }

    const std::string & NodeTarget::getAddress () const {
        return this-> _address;
    }

    bool NodeTarget::isResolved () const {
        return this-> _address != UNKNOWN_ADDRESS;
    }

    const std::string & NodeTarget::getUser () const {
        return this-> _ssh.user;
    }

    const std::string & NodeTarget::getPassword () const {
        return this-> _ssh.password;
    }

    const std::vector <std::string> & NodeTarget::getKeys () const {
        return this-> _ssh.keys;
    }

    bool NodeTarget::usesKeys () const {
        return !this-> _ssh.keys.empty ();
    }

    float NodeTarget::getTimeout () const {
        return this-> _ssh.timeout;
    }

    bool NodeTarget::isSudo () const {
        return this-> _ssh.sudo;
    }

    uint32_t NodeTarget::getPort () const {
        return this-> _ssh.port;
    }

    const utils::SshOptions & NodeTarget::getSshOptions () const {
        return this-> _ssh;
    }

}
