#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <fleetcmd/utils/options.hh>
#include "record.hh"

namespace fleetcmd::node {

    /**
     * A single remote host and what is needed to reach it for one run
     */
    class NodeTarget {
    private:

        // The identity of the target in a run (the address, or the node name when unresolved)
        std::string _id;

        // The name of the node
        std::string _name;

        // The address used for the connection
        std::string _address;

        // The ssh options (credentials, timeout, sudo)
        utils::SshOptions _ssh;

    public:

        /**
         * @params:
         *    - name: the name of the node
         *    - address: the resolved address of the node (UNKNOWN_ADDRESS if none)
         *    - ssh: the options used to reach the node
         */
        NodeTarget (const std::string & name, const std::string & address, const utils::SshOptions & ssh);

        /**
         * Create a target from a node record, resolving its address
         */
        static NodeTarget fromRecord (const NodeRecord & rec, const utils::SshOptions & ssh);

        /**
         * Create a target from a raw address, the name of the node is the address
         */
        static NodeTarget fromAddress (const std::string & address, const utils::SshOptions & ssh);

        /**
         * @returns: the identity of the target in a run
         */
        const std::string & getId () const;

        const std::string & getName () const;

        const std::string & getAddress () const;

        /**
         * @returns: false if the address resolution gave nothing usable
         */
        bool isResolved () const;

        const std::string & getUser () const;

        const std::string & getPassword () const;

        const std::vector <std::string> & getKeys () const;

        /**
         * @returns: true if authentication is done with keys (they take precedence over the password)
         */
        bool usesKeys () const;

        float getTimeout () const;

        bool isSudo () const;

        uint32_t getPort () const;

        const utils::SshOptions & getSshOptions () const;

    };

}
