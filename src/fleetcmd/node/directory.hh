#pragma once

#include <map>
#include <string>
#include <vector>

#include "record.hh"

namespace fleetcmd::node {

    /**
     * Lookup of node records in the directory service
     */
    class NodeDirectory {
    public:

        /**
         * @returns: every node of the directory
         */
        virtual std::vector <NodeRecord> all () = 0;

        /**
         * @returns: the node named 'name'
         * @throws: ConfigError if the node does not exist
         */
        virtual NodeRecord find (const std::string & name) = 0;

        virtual ~NodeDirectory ();

    };

    /**
     * Directory of json node records stored on the local disk (one file per node)
     */
    class FileDirectory : public NodeDirectory {
    private:

        // The directory containing the records
        std::string _path;

        // The records by name, loaded on first access
        std::map <std::string, NodeRecord> _records;

        bool _loaded = false;

    public:

        /**
         * @params:
         *    - path: the directory containing the json records
         */
        FileDirectory (const std::string & path);

        std::vector <NodeRecord> all () override;

        NodeRecord find (const std::string & name) override;

    private:

        /**
         * Read all the json files of the directory
         * @throws: ConfigError if a file is not a node record
         */
        void load ();

    };

}
