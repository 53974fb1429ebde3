#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace fleetcmd::node {

    /**
     * A node as it is stored in the directory service
     * The automatic attributes are the ones reported by the node itself (cloud, fqdn, ipaddress, ...)
     */
    class NodeRecord {
    private:

        // The name of the node in the directory
        std::string _name;

        // The environment of the node
        std::string _environment;

        // The run list of the node
        std::vector <std::string> _runList;

        // The attributes reported by the node
        nlohmann::json _automatic;

        // The attributes set by the users
        nlohmann::json _normal;

    public:

        /**
         * @params:
         *    - name: the name of the node
         *    - automatic: the attributes reported by the node
         */
        NodeRecord (const std::string & name, const nlohmann::json & automatic = nlohmann::json::object ());

        /**
         * Create a node record from its json representation
         * @throws: ConfigError if the document is not a node record
         */
        static NodeRecord fromJson (const nlohmann::json & js);

        /**
         * @returns: the json representation of the node
         */
        nlohmann::json toJson () const;

        /*!
         * ====================================================================================================
         * ====================================================================================================
         * ====================================          GET/SET          =====================================
         * ====================================================================================================
         * ====================================================================================================
         */

        const std::string & getName () const;

        const std::string & getEnvironment () const;

        void setEnvironment (const std::string & env);

        const std::vector <std::string> & getRunList () const;

        void setRunList (const std::vector <std::string> & runList);

        const nlohmann::json & getAutomatic () const;

        void setAutomatic (const nlohmann::json & attrs);

        const nlohmann::json & getNormal () const;

        void setNormal (const nlohmann::json & attrs);

        /**
         * Set a normal attribute at a dotted path, creating the intermediate objects
         * @example: setAttribute ("deep.nested.item", true)
         */
        void setAttribute (const std::string & path, const nlohmann::json & value);

        /**
         * @returns: the automatic attribute at a dotted path if it is a non empty string, "" otherwise
         */
        std::string getAutomaticStr (const std::string & path) const;

        /*!
         * ====================================================================================================
         * ====================================================================================================
         * =====================================          CLOUD          ======================================
         * ====================================================================================================
         * ====================================================================================================
         */

        /**
         * @returns: true if the node reported a cloud attribute
         */
        bool isCloud () const;

        /**
         * @returns: the cloud provider of the node, "" if not a cloud node
         */
        std::string getCloudProvider () const;

        /**
         * @returns: the public hostname if the node is a cloud node, the fqdn otherwise
         */
        std::string getPublicHostname () const;

        /**
         * @returns: the public ipv4 if the node is a cloud node, the ipaddress otherwise
         */
        std::string getPublicIpv4 () const;

    };

}
