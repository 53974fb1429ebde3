#include "record.hh"
#include <fleetcmd/errors.hh>

namespace fleetcmd::node {

    static std::vector <std::string> splitPath (const std::string & path) {
        std::vector <std::string> result;
        std::string::size_type start = 0;
        for (;;) {
            auto index = path.find ('.', start);
            if (index == std::string::npos) {
                result.push_back (path.substr (start));
                return result;
            }

            result.push_back (path.substr (start, index - start));
            start = index + 1;
        }
    }

    NodeRecord::NodeRecord (const std::string & name, const nlohmann::json & automatic)
        : _name (name)
        , _environment ("_default")
        , _automatic (automatic)
        , _normal (nlohmann::json::object ())
    {}

    NodeRecord NodeRecord::fromJson (const nlohmann::json & js) {
        if (!js.is_object () || !js.contains ("name") || !js ["name"].is_string ()) {
            throw ConfigError ("Node record requires a 'name'");
        }

        try {
            NodeRecord rec (js ["name"].get <std::string> (), js.value ("automatic", nlohmann::json::object ()));
            rec._environment = js.value ("chef_environment", std::string ("_default"));
            rec._normal = js.value ("normal", nlohmann::json::object ());
            if (js.contains ("run_list")) {
                rec._runList = js ["run_list"].get <std::vector <std::string> > ();
            }

            return rec;
        } catch (const nlohmann::json::exception & err) {
            throw ConfigError (std::string ("Malformed node record : ") + err.what ());
        }
    }

    nlohmann::json NodeRecord::toJson () const {
        nlohmann::json js;
        js ["name"] = this-> _name;
        js ["chef_environment"] = this-> _environment;
        js ["run_list"] = this-> _runList;
        js ["automatic"] = this-> _automatic;
        js ["normal"] = this-> _normal;

        return js;
    }

    /*!
     * ====================================================================================================
     * ====================================================================================================
     * ====================================          GET/SET          =====================================
     * ====================================================================================================
     * ====================================================================================================
     */

    const std::string & NodeRecord::getName () const {
        return this-> _name;
    }

    const std::string & NodeRecord::getEnvironment () const {
        return this-> _environment;
    }

    void NodeRecord::setEnvironment (const std::string & env) {
        this-> _environment = env;
    }

    const std::vector <std::string> & NodeRecord::getRunList () const {
        return this-> _runList;
    }

    void NodeRecord::setRunList (const std::vector <std::string> & runList) {
        this-> _runList = runList;
    }

    const nlohmann::json & NodeRecord::getAutomatic () const {
        return this-> _automatic;
    }

    void NodeRecord::setAutomatic (const nlohmann::json & attrs) {
        this-> _automatic = attrs;
    }

    const nlohmann::json & NodeRecord::getNormal () const {
        return this-> _normal;
    }

    void NodeRecord::setNormal (const nlohmann::json & attrs) {
        this-> _normal = attrs;
    }

    void NodeRecord::setAttribute (const std::string & path, const nlohmann::json & value) {
        auto keys = splitPath (path);
        nlohmann::json * current = &this-> _normal;
        for (size_t i = 0 ; i + 1 < keys.size () ; i++) {
            auto & next = (*current) [keys [i]];
            if (!next.is_object ()) {
                next = nlohmann::json::object ();
            }

            current = &next;
        }

        (*current) [keys.back ()] = value;
    }

    std::string NodeRecord::getAutomaticStr (const std::string & path) const {
        const nlohmann::json * current = &this-> _automatic;
        for (auto & key : splitPath (path)) {
            if (!current-> is_object ()) return "";

            auto it = current-> find (key);
            if (it == current-> end ()) return "";
            current = &(*it);
        }

        if (current-> is_string ()) {
            return current-> get <std::string> ();
        }

        return "";
    }

    /*!
     * ====================================================================================================
     * ====================================================================================================
     * =====================================          CLOUD          ======================================
     * ====================================================================================================
     * ====================================================================================================
     */

    bool NodeRecord::isCloud () const {
        return this-> _automatic.is_object () && this-> _automatic.contains ("cloud");
    }

    std::string NodeRecord::getCloudProvider () const {
        if (!this-> isCloud ()) return "";
        return this-> getAutomaticStr ("cloud.provider");
    }

    std::string NodeRecord::getPublicHostname () const {
        if (this-> isCloud ()) return this-> getAutomaticStr ("cloud.public_hostname");
        return this-> getAutomaticStr ("fqdn");
    }

    std::string NodeRecord::getPublicIpv4 () const {
        if (this-> isCloud ()) return this-> getAutomaticStr ("cloud.public_ipv4");
        return this-> getAutomaticStr ("ipaddress");
    }

}
