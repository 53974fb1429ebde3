#define __PROJECT__ "BOOTSTRAP"

#include "context.hh"
#include <rd_utils/_.hh>
#include <fleetcmd/errors.hh>
#include <sstream>

using namespace rd_utils;

namespace fleetcmd::bootstrap {

    const std::string CONFIG_DIR = "/etc/chef";
    const std::string CLIENT_CONFIG_PATH = CONFIG_DIR + "/client.rb";
    const std::string FIRST_BOOT_PATH = CONFIG_DIR + "/first-boot.json";
    const std::string VALIDATION_KEY_PATH = CONFIG_DIR + "/validation.pem";
    const std::string SECRET_PATH = CONFIG_DIR + "/encrypted_data_bag_secret";
    const std::string HINTS_DIR = CONFIG_DIR + "/ohai/hints";

    static const std::string INSTALL_SCRIPT_URL = "https://omnitruck.chef.io/install.sh";

    static std::string readRequired (const std::string & what, const std::string & path) {
        if (!rd_utils::utils::file_exists (path)) {
            LOG_ERROR ("Missing ", what, " file : ", path);
            throw ConfigError ("Missing " + what + " file : " + path);
        }

        return rd_utils::utils::read_file (path);
    }

    BootstrapContext::BootstrapContext (const utils::BootstrapOptions & opts, const std::string & validatorKey, const std::string & secret, const nlohmann::json & attributes)
        : _opts (opts)
        , _validatorKey (validatorKey)
        , _secret (secret)
        , _attributes (attributes)
    {
        if (!this-> _attributes.is_object ()) {
            throw ConfigError ("first boot attributes must be a json object");
        }
    }

    BootstrapContext BootstrapContext::fromFiles (const utils::BootstrapOptions & opts) {
        std::string key, secret;
        nlohmann::json attrs = nlohmann::json::object ();

        if (opts.validatorPath != "") key = readRequired ("validator key", opts.validatorPath);
        if (opts.secretPath != "") secret = readRequired ("data bag secret", opts.secretPath);
        if (opts.attributesPath != "") {
            auto content = readRequired ("first boot attributes", opts.attributesPath);
            try {
                attrs = nlohmann::json::parse (content);
            } catch (const nlohmann::json::exception & err) {
                LOG_ERROR ("Malformed first boot attributes : ", opts.attributesPath, " ", err.what ());
                throw ConfigError ("Malformed first boot attributes : " + opts.attributesPath);
            }
        }

        return BootstrapContext (opts, key, secret, attrs);
    }

    /*!
     * ====================================================================================================
     * ====================================================================================================
     * ===================================          RENDERING          ====================================
     * ====================================================================================================
     * ====================================================================================================
     */

    std::string BootstrapContext::renderClientConfig (const std::string & nodeName) const {
        std::stringstream ss;
        ss << "log_level :info" << std::endl;
        ss << "log_location STDOUT" << std::endl;
        ss << "chef_server_url \"" << this-> _opts.serverUrl << "\"" << std::endl;
        ss << "validation_client_name \"" << this-> _opts.validatorClient << "\"" << std::endl;
        ss << "node_name \"" << nodeName << "\"" << std::endl;

        if (this-> hasValidatorKey ()) {
            ss << "validation_key \"" << VALIDATION_KEY_PATH << "\"" << std::endl;
        }

        if (this-> hasSecret ()) {
            ss << "encrypted_data_bag_secret \"" << SECRET_PATH << "\"" << std::endl;
        }

        return ss.str ();
    }

    std::string BootstrapContext::renderFirstBoot () const {
        auto js = this-> _attributes;
        js ["run_list"] = this-> _opts.runList;

        return js.dump ();
    }

    std::string BootstrapContext::renderAgentRun () const {
        std::string install = "curl -L " + INSTALL_SCRIPT_URL + " | bash";
        if (this-> _opts.agentVersion != "") {
            install += " -s -- -v " + connector::shellQuote (this-> _opts.agentVersion);
        }

        return "if ! command -v chef-client > /dev/null 2>&1; then " + install + "; fi && "
            "chef-client -j " + FIRST_BOOT_PATH + " -E " + connector::shellQuote (this-> _opts.environment);
    }

    /*!
     * ====================================================================================================
     * ====================================================================================================
     * =====================================          STEPS          ======================================
     * ====================================================================================================
     * ====================================================================================================
     */

    std::vector <BootstrapStep> BootstrapContext::getSteps () const {
        return {
            {"config_transfer", [this] (connector::Session & s) { this-> configTransfer (s); }},
            {"key_transfer", [this] (connector::Session & s) { this-> keyTransfer (s); }},
            {"secret_transfer", [this] (connector::Session & s) { this-> secretTransfer (s); }},
            {"agent_run", [this] (connector::Session & s) { this-> agentRun (s); }}
        };
    }

    void BootstrapContext::configTransfer (connector::Session & s) const {
        s.upload (this-> renderClientConfig (s.getTarget ().getName ()), CLIENT_CONFIG_PATH, 0644);
        s.upload (this-> renderFirstBoot (), FIRST_BOOT_PATH, 0644);

        for (auto & it : this-> _opts.hints) {
            s.upload ("{}", HINTS_DIR + "/" + it + ".json", 0644);
        }
    }

    void BootstrapContext::keyTransfer (connector::Session & s) const {
        if (!this-> hasValidatorKey ()) return;
        s.upload (this-> _validatorKey, VALIDATION_KEY_PATH, 0600);
    }

    void BootstrapContext::secretTransfer (connector::Session & s) const {
        if (!this-> hasSecret ()) return;
        s.upload (this-> _secret, SECRET_PATH, 0600);
    }

    void BootstrapContext::agentRun (connector::Session & s) const {
        auto res = s.run (this-> renderAgentRun ());
        if (res.exitStatus != 0) {
            throw HostError (ErrorKind::REMOTE_EXECUTION_FAILURE, "agent exited with status " + std::to_string (res.exitStatus) + " : " + res.err);
        }
    }

    /*!
     * ====================================================================================================
     * ====================================================================================================
     * ====================================          GET/SET          =====================================
     * ====================================================================================================
     * ====================================================================================================
     */

    bool BootstrapContext::hasValidatorKey () const {
        return this-> _validatorKey != "";
    }

    bool BootstrapContext::hasSecret () const {
        return this-> _secret != "";
    }

    const utils::BootstrapOptions & BootstrapContext::getOptions () const {
        return this-> _opts;
    }

}
