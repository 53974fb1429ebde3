#define __PROJECT__ "DIRECTORY"

#include "directory.hh"
#include <fleetcmd/errors.hh>
#include <rd_utils/_.hh>

using namespace rd_utils::utils;

namespace fleetcmd::node {

    NodeDirectory::~NodeDirectory () {}

    FileDirectory::FileDirectory (const std::string & path)
        : _path (path)
    {}

    std::vector <NodeRecord> FileDirectory::all () {
        this-> load ();

        std::vector <NodeRecord> result;
        for (auto & it : this-> _records) {
            result.push_back (it.second);
        }

        return result;
    }

    NodeRecord FileDirectory::find (const std::string & name) {
        this-> load ();

        auto it = this-> _records.find (name);
        if (it == this-> _records.end ()) {
            throw ConfigError ("No node named : " + name);
        }

        return it-> second;
    }

    void FileDirectory::load () {
        if (this-> _loaded) return;

        for (auto it : directory_iterator (this-> _path)) {
            std::string path = it;
            auto filename = get_filename (path);
            if (filename.size () < 5 || filename.substr (filename.size () - 5) != ".json") continue;

            try {
                auto rec = NodeRecord::fromJson (nlohmann::json::parse (read_file (path)));
                this-> _records.emplace (rec.getName (), rec);
            } catch (const nlohmann::json::exception & err) {
                LOG_ERROR ("Malformed node file : ", path, " ", err.what ());
                throw ConfigError ("Malformed node file : " + path);
            }
        }

        LOG_DEBUG ("Loaded ", this-> _records.size (), " nodes from ", this-> _path);
        this-> _loaded = true;
    }

}
