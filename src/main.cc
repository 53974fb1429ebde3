#define __PROJECT__ "FLEETCMD"

#include <fleetcmd/_.hh>

using namespace fleetcmd;

int main (int argc, char ** argv) {
    front::Command cmd;
    try {
        cmd.configure (argc, argv);
        return cmd.execute ();
    } catch (const ConfigError & err) {
        LOG_ERROR ("Configuration error : ", err.what ());
    } catch (const ContractError & err) {
        LOG_ERROR ("Invalid usage : ", err.what ());
    } catch (const std::runtime_error & err) {
        LOG_ERROR ("Failure : ", err.what ());
    }

    return 2;
}
