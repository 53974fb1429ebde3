#include "transport.hh"

namespace fleetcmd::connector {

    Transport::~Transport () {}

    TransportFactory::~TransportFactory () {}

}
