#pragma once

#include <rd_utils/_.hh>

#include <fleetcmd/errors.hh>
#include <fleetcmd/utils/logger.hh>
#include <fleetcmd/utils/options.hh>
#include <fleetcmd/node/record.hh>
#include <fleetcmd/node/resolver.hh>
#include <fleetcmd/node/target.hh>
#include <fleetcmd/node/directory.hh>
#include <fleetcmd/connector/response.hh>
#include <fleetcmd/connector/transport.hh>
#include <fleetcmd/connector/ssh.hh>
#include <fleetcmd/connector/connection.hh>
#include <fleetcmd/connector/pool.hh>
#include <fleetcmd/connector/runner.hh>
#include <fleetcmd/bootstrap/context.hh>
#include <fleetcmd/bootstrap/sequencer.hh>
#include <fleetcmd/bootstrap/agent.hh>
#include <fleetcmd/front/command.hh>
