#include <gtest/gtest.h>
#include <fleetcmd/connector/runner.hh>
#include <fleetcmd/bootstrap/agent.hh>
#include "fake_transport.hh"

using namespace fleetcmd;
using namespace fleetcmd::connector;
using namespace fleetcmd::test;

static utils::SshOptions credentials (float timeout = 5.0) {
  utils::SshOptions ssh;
  ssh.user = "deploy";
  ssh.password = "pwd";
  ssh.timeout = timeout;
  return ssh;
}

TEST(CommandRunner, Completeness) {
  auto net = std::make_shared <FakeNetwork> ();
  HostScript refused;
  refused.refuse = true;
  net-> script ("10.0.2.2", refused);

  HostScript failing;
  failing.exitStatus ["false"] = 3;
  net-> script ("10.0.2.3", failing);

  HostScript output;
  output.out = "web\n";
  net-> script ("10.0.2.1", output);

  std::vector <node::NodeTarget> targets = {
    node::NodeTarget::fromAddress ("10.0.2.1", credentials ()),
    node::NodeTarget::fromAddress ("10.0.2.2", credentials ()),
    node::NodeTarget::fromAddress ("10.0.2.3", credentials ()),
    node::NodeTarget::fromRecord (node::NodeRecord ("ghost"), credentials ())
  };

  CommandRunner runner (std::make_shared <FakeTransportFactory> (net));
  auto result = runner.run (targets, "hostname || false");

  EXPECT_EQ(result.successes ().size () + result.failures ().size (), targets.size ());
  EXPECT_FALSE(result.ok ());

  CommandResult r;
  ASSERT_TRUE(result.findSuccess ("10.0.2.1", r));
  EXPECT_EQ(r.out, "web\n");

  HostFailure f;
  ASSERT_TRUE(result.findFailure ("10.0.2.2", f));
  EXPECT_EQ(f.kind, ErrorKind::CONNECT_ERROR);

  ASSERT_TRUE(result.findFailure ("10.0.2.3", f));
  EXPECT_EQ(f.kind, ErrorKind::REMOTE_EXECUTION_FAILURE);
  EXPECT_EQ(f.result.exitStatus, 3);

  ASSERT_TRUE(result.findFailure ("ghost", f));
  EXPECT_EQ(f.kind, ErrorKind::TARGET_UNREACHABLE);

  EXPECT_EQ(net-> active (), 0);
}

// A slow host times out alone, its sibling is still a success
TEST(CommandRunner, TimeoutIsolation) {
  auto net = std::make_shared <FakeNetwork> ();
  HostScript slow;
  slow.execDelay = 2.0;
  net-> script ("10.0.3.1", slow);

  std::vector <node::NodeTarget> targets = {
    node::NodeTarget::fromAddress ("10.0.3.1", credentials (0.5)),
    node::NodeTarget::fromAddress ("10.0.3.2", credentials (0.5))
  };

  CommandRunner runner (std::make_shared <FakeTransportFactory> (net));
  auto result = runner.run (targets, "uptime");

  HostFailure f;
  ASSERT_TRUE(result.findFailure ("10.0.3.1", f));
  EXPECT_EQ(f.kind, ErrorKind::TIMEOUT);

  CommandResult r;
  EXPECT_TRUE(result.findSuccess ("10.0.3.2", r));
  EXPECT_EQ(net-> active (), 0);
}

TEST(CommandRunner, NoBlock) {
  auto net = std::make_shared <FakeNetwork> ();
  CommandRunner runner (std::make_shared <FakeTransportFactory> (net));

  std::vector <node::NodeTarget> targets = {node::NodeTarget::fromAddress ("10.0.4.1", credentials ())};
  EXPECT_THROW(runner.run (targets, SessionBlock ()), ContractError);
  EXPECT_THROW(runner.run ({}, SessionBlock ()), ContractError);
  EXPECT_EQ(net-> connects (), 0);
}

TEST(CommandRunner, MissingCredentials) {
  auto net = std::make_shared <FakeNetwork> ();
  CommandRunner runner (std::make_shared <FakeTransportFactory> (net));

  utils::SshOptions noUser;
  noUser.password = "pwd";

  utils::SshOptions noSecret;
  noSecret.user = "deploy";

  EXPECT_THROW(runner.run ({node::NodeTarget::fromAddress ("10.0.5.1", noUser)}, "ls"), ContractError);
  EXPECT_THROW(runner.run ({node::NodeTarget::fromAddress ("10.0.5.1", noSecret)}, "ls"), ContractError);
  EXPECT_EQ(net-> connects (), 0);

  utils::RunnerOptions zero;
  zero.maxConcurrency = 0;
  EXPECT_THROW(CommandRunner (std::make_shared <FakeTransportFactory> (net), zero), ContractError);
}

TEST(CommandRunner, NoTarget) {
  auto net = std::make_shared <FakeNetwork> ();
  CommandRunner runner (std::make_shared <FakeTransportFactory> (net));

  auto result = runner.run ({}, "ls");
  EXPECT_EQ(result.size (), 0);
  EXPECT_TRUE(result.ok ());
}

TEST(CommandRunner, Duplicates) {
  auto net = std::make_shared <FakeNetwork> ();
  CommandRunner runner (std::make_shared <FakeTransportFactory> (net));

  auto result = runner.run ({
      node::NodeTarget::fromAddress ("10.0.6.1", credentials ()),
      node::NodeTarget::fromRecord (node::NodeRecord ("web", {{"ipaddress", "10.0.6.1"}}), credentials ())
    }, "ls");

  EXPECT_EQ(result.size (), 1);
  EXPECT_EQ(net-> connects (), 1);
}

// The block issues several commands on the same connection
TEST(CommandRunner, InteractiveSession) {
  auto net = std::make_shared <FakeNetwork> ();
  CommandRunner runner (std::make_shared <FakeTransportFactory> (net));

  std::vector <node::NodeTarget> targets = {
    node::NodeTarget::fromAddress ("10.0.7.1", credentials ()),
    node::NodeTarget::fromAddress ("10.0.7.2", credentials ())
  };

  auto result = runner.run (targets, [] (Session & s) {
    s.run ("apt-get update");
    return s.run ("apt-get install -y nginx");
  });

  EXPECT_TRUE(result.ok ());
  EXPECT_EQ(result.successes ().size (), 2);
  EXPECT_EQ(net-> connects (), 2);
  EXPECT_EQ(net-> commands ("10.0.7.1").size (), 2);
}

TEST(CommandRunner, BlockThrows) {
  auto net = std::make_shared <FakeNetwork> ();
  CommandRunner runner (std::make_shared <FakeTransportFactory> (net));

  auto result = runner.run ({node::NodeTarget::fromAddress ("10.0.8.1", credentials ())}, [] (Session &) -> CommandResult {
    throw std::runtime_error ("unexpected output");
  });

  HostFailure f;
  ASSERT_TRUE(result.findFailure ("10.0.8.1", f));
  EXPECT_EQ(f.kind, ErrorKind::REMOTE_EXECUTION_FAILURE);
  EXPECT_EQ(f.reason, "unexpected output");
  EXPECT_EQ(net-> active (), 0);
}

// A block throwing something else than an exception is still recorded for its host
TEST(CommandRunner, BlockThrowsNonException) {
  auto net = std::make_shared <FakeNetwork> ();
  auto log = std::make_shared <RecordingLogger> ();
  CommandRunner runner (std::make_shared <FakeTransportFactory> (net), utils::RunnerOptions (), log);

  std::vector <node::NodeTarget> targets = {
    node::NodeTarget::fromAddress ("10.0.8.2", credentials ()),
    node::NodeTarget::fromAddress ("10.0.8.3", credentials ())
  };

  auto result = runner.run (targets, [] (Session & s) -> CommandResult {
    if (s.getTarget ().getId () == "10.0.8.2") throw 42;
    return s.run ("true");
  });

  EXPECT_EQ(result.size (), 2);

  HostFailure f;
  ASSERT_TRUE(result.findFailure ("10.0.8.2", f));
  EXPECT_EQ(f.kind, ErrorKind::REMOTE_EXECUTION_FAILURE);
  EXPECT_EQ(f.reason, "unknown error");

  CommandResult r;
  EXPECT_TRUE(result.findSuccess ("10.0.8.3", r));
  EXPECT_EQ(net-> active (), 0);

  bool logged = false;
  for (auto & msg : log-> messages ()) {
    if (msg.find ("[10.0.8.2]") != std::string::npos && msg.find ("unknown error") != std::string::npos) logged = true;
  }

  EXPECT_TRUE(logged);
}

TEST(Agent, ChefClientAndSolo) {
  auto net = std::make_shared <FakeNetwork> ();
  CommandRunner runner (std::make_shared <FakeTransportFactory> (net));
  bootstrap::Agent agent (runner);

  std::vector <node::NodeTarget> targets = {node::NodeTarget::fromAddress ("10.0.9.1", credentials ())};
  EXPECT_TRUE(agent.chefClient (targets).ok ());
  EXPECT_TRUE(agent.chefSolo (targets).ok ());

  auto cmds = net-> commands ("10.0.9.1");
  ASSERT_EQ(cmds.size (), 2);
  EXPECT_NE(cmds [0].find ("chef-client"), std::string::npos);
  EXPECT_NE(cmds [1].find ("chef-solo"), std::string::npos);
}
