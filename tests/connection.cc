#include <gtest/gtest.h>
#include <fleetcmd/connector/connection.hh>
#include "fake_transport.hh"

using namespace fleetcmd;
using namespace fleetcmd::connector;
using namespace fleetcmd::test;

static node::NodeTarget target (const std::string & addr, bool keys = false, float timeout = 5.0) {
  utils::SshOptions ssh;
  ssh.user = "deploy";
  ssh.timeout = timeout;
  if (keys) ssh.keys.push_back ("~/.ssh/id_rsa");
  else ssh.password = "hunter2";

  return node::NodeTarget::fromAddress (addr, ssh);
}

// The password is given to sudo on stdin, never logged
TEST(Connection, SudoWithPassword) {
  auto net = std::make_shared <FakeNetwork> ();
  auto log = std::make_shared <RecordingLogger> ();
  {
    Connection conn (target ("10.0.0.1"), std::make_shared <FakeTransport> (net), log);
    conn.open ();

    auto r = conn.execute ("ls /root");
    EXPECT_EQ(r.host, "10.0.0.1");
    EXPECT_EQ(r.exitStatus, 0);
  }

  auto cmds = net-> commands ("10.0.0.1");
  ASSERT_EQ(cmds.size (), 1);
  EXPECT_EQ(cmds [0], SUDO_VALIDATE + " && sudo -n sh -c 'ls /root'");
  EXPECT_EQ(net-> inputs ("10.0.0.1")[0], "hunter2\n");
  EXPECT_EQ(net-> received ("10.0.0.1")[0], "");

  bool running = false;
  for (auto & msg : log-> messages ()) {
    EXPECT_EQ(msg.find ("hunter2"), std::string::npos);
    if (msg.find ("ls /root") != std::string::npos) running = true;
  }

  EXPECT_TRUE(running);
  EXPECT_EQ(net-> active (), 0);
}

TEST(Connection, SudoWithKeys) {
  auto net = std::make_shared <FakeNetwork> ();
  Connection conn (target ("10.0.0.2", true), std::make_shared <FakeTransport> (net));
  conn.open ();
  conn.execute ("echo 'hi'");

  auto cmds = net-> commands ("10.0.0.2");
  ASSERT_EQ(cmds.size (), 1);
  EXPECT_EQ(cmds [0], "sudo -n sh -c 'echo '\\''hi'\\'''");
  EXPECT_EQ(net-> inputs ("10.0.0.2")[0], "");
}

TEST(Connection, NoSudo) {
  auto net = std::make_shared <FakeNetwork> ();
  auto t = target ("10.0.0.3");
  auto ssh = t.getSshOptions ();
  ssh.sudo = false;

  Connection conn (node::NodeTarget::fromAddress ("10.0.0.3", ssh), std::make_shared <FakeTransport> (net));
  conn.open ();
  conn.execute ("uptime");

  EXPECT_EQ(net-> commands ("10.0.0.3")[0], "uptime");
}

// An unresolved target is never handed to the transport
TEST(Connection, Unreachable) {
  auto net = std::make_shared <FakeNetwork> ();
  utils::SshOptions ssh;
  ssh.user = "deploy";
  ssh.password = "pwd";

  Connection conn (node::NodeTarget::fromRecord (node::NodeRecord ("ghost"), ssh), std::make_shared <FakeTransport> (net));
  try {
    conn.open ();
    FAIL () << "open should have failed";
  } catch (const HostError & err) {
    EXPECT_EQ(err.getKind (), ErrorKind::TARGET_UNREACHABLE);
  }

  EXPECT_EQ(net-> connects (), 0);
  EXPECT_FALSE(conn.isOpened ());
}

TEST(Connection, Refused) {
  auto net = std::make_shared <FakeNetwork> ();
  HostScript s;
  s.refuse = true;
  net-> script ("10.0.0.4", s);

  Connection conn (target ("10.0.0.4"), std::make_shared <FakeTransport> (net));
  try {
    conn.open ();
    FAIL () << "open should have failed";
  } catch (const HostError & err) {
    EXPECT_EQ(err.getKind (), ErrorKind::CONNECT_ERROR);
  }

  EXPECT_EQ(net-> active (), 0);
  EXPECT_THROW(conn.execute ("ls"), HostError);
}

// The timeout covers the handshake and the commands
TEST(Connection, Timeout) {
  auto net = std::make_shared <FakeNetwork> ();
  HostScript s;
  s.connectDelay = 0.2;
  s.execDelay = 0.2;
  net-> script ("10.0.0.5", s);

  Connection conn (target ("10.0.0.5", false, 0.3), std::make_shared <FakeTransport> (net));
  conn.open ();

  try {
    conn.execute ("sleep 1");
    FAIL () << "execute should have timed out";
  } catch (const HostError & err) {
    EXPECT_EQ(err.getKind (), ErrorKind::TIMEOUT);
  }

  EXPECT_FALSE(conn.isOpened ());
  EXPECT_EQ(net-> active (), 0);
}

TEST(Connection, Upload) {
  auto net = std::make_shared <FakeNetwork> ();
  Connection conn (target ("10.0.0.6", true), std::make_shared <FakeTransport> (net));
  conn.open ();
  conn.upload ("KEY", "/etc/chef/validation.pem", 0600);

  auto cmds = net-> commands ("10.0.0.6");
  ASSERT_EQ(cmds.size (), 1);
  EXPECT_NE(cmds [0].find ("mkdir -p '\\''/etc/chef'\\''"), std::string::npos);
  EXPECT_NE(cmds [0].find ("chmod 600"), std::string::npos);
  EXPECT_EQ(net-> inputs ("10.0.0.6")[0], "KEY");
}

// The password line is consumed by the sudo wrapper, the file only receives the payload
TEST(Connection, UploadWithPassword) {
  auto net = std::make_shared <FakeNetwork> ();
  Connection conn (target ("10.0.0.8"), std::make_shared <FakeTransport> (net));
  conn.open ();
  conn.upload ("KEY\nLINE", "/etc/chef/validation.pem", 0600);

  auto cmds = net-> commands ("10.0.0.8");
  ASSERT_EQ(cmds.size (), 1);
  EXPECT_EQ(cmds [0].rfind (SUDO_VALIDATE, 0), 0);
  EXPECT_NE(cmds [0].find ("&& sudo -n sh -c 'mkdir -p"), std::string::npos);
  EXPECT_EQ(cmds [0].find ("sudo -S -p '' sh -c"), std::string::npos);
  EXPECT_EQ(cmds [0].find ("hunter2"), std::string::npos);

  EXPECT_EQ(net-> inputs ("10.0.0.8")[0], "hunter2\nKEY\nLINE");
  EXPECT_EQ(net-> received ("10.0.0.8")[0], "KEY\nLINE");
}

TEST(Connection, UploadFailure) {
  auto net = std::make_shared <FakeNetwork> ();
  HostScript s;
  s.exitStatus ["validation.pem"] = 1;
  net-> script ("10.0.0.7", s);

  Connection conn (target ("10.0.0.7", true), std::make_shared <FakeTransport> (net));
  conn.open ();

  try {
    conn.upload ("KEY", "/etc/chef/validation.pem", 0600);
    FAIL () << "upload should have failed";
  } catch (const HostError & err) {
    EXPECT_EQ(err.getKind (), ErrorKind::REMOTE_EXECUTION_FAILURE);
  }
}

TEST(Connection, ShellQuote) {
  EXPECT_EQ(shellQuote ("abc"), "'abc'");
  EXPECT_EQ(shellQuote ("it's"), "'it'\\''s'");
}
