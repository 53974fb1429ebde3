#include <gtest/gtest.h>
#include <rd_utils/_.hh>
#include <fleetcmd/connector/deadline.hh>
#include <fleetcmd/connector/ssh.hh>
#include "fake_transport.hh"

using namespace fleetcmd;
using namespace fleetcmd::connector;
using namespace fleetcmd::test;

TEST(Deadline, Split) {
  long sec = 0, usec = 0;
  Deadline::split (2.5, sec, usec);
  EXPECT_EQ(sec, 2);
  EXPECT_NEAR(usec, 500000, 1);

  Deadline::split (0.0, sec, usec);
  EXPECT_EQ(sec, 0);
  EXPECT_EQ(usec, 1000);

  Deadline::split (-3.0, sec, usec);
  EXPECT_EQ(sec, 0);
  EXPECT_EQ(usec, 1000);
}

TEST(Deadline, Expiry) {
  Deadline deadline (0.1);
  EXPECT_FALSE(deadline.expired ());
  EXPECT_LE(deadline.remaining ("h"), 0.1);

  rd_utils::concurrency::timer::sleep (0.15);
  EXPECT_TRUE(deadline.expired ());

  try {
    deadline.remaining ("h");
    FAIL () << "remaining should have thrown";
  } catch (const HostError & err) {
    EXPECT_EQ(err.getKind (), ErrorKind::TIMEOUT);
  }

  deadline.restart ();
  EXPECT_FALSE(deadline.expired ());
}

// An exhausted budget fails as a timeout before any network call
TEST(SshTransport, ExhaustedBudget) {
  utils::SshOptions ssh;
  ssh.user = "deploy";
  ssh.password = "pwd";

  auto log = std::make_shared <RecordingLogger> ();
  SshTransport transport (log);
  try {
    transport.connect (node::NodeTarget::fromAddress ("127.0.0.1", ssh), 0.0);
    FAIL () << "connect should have timed out";
  } catch (const HostError & err) {
    EXPECT_EQ(err.getKind (), ErrorKind::TIMEOUT);
  }

  EXPECT_TRUE(log-> messages ().empty ());
}

TEST(SshTransport, ExecWithoutSession) {
  SshTransport transport;
  try {
    transport.exec ("ls", "", 1.0);
    FAIL () << "exec should have failed";
  } catch (const HostError & err) {
    EXPECT_EQ(err.getKind (), ErrorKind::CONNECT_ERROR);
  }

  transport.disconnect ();
}
