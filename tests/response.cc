#include <gtest/gtest.h>
#include <rd_utils/_.hh>
#include <fleetcmd/connector/response.hh>

using namespace fleetcmd;
using namespace fleetcmd::connector;
using namespace rd_utils;

static CommandResult success (const std::string & host) {
  CommandResult r;
  r.host = host;
  r.out = "done";
  return r;
}

TEST(ResponseSet, Partitions) {
  ResponseSet set;
  EXPECT_TRUE(set.ok ());
  EXPECT_EQ(set.size (), 0);

  EXPECT_TRUE(set.addSuccess (success ("a")));
  EXPECT_TRUE(set.ok ());

  EXPECT_TRUE(set.addFailure (HostFailure::from ("b", HostError (ErrorKind::TIMEOUT, "too slow"))));
  EXPECT_FALSE(set.ok ());
  EXPECT_EQ(set.size (), 2);

  HostFailure f;
  ASSERT_TRUE(set.findFailure ("b", f));
  EXPECT_EQ(f.kind, ErrorKind::TIMEOUT);
  EXPECT_EQ(f.reason, "too slow");

  CommandResult r;
  ASSERT_TRUE(set.findSuccess ("a", r));
  EXPECT_EQ(r.out, "done");
  EXPECT_FALSE(set.findSuccess ("b", r));
}

// A host is never recorded twice, whatever the partition
TEST(ResponseSet, RecordedOnce) {
  ResponseSet set;
  EXPECT_TRUE(set.addSuccess (success ("a")));
  EXPECT_FALSE(set.addSuccess (success ("a")));
  EXPECT_FALSE(set.addFailure (HostFailure::from ("a", HostError (ErrorKind::CONNECT_ERROR, "refused"))));

  EXPECT_EQ(set.successes ().size (), 1);
  EXPECT_EQ(set.failures ().size (), 0);
  EXPECT_TRUE(set.ok ());
}

TEST(ResponseSet, StepFailure) {
  auto err = HostError::step ("key_transfer", HostError (ErrorKind::REMOTE_EXECUTION_FAILURE, "permission denied"));
  auto f = HostFailure::from ("h", err);

  EXPECT_EQ(f.kind, ErrorKind::STEP_FAILURE);
  EXPECT_EQ(f.cause, ErrorKind::REMOTE_EXECUTION_FAILURE);
  EXPECT_EQ(f.step, "key_transfer");
  EXPECT_EQ(toString (f.kind), "StepFailure");
}

class Writers {
public:

  ResponseSet set;

  void write (concurrency::Thread, int32_t id) {
    for (int32_t i = 0 ; i < 100 ; i++) {
      auto host = "h" + std::to_string (i);
      if (id % 2 == 0) this-> set.addSuccess (success (host));
      else this-> set.addFailure (HostFailure::from (host, HostError (ErrorKind::CONNECT_ERROR, "refused")));
    }
  }

};

// Concurrent writers on the same hosts, each host lands in exactly one partition
TEST(ResponseSet, ConcurrentWriters) {
  Writers w;
  std::vector <concurrency::Thread> threads;
  for (int32_t i = 0 ; i < 8 ; i++) {
    threads.push_back (concurrency::spawn (&w, &Writers::write, i));
  }

  for (auto & it : threads) {
    concurrency::join (it);
  }

  EXPECT_EQ(w.set.size (), 100);
  EXPECT_EQ(w.set.successes ().size () + w.set.failures ().size (), 100);

  for (auto & it : w.set.successes ()) {
    HostFailure f;
    EXPECT_FALSE(w.set.findFailure (it.host, f));
  }

  ResponseSet copy = w.set;
  EXPECT_EQ(copy.size (), 100);
}
