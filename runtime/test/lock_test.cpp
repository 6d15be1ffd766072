// This file tests plenum::mutex and plenum::scoped_lock

#include <gtest/gtest.h>
#include <plenum/lock.hpp>
#include <plenum/Logger.hpp>
#include <atomic>
#include <thread>
#include <vector>


class LockTest : public ::testing::Test {
 public:
  void SetUp() override {
    // Make it so we only get warnings
    plenum::set_log_level(LOG_WARN);
  }
  void TearDown() override {}

  plenum::mutex lock;
};



TEST_F(LockTest, HeldOnlyByOwner) {
  ASSERT_FALSE(lock.is_locked());
  {
    plenum::scoped_lock lk(lock);
    ASSERT_TRUE(lock.is_locked());

    bool seen_elsewhere = true;
    std::thread t([&] { seen_elsewhere = lock.is_locked(); });
    t.join();
    ASSERT_FALSE(seen_elsewhere);
  }
  ASSERT_FALSE(lock.is_locked());
}


TEST_F(LockTest, TryLock) {
  ASSERT_TRUE(lock.try_lock());
  ASSERT_TRUE(lock.is_locked());

  bool taken = true;
  std::thread t([&] { taken = lock.try_lock(); });
  t.join();
  ASSERT_FALSE(taken);

  lock.unlock();
  ASSERT_FALSE(lock.is_locked());
}


// Other threads poll is_locked while the lock changes hands. None of them ever holds it, so
// none of them may ever see it as theirs.
TEST_F(LockTest, ConcurrentIsLocked) {
  std::atomic<bool> done{false};
  std::atomic<int> false_positives{0};
  long counter = 0;

  std::vector<std::thread> watchers;
  for (int i = 0; i < 2; i++) {
    watchers.emplace_back([&] {
      while (!done.load()) {
        if (lock.is_locked()) false_positives++;
      }
    });
  }

  std::vector<std::thread> workers;
  for (int i = 0; i < 4; i++) {
    workers.emplace_back([&] {
      for (int j = 0; j < 10000; j++) {
        plenum::scoped_lock lk(lock);
        counter++;
      }
    });
  }
  for (auto &t : workers)
    t.join();
  done = true;
  for (auto &t : watchers)
    t.join();

  ASSERT_EQ(counter, 40000);
  ASSERT_EQ(false_positives.load(), 0);
}
