#include "EventLoop.hpp"

#include "TestHeaders.hpp"

using namespace dx;

TEST_CASE("Timers fire in deadline order", "[EventLoop]") {
  auto loop = make_shared<EventLoop>();
  vector<int> fired;
  loop->schedule(30, [&]() { fired.push_back(3); });
  loop->schedule(10, [&]() { fired.push_back(1); });
  loop->schedule(20, [&]() { fired.push_back(2); });

  REQUIRE(loop->runUntil([&]() { return fired.size() == 3; }, 2000));
  REQUIRE(fired == vector<int>{1, 2, 3});
}

TEST_CASE("Cancelled timers never fire", "[EventLoop]") {
  auto loop = make_shared<EventLoop>();
  bool fired = false;
  auto id = loop->schedule(5, [&]() { fired = true; });
  REQUIRE(loop->isPending(id));
  loop->cancel(id);
  REQUIRE_FALSE(loop->isPending(id));
  loop->runUntil([]() { return false; }, 50);
  REQUIRE_FALSE(fired);

  SECTION("DeferredTask cancels on destruction") {
    {
      DeferredTask task(loop, loop->schedule(5, [&]() { fired = true; }));
      REQUIRE(task.isPending());
    }
    loop->runUntil([]() { return false; }, 50);
    REQUIRE_FALSE(fired);
  }
}

TEST_CASE("Repeating timers keep firing until cancelled", "[EventLoop]") {
  auto loop = make_shared<EventLoop>();
  int ticks = 0;
  Scheduler::TaskId id = Scheduler::INVALID_TASK;
  id = loop->scheduleRepeating(5, [&]() {
    if (++ticks == 3) {
      loop->cancel(id);
    }
  });
  loop->runUntil([]() { return false; }, 200);
  REQUIRE(ticks == 3);
  REQUIRE_THROWS_AS(loop->scheduleRepeating(0, []() {}),
                    std::invalid_argument);
}

TEST_CASE("Readable descriptors are dispatched", "[EventLoop]") {
  auto loop = make_shared<EventLoop>();
  int fds[2];
  REQUIRE(::pipe(fds) == 0);

  string received;
  loop->watchRead(fds[0], [&]() {
    char buf[16];
    ssize_t bytes = ::read(fds[0], buf, sizeof(buf));
    if (bytes > 0) {
      received.append(buf, bytes);
    } else {
      loop->unwatchRead(fds[0]);
    }
  });
  REQUIRE(::write(fds[1], "ping", 4) == 4);
  REQUIRE(loop->runUntil([&]() { return received == "ping"; }, 2000));

  SECTION("Stop ends run()") {
    loop->schedule(10, [&]() { loop->stop(); });
    loop->run();
    REQUIRE(loop->isStopped());
  }

  loop->unwatch(fds[0]);
  ::close(fds[0]);
  ::close(fds[1]);
}

TEST_CASE("Exceptions from callbacks do not escape the loop", "[EventLoop]") {
  auto loop = make_shared<EventLoop>();
  bool after = false;
  loop->schedule(1, []() { throw std::runtime_error("boom"); });
  loop->schedule(5, [&]() { after = true; });
  REQUIRE(loop->runUntil([&]() { return after; }, 2000));
}
