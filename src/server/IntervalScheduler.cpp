#include "IntervalScheduler.hpp"

namespace lp {
Interval::Interval(std::chrono::milliseconds _period,
                   std::function<void()> _fn)
    : period(_period),
      fn(std::move(_fn)),
      stopped(false),
      finished(false),
      runCount(0) {}

void Interval::stop() {
  {
    lock_guard<std::mutex> guard(intervalMutex);
    stopped = true;
  }
  wakeup.notify_all();
}

bool Interval::isStopped() {
  lock_guard<std::mutex> guard(intervalMutex);
  return stopped;
}

void Interval::run() {
  while (true) {
    {
      std::unique_lock<std::mutex> lock(intervalMutex);
      if (wakeup.wait_for(lock, period, [this] { return stopped; })) {
        break;
      }
    }
    try {
      fn();
    } catch (const std::exception& e) {
      LOG(WARNING) << "Interval task threw: " << e.what();
    }
    runCount++;
  }
  finished = true;
}

IntervalScheduler::IntervalScheduler() : halted(false) {}

IntervalScheduler::~IntervalScheduler() { shutdown(); }

shared_ptr<Interval> IntervalScheduler::every(std::chrono::milliseconds period,
                                              std::function<void()> fn) {
  auto interval = make_shared<Interval>(period, std::move(fn));
  lock_guard<std::recursive_mutex> guard(schedulerMutex);
  if (halted) {
    LOG(WARNING) << "Interval requested after shutdown, not starting it";
    interval->stop();
    return interval;
  }
  reap();
  auto intervalThread = make_shared<thread>([interval]() {
    el::Helpers::setThreadName("interval");
    interval->run();
  });
  intervals.push_back(make_pair(interval, intervalThread));
  VLOG(2) << "Started interval every " << period.count() << "ms";
  return interval;
}

void IntervalScheduler::shutdown() {
  vector<pair<shared_ptr<Interval>, shared_ptr<thread>>> toJoin;
  {
    lock_guard<std::recursive_mutex> guard(schedulerMutex);
    halted = true;
    toJoin.swap(intervals);
  }
  for (auto& it : toJoin) {
    it.first->stop();
  }
  for (auto& it : toJoin) {
    if (it.second->get_id() == std::this_thread::get_id()) {
      // Shutdown from inside a task: that thread cannot join itself
      it.second->detach();
    } else if (it.second->joinable()) {
      it.second->join();
    }
  }
}

int IntervalScheduler::activeCount() {
  lock_guard<std::recursive_mutex> guard(schedulerMutex);
  int count = 0;
  for (auto& it : intervals) {
    if (!it.first->isStopped()) {
      count++;
    }
  }
  return count;
}

void IntervalScheduler::reap() {
  lock_guard<std::recursive_mutex> guard(schedulerMutex);
  for (auto it = intervals.begin(); it != intervals.end();) {
    if (it->first->isFinished()) {
      it->second->join();
      it = intervals.erase(it);
    } else {
      ++it;
    }
  }
}
}  // namespace lp
