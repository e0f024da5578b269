/*
 * This file is part of PowerDNS or dnsdist.
 * Copyright -- PowerDNS.COM B.V. and its contributors
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of version 2 of the GNU General Public License as
 * published by the Free Software Foundation.
 *
 * In addition, for the avoidance of any doubt, permission is granted to
 * link this program with OpenSSL and to (re)distribute the binaries
 * produced as the result of such linking.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */
#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

#include "stat_t.hh"

namespace dohguard
{
using DeferredTask = std::function<void()>;
/* hands a task over to something that will run it later, possibly on
   another thread. An empty runner means "run it right away". */
using DeferredTaskRunner = std::function<void(DeferredTask)>;

/* Runs the task, logging and discarding whatever it throws: a deferred
   task has nobody left to report its failure to. */
void runDeferredTask(const DeferredTask& task);

/* A single background thread running queued tasks in order. When more
   than maxQueued tasks are waiting, new ones are dropped and counted.
   The destructor runs what is still queued before joining. */
class DeferredWorkQueue
{
public:
  explicit DeferredWorkQueue(size_t maxQueued = 1024);
  ~DeferredWorkQueue();
  DeferredWorkQueue(const DeferredWorkQueue&) = delete;
  DeferredWorkQueue& operator=(const DeferredWorkQueue&) = delete;

  bool submit(DeferredTask task);
  //! blocks until every task submitted so far has been run
  void drain();

  DeferredTaskRunner getRunner();

  uint64_t getDropped() const { return d_dropped; }
  uint64_t getExecuted() const { return d_executed; }

private:
  void worker();

  std::mutex d_mutex;
  std::condition_variable d_cond;
  std::condition_variable d_idle;
  std::deque<DeferredTask> d_tasks;
  const size_t d_maxQueued;
  size_t d_running{0};
  bool d_stopping{false};
  stat_t d_dropped{0};
  stat_t d_executed{0};
  std::thread d_thread;
};
}
