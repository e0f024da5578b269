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
#include "deferred-work.hh"
#include "dohguardexception.hh"
#include "dolog.hh"

namespace dohguard
{
void runDeferredTask(const DeferredTask& task)
{
  try {
    task();
  }
  catch (const DohGuardException& e) {
    errlog("Deferred task failed: %s", e.reason);
  }
  catch (const std::exception& e) {
    errlog("Deferred task failed: %s", e.what());
  }
}

DeferredWorkQueue::DeferredWorkQueue(size_t maxQueued) :
  d_maxQueued(maxQueued)
{
  d_thread = std::thread([this]() { worker(); });
}

DeferredWorkQueue::~DeferredWorkQueue()
{
  {
    std::lock_guard<std::mutex> lock(d_mutex);
    d_stopping = true;
  }
  d_cond.notify_all();
  if (d_thread.joinable()) {
    d_thread.join();
  }
}

bool DeferredWorkQueue::submit(DeferredTask task)
{
  {
    std::lock_guard<std::mutex> lock(d_mutex);
    if (d_stopping || d_tasks.size() >= d_maxQueued) {
      ++d_dropped;
      return false;
    }
    d_tasks.push_back(std::move(task));
  }
  d_cond.notify_one();
  return true;
}

void DeferredWorkQueue::drain()
{
  std::unique_lock<std::mutex> lock(d_mutex);
  d_idle.wait(lock, [this]() { return d_tasks.empty() && d_running == 0; });
}

DeferredTaskRunner DeferredWorkQueue::getRunner()
{
  return [this](DeferredTask task) {
    if (!submit(std::move(task))) {
      vinfolog("Deferred work queue full, dropping a task");
    }
  };
}

void DeferredWorkQueue::worker()
{
  for (;;) {
    DeferredTask task;
    {
      std::unique_lock<std::mutex> lock(d_mutex);
      d_cond.wait(lock, [this]() { return d_stopping || !d_tasks.empty(); });
      if (d_tasks.empty()) {
        /* stopping, and nothing left to run */
        d_idle.notify_all();
        return;
      }
      task = std::move(d_tasks.front());
      d_tasks.pop_front();
      ++d_running;
    }

    runDeferredTask(task);
    ++d_executed;

    {
      std::lock_guard<std::mutex> lock(d_mutex);
      --d_running;
      if (d_tasks.empty()) {
        d_idle.notify_all();
      }
    }
  }
}
}
