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
#include <mutex>
#include <shared_mutex>
#include <utility>

/*
  Data that is shared between the threads processing queries (rule sets,
  cache shards, the most-blocked table) is wrapped together with the mutex
  protecting it. The data can only be reached through a holder, which owns
  the lock for as long as it lives:

  LockGuarded<std::list<std::string>> d_order;
  d_order.lock()->push_back(key);

  {
    auto order = d_order.lock();
    order->pop_front();
    order->push_back(key);
  }

  SharedLockGuarded allows several readers at once (read_lock()) or a single
  writer (write_lock()). Readers only get const access.
*/

namespace dohguard
{
template <typename T, typename Lock>
class LockedHolder
{
public:
  template <typename Mutex>
  explicit LockedHolder(T& value, Mutex& mutex) :
    d_lock(mutex), d_value(value)
  {
  }

  T& operator*() const noexcept
  {
    return d_value;
  }

  T* operator->() const noexcept
  {
    return &d_value;
  }

private:
  Lock d_lock;
  T& d_value;
};

template <typename T>
using LockGuardedHolder = LockedHolder<T, std::scoped_lock<std::mutex>>;
template <typename T>
using SharedLockGuardedHolder = LockedHolder<T, std::unique_lock<std::shared_mutex>>;
template <typename T>
using SharedLockGuardedNonExclusiveHolder = LockedHolder<const T, std::shared_lock<std::shared_mutex>>;

template <typename T>
class LockGuarded
{
public:
  explicit LockGuarded() = default;

  explicit LockGuarded(T&& value) :
    d_value(std::move(value))
  {
  }

  LockGuardedHolder<T> lock()
  {
    return LockGuardedHolder<T>(d_value, d_mutex);
  }

private:
  std::mutex d_mutex;
  T d_value;
};

template <typename T>
class SharedLockGuarded
{
public:
  explicit SharedLockGuarded() = default;

  explicit SharedLockGuarded(T&& value) :
    d_value(std::move(value))
  {
  }

  SharedLockGuardedHolder<T> write_lock()
  {
    return SharedLockGuardedHolder<T>(d_value, d_mutex);
  }

  SharedLockGuardedNonExclusiveHolder<T> read_lock() const
  {
    return SharedLockGuardedNonExclusiveHolder<T>(d_value, d_mutex);
  }

private:
  mutable std::shared_mutex d_mutex;
  T d_value;
};
}
