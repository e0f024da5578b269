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

#include <atomic>
#include <cstdint>
#include <new>
#include <type_traits>

#define DOHGUARD_CACHELINE_SIZE 64

namespace dohguard
{
/* a counter padded to its own cache line, so that the counters
   bumped by every query do not share a line with each other */
template <typename T>
class stat_t_trait
{
public:
  using base_t = T;
  using atomic_t = std::atomic<base_t>;

  stat_t_trait() :
    stat_t_trait(base_t(0))
  {
  }
  stat_t_trait(const base_t value)
  {
    new (&d_counter) atomic_t(value);
  }
  ~stat_t_trait()
  {
    ref().~atomic_t();
  }
  stat_t_trait(stat_t_trait&&) = delete;
  stat_t_trait(const stat_t_trait&) = delete;
  stat_t_trait& operator=(const stat_t_trait&) = delete;
  stat_t_trait& operator=(stat_t_trait&&) = delete;

  base_t operator++(int)
  {
    return ref()++;
  }
  base_t operator++()
  {
    return ++(ref());
  }
  base_t operator+=(base_t arg)
  {
    return ref() += arg;
  }
  operator base_t() const
  {
    return ref().load();
  }

private:
  atomic_t& ref()
  {
    return *reinterpret_cast<atomic_t*>(&d_counter); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
  }
  const atomic_t& ref() const
  {
    return *reinterpret_cast<const atomic_t*>(&d_counter); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
  }
  typename std::aligned_storage_t<sizeof(atomic_t), DOHGUARD_CACHELINE_SIZE> d_counter;
};

using stat_t = stat_t_trait<uint64_t>;
}
