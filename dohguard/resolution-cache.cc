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
#include <functional>
#include <stdexcept>

#include "resolution-cache.hh"

namespace dohguard
{
std::string makeCacheKey(const std::string& qname, uint16_t qtype, QueryFormat format)
{
  std::string key;
  if (format == QueryFormat::JSON) {
    key = "json:";
  }
  key += qname;
  key += ':';
  key += std::to_string(qtype);
  return key;
}

ResolutionCache::ResolutionCache(size_t maxEntries, uint32_t shards) :
  d_maxEntries(maxEntries), d_shardCount(shards)
{
  if (d_shardCount == 0) {
    throw std::invalid_argument("The number of cache shards cannot be zero");
  }
  if (d_maxEntries < d_shardCount) {
    throw std::invalid_argument("The cache needs to hold at least one entry per shard");
  }
  d_maxPerShard = d_maxEntries / d_shardCount;

  d_shards.resize(d_shardCount);
  for (auto& shard : d_shards) {
    shard.d_content.lock()->d_map.reserve(d_maxPerShard + 1);
  }
}

uint32_t ResolutionCache::getShardIndex(const std::string& key) const
{
  return static_cast<uint32_t>(std::hash<std::string>{}(key) % d_shardCount);
}

boost::optional<PacketBuffer> ResolutionCache::get(const std::string& key)
{
  return get(key, time(nullptr));
}

boost::optional<PacketBuffer> ResolutionCache::get(const std::string& key, time_t now)
{
  auto& shard = d_shards.at(getShardIndex(key));
  auto content = shard.d_content.lock();

  auto it = content->d_map.find(key);
  if (it == content->d_map.end()) {
    d_misses++;
    return boost::none;
  }

  if (it->second.validity <= now) {
    content->d_order.erase(it->second.position);
    content->d_map.erase(it);
    d_expired++;
    d_misses++;
    return boost::none;
  }

  d_hits++;
  return it->second.value;
}

void ResolutionCache::insert(const std::string& key, const PacketBuffer& value, uint32_t ttl)
{
  insert(key, value, ttl, time(nullptr));
}

void ResolutionCache::insert(const std::string& key, const PacketBuffer& value, uint32_t ttl, time_t now)
{
  /* build the entry before taking the lock, so that what becomes
     visible is always complete */
  CacheValue newValue;
  newValue.value = value;
  newValue.validity = now + ttl;

  auto& shard = d_shards.at(getShardIndex(key));
  auto content = shard.d_content.lock();

  auto it = content->d_map.find(key);
  if (it != content->d_map.end()) {
    it->second.value = std::move(newValue.value);
    it->second.validity = newValue.validity;
    return;
  }

  if (content->d_map.size() >= d_maxPerShard) {
    const auto& oldest = content->d_order.front();
    content->d_map.erase(oldest);
    content->d_order.pop_front();
    d_evictions++;
  }

  content->d_order.push_back(key);
  newValue.position = std::prev(content->d_order.end());
  try {
    content->d_map.emplace(key, std::move(newValue));
  }
  catch (...) {
    content->d_order.pop_back();
    throw;
  }
}

size_t ResolutionCache::purgeExpired(time_t now)
{
  size_t removed = 0;

  for (auto& shard : d_shards) {
    auto content = shard.d_content.lock();
    for (auto it = content->d_map.begin(); it != content->d_map.end();) {
      if (it->second.validity <= now) {
        content->d_order.erase(it->second.position);
        it = content->d_map.erase(it);
        ++removed;
      }
      else {
        ++it;
      }
    }
  }

  d_expired += removed;
  return removed;
}

size_t ResolutionCache::expunge()
{
  size_t removed = 0;

  for (auto& shard : d_shards) {
    auto content = shard.d_content.lock();
    removed += content->d_map.size();
    content->d_map.clear();
    content->d_order.clear();
  }

  return removed;
}

uint64_t ResolutionCache::getSize()
{
  uint64_t count = 0;

  for (auto& shard : d_shards) {
    count += shard.d_content.lock()->d_map.size();
  }

  return count;
}
}
