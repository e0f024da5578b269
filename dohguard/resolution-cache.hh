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
#include <ctime>
#include <list>
#include <string>
#include <unordered_map>
#include <vector>
#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>

#include "dns.hh"
#include "lock.hh"
#include "stat_t.hh"

namespace dohguard
{
enum class QueryFormat : uint8_t
{
  Wire,
  JSON
};

/* "<qname>:<qtype>" for wire-format queries, "json:<qname>:<qtype>" for
   the JSON API, so that A and AAAA answers for a name never collide */
std::string makeCacheKey(const std::string& qname, uint16_t qtype, QueryFormat format = QueryFormat::Wire);

/* Bounded key -> response cache with a per-entry validity.
   Entries are kept in insertion order: inserting a new key into a full
   shard evicts the oldest-inserted entry of that shard, reads do not
   reorder anything. Expired entries are removed when looked up.
   Keys are spread over `shards` shards, each holding at most
   maxEntries / shards entries behind its own mutex. */
class ResolutionCache : boost::noncopyable
{
public:
  ResolutionCache(size_t maxEntries = 1000, uint32_t shards = 1);

  boost::optional<PacketBuffer> get(const std::string& key);
  boost::optional<PacketBuffer> get(const std::string& key, time_t now);

  /* an existing entry for the same key is replaced in place and keeps
     its position in the insertion order */
  void insert(const std::string& key, const PacketBuffer& value, uint32_t ttl);
  void insert(const std::string& key, const PacketBuffer& value, uint32_t ttl, time_t now);

  size_t purgeExpired(time_t now);
  size_t expunge();

  uint64_t getSize();
  uint64_t getMaxEntries() const { return d_maxEntries; }
  uint64_t getHits() const { return d_hits; }
  uint64_t getMisses() const { return d_misses; }
  uint64_t getEvictions() const { return d_evictions; }
  uint64_t getExpired() const { return d_expired; }

private:
  struct CacheValue
  {
    PacketBuffer value;
    time_t validity{0};
    std::list<std::string>::iterator position;
  };

  struct ShardContent
  {
    std::unordered_map<std::string, CacheValue> d_map;
    /* oldest insertion first */
    std::list<std::string> d_order;
  };

  class CacheShard
  {
  public:
    CacheShard() = default;
    CacheShard(const CacheShard& /* old */)
    {
    }

    LockGuarded<ShardContent> d_content;
  };

  uint32_t getShardIndex(const std::string& key) const;

  std::vector<CacheShard> d_shards;

  stat_t d_hits{0};
  stat_t d_misses{0};
  stat_t d_evictions{0};
  stat_t d_expired{0};

  const size_t d_maxEntries;
  const uint32_t d_shardCount;
  size_t d_maxPerShard;
};
}
