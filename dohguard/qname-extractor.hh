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
#include <cstdint>
#include <string>

#include "dns.hh"

namespace dohguard
{
struct ExtractedQuestion
{
  /* lower-cased, dot-joined, no trailing dot.
     Empty when the message could not be parsed at all. */
  std::string qname;
  uint16_t qtype{QType::A};
};

/* Reads the first question of a wire-format DNS message, following name
   compression pointers. Never throws: a message shorter than a DNS header
   gives an empty qname, an invalid label length or a pointer chain longer
   than s_maxCompressionJumps stops the walk and keeps the labels collected
   so far. The qtype defaults to A whenever it cannot be read. */
ExtractedQuestion extractQuestion(const PacketBuffer& packet);

static constexpr unsigned int s_maxCompressionJumps = 5;
static constexpr size_t s_maxNameLength = 255;
}
