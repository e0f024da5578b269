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
#include <algorithm>

#include "blocked-response.hh"

namespace dohguard
{
PacketBuffer makeBlockedResponse(const PacketBuffer& query, BlockedResponsePolicy policy)
{
  PacketBuffer response(std::max(query.size(), s_dnsHeaderSize), 0);
  std::copy(query.begin(), query.end(), response.begin());

  /* keep the opcode and RD, drop AA and TC */
  uint8_t flags1 = response[DNSHeaderOffsets::flags1];
  response[DNSHeaderOffsets::flags1] = DNSFlags::QR | (flags1 & (DNSFlags::Opcode | DNSFlags::RD));

  const uint8_t rcode = policy == BlockedResponsePolicy::NXDomain ? RCode::NXDomain : RCode::NoError;
  response[DNSHeaderOffsets::flags2] = DNSFlags::RA | rcode;

  writeUInt16(response, DNSHeaderOffsets::ancount, 0);
  writeUInt16(response, DNSHeaderOffsets::nscount, 0);
  writeUInt16(response, DNSHeaderOffsets::arcount, 0);

  return response;
}
}
