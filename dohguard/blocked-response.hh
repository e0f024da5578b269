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
#include "dns.hh"

namespace dohguard
{
enum class BlockedResponsePolicy : uint8_t
{
  NXDomain,
  NoData
};

/* Turns a query into the answer we send for a blocked name: the header and
   question are echoed back untouched (same ID, same question), QR and RA are
   set, RD is preserved, and the answer, authority and additional counts are
   zeroed. The rcode is NXDOMAIN, or NOERROR for the NoData policy.
   The result is never shorter than the query nor than a DNS header, so a
   short or garbled query still gets a header-only response. */
PacketBuffer makeBlockedResponse(const PacketBuffer& query, BlockedResponsePolicy policy = BlockedResponsePolicy::NXDomain);
}
