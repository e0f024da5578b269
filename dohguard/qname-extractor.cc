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
#include "qname-extractor.hh"

namespace dohguard
{
ExtractedQuestion extractQuestion(const PacketBuffer& packet)
{
  ExtractedQuestion result;

  if (packet.size() < s_dnsHeaderSize) {
    return result;
  }

  std::string& name = result.qname;
  size_t pos = s_dnsHeaderSize;
  /* where the question continues once the name is done, only known
     when the name was properly terminated */
  size_t afterName = 0;
  bool jumped = false;
  bool complete = false;
  unsigned int jumps = 0;

  while (pos < packet.size()) {
    const uint8_t labelLen = packet[pos];

    if (labelLen == 0) {
      if (!jumped) {
        afterName = pos + 1;
      }
      complete = true;
      break;
    }

    if ((labelLen & 0xC0) == 0xC0) {
      if (pos + 1 >= packet.size()) {
        break;
      }
      if (++jumps > s_maxCompressionJumps) {
        break;
      }
      if (!jumped) {
        afterName = pos + 2;
        jumped = true;
      }
      pos = static_cast<size_t>(((labelLen & 0x3F) << 8) | packet[pos + 1]);
      continue;
    }

    if (labelLen > 63) {
      break;
    }

    if (pos + 1 + labelLen > packet.size()) {
      break;
    }
    if (name.size() + labelLen + (name.empty() ? 0 : 1) > s_maxNameLength) {
      break;
    }

    if (!name.empty()) {
      name.push_back('.');
    }
    for (size_t idx = pos + 1; idx <= pos + labelLen; ++idx) {
      name.push_back(dns_tolower(static_cast<char>(packet[idx])));
    }
    pos += 1 + labelLen;
  }

  if (complete && afterName + 2 <= packet.size()) {
    result.qtype = readUInt16(packet, afterName);
  }

  return result;
}
}
