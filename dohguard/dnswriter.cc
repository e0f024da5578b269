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
#include <stdexcept>
#include <boost/algorithm/string.hpp>

#include "dnswriter.hh"
#include "qname-extractor.hh"

namespace dohguard
{
PacketBuffer makeDNSQuery(const std::string& qname, uint16_t qtype, uint16_t qid, bool recursionDesired)
{
  PacketBuffer packet(s_dnsHeaderSize, 0);
  writeUInt16(packet, DNSHeaderOffsets::id, qid);
  if (recursionDesired) {
    packet[DNSHeaderOffsets::flags1] |= DNSFlags::RD;
  }
  writeUInt16(packet, DNSHeaderOffsets::qdcount, 1);

  std::string trimmed = boost::trim_right_copy_if(qname, boost::is_any_of("."));
  if (trimmed.size() > s_maxNameLength) {
    throw std::range_error("name too long: " + qname);
  }

  if (!trimmed.empty()) {
    std::vector<std::string> labels;
    boost::split(labels, trimmed, boost::is_any_of("."));
    for (const auto& label : labels) {
      if (label.empty() || label.size() > 63) {
        throw std::range_error("invalid label in name '" + qname + "'");
      }
      packet.push_back(static_cast<uint8_t>(label.size()));
      packet.insert(packet.end(), label.begin(), label.end());
    }
  }
  packet.push_back(0);

  packet.push_back(static_cast<uint8_t>(qtype >> 8));
  packet.push_back(static_cast<uint8_t>(qtype & 0xff));
  // class IN
  packet.push_back(0);
  packet.push_back(1);

  return packet;
}
}
