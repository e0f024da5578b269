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
#include <vector>

namespace dohguard
{
using PacketBuffer = std::vector<uint8_t>;

/* Offsets into the fixed 12-byte DNS header. The header is handled as raw
   bytes rather than through a bit-field struct, since we only ever patch a
   few fields of messages we did not build ourselves. */
struct DNSHeaderOffsets
{
  static constexpr size_t id = 0;
  static constexpr size_t flags1 = 2; // QR, OPCODE, AA, TC, RD
  static constexpr size_t flags2 = 3; // RA, Z, AD, CD, RCODE
  static constexpr size_t qdcount = 4;
  static constexpr size_t ancount = 6;
  static constexpr size_t nscount = 8;
  static constexpr size_t arcount = 10;
};

static constexpr size_t s_dnsHeaderSize = 12;

namespace DNSFlags
{
static constexpr uint8_t QR = 0x80;
static constexpr uint8_t Opcode = 0x78;
static constexpr uint8_t AA = 0x04;
static constexpr uint8_t TC = 0x02;
static constexpr uint8_t RD = 0x01;
static constexpr uint8_t RA = 0x80;
static constexpr uint8_t RCodeMask = 0x0F;
}

class RCode
{
public:
  enum rcodes_ : uint8_t
  {
    NoError = 0,
    FormErr = 1,
    ServFail = 2,
    NXDomain = 3,
    NotImp = 4,
    Refused = 5
  };
  static std::string to_s(uint8_t rcode);
};

class QType
{
public:
  enum typeenum : uint16_t
  {
    A = 1,
    NS = 2,
    CNAME = 5,
    SOA = 6,
    PTR = 12,
    MX = 15,
    TXT = 16,
    AAAA = 28,
    SRV = 33,
    HTTPS = 65,
    ANY = 255
  };
  //! returns 0 for unknown mnemonics, numeric strings are accepted as-is
  static uint16_t chartocode(const std::string& mnemonic);
  static std::string toString(uint16_t code);
};

inline uint16_t readUInt16(const PacketBuffer& packet, size_t pos)
{
  return static_cast<uint16_t>((packet.at(pos) << 8) | packet.at(pos + 1));
}

inline void writeUInt16(PacketBuffer& packet, size_t pos, uint16_t value)
{
  packet.at(pos) = static_cast<uint8_t>(value >> 8);
  packet.at(pos + 1) = static_cast<uint8_t>(value & 0xff);
}

inline char dns_tolower(char chr)
{
  if (chr >= 'A' && chr <= 'Z') {
    chr += 'a' - 'A';
  }
  return chr;
}
}
