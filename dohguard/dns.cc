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
#include <array>
#include <boost/algorithm/string.hpp>

#include "dns.hh"

namespace dohguard
{
static const std::array<std::pair<uint16_t, const char*>, 11> s_qtypeNames{{
  {QType::A, "A"},
  {QType::NS, "NS"},
  {QType::CNAME, "CNAME"},
  {QType::SOA, "SOA"},
  {QType::PTR, "PTR"},
  {QType::MX, "MX"},
  {QType::TXT, "TXT"},
  {QType::AAAA, "AAAA"},
  {QType::SRV, "SRV"},
  {QType::HTTPS, "HTTPS"},
  {QType::ANY, "ANY"},
}};

std::string RCode::to_s(uint8_t rcode)
{
  static const std::array<const char*, 6> rcodes = {"No Error", "Form Error", "Server Failure", "Non-Existent domain", "Not Implemented", "Query Refused"};
  if (rcode >= rcodes.size()) {
    return "Err#" + std::to_string(rcode);
  }
  return rcodes.at(rcode);
}

uint16_t QType::chartocode(const std::string& mnemonic)
{
  for (const auto& entry : s_qtypeNames) {
    if (boost::iequals(mnemonic, entry.second)) {
      return entry.first;
    }
  }
  if (!mnemonic.empty() && mnemonic.find_first_not_of("0123456789") == std::string::npos && mnemonic.size() <= 5) {
    auto value = std::stoul(mnemonic);
    if (value <= 0xffff) {
      return static_cast<uint16_t>(value);
    }
  }
  return 0;
}

std::string QType::toString(uint16_t code)
{
  for (const auto& entry : s_qtypeNames) {
    if (entry.first == code) {
      return entry.second;
    }
  }
  return "TYPE" + std::to_string(code);
}
}
