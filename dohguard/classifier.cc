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
#include "classifier.hh"

namespace dohguard
{
Verdict Classifier::classify(const std::string& qname, std::string* matchedRule) const
{
  if (matchedRule != nullptr) {
    matchedRule->clear();
  }

  if (qname.empty()) {
    return Verdict::Allow;
  }

  if (auto allowed = d_rules.allowlist.matchSuffix(qname)) {
    if (matchedRule != nullptr) {
      *matchedRule = "allow:" + *allowed;
    }
    return Verdict::Allow;
  }

  if (auto blocked = d_rules.blocklist.matchSuffix(qname)) {
    if (matchedRule != nullptr) {
      *matchedRule = "block:" + *blocked;
    }
    return Verdict::Block;
  }

  if (auto pattern = d_rules.patterns.firstMatch(qname)) {
    if (matchedRule != nullptr) {
      *matchedRule = "pattern:" + pattern->toString();
    }
    return Verdict::Block;
  }

  return Verdict::Allow;
}

const char* verdictToString(Verdict verdict)
{
  return verdict == Verdict::Block ? "block" : "allow";
}
}
