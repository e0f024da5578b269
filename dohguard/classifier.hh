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
#include <string>

#include "domain-rules.hh"

namespace dohguard
{
enum class Verdict : uint8_t
{
  Allow,
  Block
};

//! The three rule collections consulted for every query
struct FilterRules
{
  DomainSet allowlist;
  DomainSet blocklist;
  PatternList patterns;
};

/* Precedence: allowlist > blocklist > patterns > default allow.
   An empty name (nothing could be parsed) is always allowed. */
class Classifier
{
public:
  explicit Classifier(const FilterRules& rules) :
    d_rules(rules)
  {
  }

  /* when matchedRule is set, it receives the rule that decided the
     verdict, empty when nothing matched */
  Verdict classify(const std::string& qname, std::string* matchedRule = nullptr) const;

private:
  const FilterRules& d_rules;
};

const char* verdictToString(Verdict verdict);
}
