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
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include <regex.h>
#include <boost/noncopyable.hpp>

#include "lock.hh"

namespace dohguard
{
/* A set of domains matched on label boundaries: a name matches an entry
   when it is the entry, or ends with "." followed by the entry. Parent
   suffixes are walked from the full name up to, but excluding, the bare
   TLD, so a TLD entry only ever matches the TLD itself.
   Entries can be added concurrently with lookups, never removed. */
class DomainSet
{
public:
  DomainSet() = default;
  DomainSet(const DomainSet&) = delete;
  DomainSet& operator=(const DomainSet&) = delete;

  //! false if the domain is invalid or already present
  bool add(const std::string& domain);
  size_t add(const std::vector<std::string>& domains);

  bool contains(const std::string& domain) const;
  //! the entry matching qname or one of its parents, if any
  std::optional<std::string> matchSuffix(const std::string& qname) const;

  //! entries in insertion order
  std::vector<std::string> entries() const;
  size_t size() const;

  /* lower-cases, strips surrounding blanks, a leading "*." and a trailing
     dot. Returns an empty string for something that is not a domain. */
  static std::string normalize(const std::string& domain);

private:
  struct Entries
  {
    std::unordered_set<std::string> d_index;
    std::vector<std::string> d_ordered;
  };
  SharedLockGuarded<Entries> d_entries;
};

//! Something able to tell whether a (normalized) domain name matches
class DomainPattern
{
public:
  virtual ~DomainPattern() = default;
  virtual bool matches(const std::string& qname) const = 0;
  virtual const std::string& toString() const = 0;
};

//! POSIX extended regular expression, matched case-insensitively
class RegexDomainPattern : public DomainPattern, boost::noncopyable
{
public:
  /** throws DohGuardException if the expression does not compile */
  RegexDomainPattern(const std::string& expr);
  ~RegexDomainPattern() override
  {
    regfree(&d_preg);
  }

  bool matches(const std::string& qname) const override
  {
    return regexec(&d_preg, qname.c_str(), 0, nullptr, 0) == 0;
  }

  const std::string& toString() const override
  {
    return d_expr;
  }

private:
  std::string d_expr;
  regex_t d_preg;
};

/* Ordered sequence of patterns, evaluated in insertion order. */
class PatternList
{
public:
  void add(std::shared_ptr<const DomainPattern> pattern);
  //! compiles expr as a RegexDomainPattern, throws DohGuardException on error
  void addRegex(const std::string& expr);

  //! the first pattern matching qname, if any
  std::shared_ptr<const DomainPattern> firstMatch(const std::string& qname) const;

  std::vector<std::string> toStrings() const;
  size_t size() const;

private:
  SharedLockGuarded<std::vector<std::shared_ptr<const DomainPattern>>> d_patterns;
};
}
