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

#include "domain-rules.hh"
#include "dns.hh"
#include "dohguardexception.hh"

namespace dohguard
{
std::string DomainSet::normalize(const std::string& domain)
{
  std::string result = boost::trim_copy(domain);
  if (boost::starts_with(result, "*.")) {
    result.erase(0, 2);
  }
  while (!result.empty() && result.back() == '.') {
    result.pop_back();
  }
  if (result.empty() || result.front() == '.' || result.find("..") != std::string::npos) {
    return {};
  }
  for (auto& chr : result) {
    if (chr == ' ' || chr == '\t' || chr == '\r' || chr == '\n' || chr == '/') {
      return {};
    }
    chr = dns_tolower(chr);
  }
  return result;
}

bool DomainSet::add(const std::string& domain)
{
  auto normalized = normalize(domain);
  if (normalized.empty()) {
    return false;
  }

  auto entries = d_entries.write_lock();
  if (!entries->d_index.insert(normalized).second) {
    return false;
  }
  entries->d_ordered.push_back(std::move(normalized));
  return true;
}

size_t DomainSet::add(const std::vector<std::string>& domains)
{
  size_t added = 0;
  for (const auto& domain : domains) {
    if (add(domain)) {
      ++added;
    }
  }
  return added;
}

bool DomainSet::contains(const std::string& domain) const
{
  return d_entries.read_lock()->d_index.count(domain) != 0;
}

std::optional<std::string> DomainSet::matchSuffix(const std::string& qname) const
{
  if (qname.empty()) {
    return std::nullopt;
  }

  auto entries = d_entries.read_lock();
  const auto& index = entries->d_index;
  if (index.empty()) {
    return std::nullopt;
  }

  if (index.count(qname) != 0) {
    return qname;
  }

  /* parents of qname, longest first; stop before the last label alone */
  size_t dot = qname.find('.');
  while (dot != std::string::npos) {
    std::string parent = qname.substr(dot + 1);
    size_t next = qname.find('.', dot + 1);
    if (next == std::string::npos) {
      break;
    }
    if (index.count(parent) != 0) {
      return parent;
    }
    dot = next;
  }

  return std::nullopt;
}

std::vector<std::string> DomainSet::entries() const
{
  return d_entries.read_lock()->d_ordered;
}

size_t DomainSet::size() const
{
  return d_entries.read_lock()->d_ordered.size();
}

RegexDomainPattern::RegexDomainPattern(const std::string& expr) :
  d_expr(expr)
{
  if (auto ret = regcomp(&d_preg, expr.c_str(), REG_ICASE | REG_NOSUB | REG_EXTENDED); ret != 0) {
    std::array<char, 1024> errorBuffer{};
    if (regerror(ret, &d_preg, errorBuffer.data(), errorBuffer.size()) > 0) {
      throw DohGuardException("Regular expression " + expr + " did not compile: " + errorBuffer.data());
    }
    throw DohGuardException("Regular expression " + expr + " did not compile");
  }
}

void PatternList::add(std::shared_ptr<const DomainPattern> pattern)
{
  if (!pattern) {
    return;
  }
  d_patterns.write_lock()->push_back(std::move(pattern));
}

void PatternList::addRegex(const std::string& expr)
{
  /* compile outside of the lock, readers never see a half-built pattern */
  auto pattern = std::make_shared<const RegexDomainPattern>(expr);
  add(std::move(pattern));
}

std::shared_ptr<const DomainPattern> PatternList::firstMatch(const std::string& qname) const
{
  auto patterns = d_patterns.read_lock();
  for (const auto& pattern : *patterns) {
    if (pattern->matches(qname)) {
      return pattern;
    }
  }
  return nullptr;
}

std::vector<std::string> PatternList::toStrings() const
{
  std::vector<std::string> result;
  auto patterns = d_patterns.read_lock();
  result.reserve(patterns->size());
  for (const auto& pattern : *patterns) {
    result.push_back(pattern->toString());
  }
  return result;
}

size_t PatternList::size() const
{
  return d_patterns.read_lock()->size();
}
}
