#include "OriginatorPattern.hpp"

#include <cctype>
#include <regex>

#include "core/Errors.hpp"

namespace sigdrift {

static constexpr char kTeamIdPrefix[] = "id:";
static constexpr size_t kTeamIdPrefixLen = sizeof(kTeamIdPrefix) - 1;

static bool is_alnum_token(const std::string& s) {
  if (s.empty()) return false;
  for (unsigned char c : s) {
    if (!std::isalnum(c)) return false;
  }
  return true;
}

std::string trailing_team_id(const std::string& identity) {
  if (identity.size() < 3 || identity.back() != ')') return {};
  const auto open = identity.rfind('(');
  if (open == std::string::npos) return {};
  std::string token = identity.substr(open + 1, identity.size() - open - 2);
  return is_alnum_token(token) ? token : std::string();
}

std::string regex_escape(const std::string& literal) {
  static const std::string special = "\\^$.|?*+()[]{}";
  std::string out;
  out.reserve(literal.size() * 2);
  for (char c : literal) {
    if (special.find(c) != std::string::npos) out += '\\';
    out += c;
  }
  return out;
}

OriginatorPattern OriginatorPattern::parse(const std::string& stored) {
  if (stored.compare(0, kTeamIdPrefixLen, kTeamIdPrefix) == 0) {
    if (!is_alnum_token(stored.substr(kTeamIdPrefixLen))) {
      throw StoreFormatError("invalid team identifier pattern: " + stored);
    }
    return OriginatorPattern(Kind::TeamId, stored);
  }
  try {
    std::regex check(stored);
  } catch (const std::regex_error& e) {
    throw StoreFormatError("invalid originator pattern '" + stored + "': " + e.what());
  }
  return OriginatorPattern(Kind::Anchored, stored);
}

OriginatorPattern OriginatorPattern::fromObserved(const std::string& identity) {
  if (auto token = trailing_team_id(identity); !token.empty()) {
    return OriginatorPattern(Kind::TeamId, kTeamIdPrefix + token);
  }
  return OriginatorPattern(Kind::Anchored, "^" + regex_escape(identity) + "$");
}

bool OriginatorPattern::matches(const std::string& identity) const {
  switch (kind_) {
    case Kind::TeamId: {
      const std::string suffix = "(" + text_.substr(kTeamIdPrefixLen) + ")";
      return identity.size() >= suffix.size() &&
             identity.compare(identity.size() - suffix.size(), suffix.size(), suffix) == 0;
    }
    case Kind::Anchored:
      return std::regex_search(identity, std::regex(text_));
  }
  return false;
}

} // namespace sigdrift
