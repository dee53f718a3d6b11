#pragma once
#include <string>
#include <utility>

namespace sigdrift {

// Expected originator of a tracked path, as stored in the expectations file.
//
// Two forms exist:
//   TeamId    "id:ABCDEF1234"  matches any identity ending in "(ABCDEF1234)"
//   Anchored  a regular expression searched within the identity; written as
//             "^<escaped identity>$" when recorded from an observation
class OriginatorPattern {
public:
  enum class Kind { TeamId, Anchored };

  // Throws StoreFormatError if an anchored expression does not compile.
  static OriginatorPattern parse(const std::string& stored);

  // Canonical pattern for a freshly observed identity.
  static OriginatorPattern fromObserved(const std::string& identity);

  bool matches(const std::string& identity) const;

  Kind kind() const { return kind_; }
  const std::string& str() const { return text_; }

private:
  OriginatorPattern(Kind kind, std::string text) : kind_(kind), text_(std::move(text)) {}

  Kind kind_;
  std::string text_;
};

// Token of a trailing "(TOKEN)" with TOKEN alphanumeric, or "" if absent.
std::string trailing_team_id(const std::string& identity);

// Escapes ECMAScript regex metacharacters.
std::string regex_escape(const std::string& literal);

} // namespace sigdrift
