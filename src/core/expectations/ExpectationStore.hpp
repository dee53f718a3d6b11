#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "AssessmentMode.hpp"

namespace sigdrift {

struct ExpectationRecord {
  std::optional<std::string>    originator;      // pattern text, see OriginatorPattern
  std::optional<AssessmentMode> assessment_type; // override of the inferred mode
  std::optional<std::string>    last_updated;    // UTC ISO-8601

  // fields this version does not know about, written back unchanged
  nlohmann::json extra = nlohmann::json::object();
};

// Result of resolving a user-supplied path against the store.
struct ResolvedKey {
  std::string path; // expanded path used for filesystem access and assessment
  std::string key;  // existing key, or the proposed key for a new record
};

// Persistent map of canonical path keys to expectation records.
// Loaded once, saved at most once per run; no locking.
class ExpectationStore {
public:
  using Map = std::map<std::string, ExpectationRecord>;
  using const_iterator = Map::const_iterator;

  ExpectationStore(std::string storePath, std::string home, bool substituteHome);

  // Missing file -> empty store. Malformed content throws StoreFormatError.
  void load();
  void loadText(const std::string& text);

  // Atomically replaces the store file. Throws StoreWriteError.
  void save() const;
  std::string dump() const;

  std::optional<ExpectationRecord> get(const std::string& key) const;
  void set(const std::string& key, ExpectationRecord record);
  bool remove(const std::string& key);
  bool contains(const std::string& key) const { return records_.count(key) != 0; }
  size_t size() const { return records_.size(); }
  std::vector<std::string> keys() const;

  const_iterator begin() const { return records_.begin(); }
  const_iterator end() const { return records_.end(); }

  ResolvedKey resolve(const std::string& path) const;

  const std::string& storePath() const { return storePath_; }
  const std::string& home() const { return home_; }
  bool substituteHome() const { return substituteHome_; }

private:
  std::string storePath_;
  std::string home_;
  bool substituteHome_;
  Map records_;
};

} // namespace sigdrift
