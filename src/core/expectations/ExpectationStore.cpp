#include "ExpectationStore.hpp"

#include <spdlog/spdlog.h>
#include <utility>

#include "OriginatorPattern.hpp"
#include "core/Errors.hpp"
#include "core/storage/LocalPaths.hpp"

using nlohmann::json;

namespace sigdrift {

static constexpr char kOriginator[] = "originator";
static constexpr char kAssessmentType[] = "assessment_type";
static constexpr char kLastUpdated[] = "last_updated";

ExpectationStore::ExpectationStore(std::string storePath, std::string home, bool substituteHome)
  : storePath_(std::move(storePath)), home_(std::move(home)), substituteHome_(substituteHome) {}

// -------- persistence --------

static ExpectationRecord parse_record(const std::string& key, const json& value) {
  if (!value.is_object()) {
    throw StoreFormatError("record '" + key + "' is not an object");
  }
  auto as_string = [&](const char* field, const json& v) {
    if (!v.is_string()) {
      throw StoreFormatError("record '" + key + "': field '" + field + "' must be a string");
    }
    return v.get<std::string>();
  };

  ExpectationRecord r;
  for (auto it = value.begin(); it != value.end(); ++it) {
    const std::string& field = it.key();
    const json& v = it.value();
    if (field == kOriginator) {
      if (v.is_null()) continue;
      std::string pattern = as_string(kOriginator, v);
      OriginatorPattern::parse(pattern); // validates
      r.originator = std::move(pattern);
    } else if (field == kAssessmentType) {
      if (v.is_null()) continue;
      std::string s = as_string(kAssessmentType, v);
      auto mode = parse_assessment_mode(s);
      if (!mode) {
        throw StoreFormatError("record '" + key + "': unknown assessment_type '" + s + "'");
      }
      r.assessment_type = *mode;
    } else if (field == kLastUpdated) {
      if (v.is_null()) continue;
      r.last_updated = as_string(kLastUpdated, v);
    } else {
      r.extra[field] = v;
    }
  }
  return r;
}

void ExpectationStore::load() {
  std::string text;
  // I/O failures surface as plain Error; only parse failures are format errors
  if (!read_file(storePath_, text)) {
    spdlog::debug("no store at {}, starting empty", storePath_);
    records_.clear();
    return;
  }
  try {
    loadText(text);
  } catch (const StoreFormatError& e) {
    throw StoreFormatError(storePath_ + ": " + e.what());
  }
  spdlog::debug("loaded {} record(s) from {}", records_.size(), storePath_);
}

void ExpectationStore::loadText(const std::string& text) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error& e) {
    throw StoreFormatError(std::string("invalid JSON: ") + e.what());
  }
  if (!j.is_object()) throw StoreFormatError("top-level value must be an object");

  Map records;
  for (auto it = j.begin(); it != j.end(); ++it) {
    records.emplace(it.key(), parse_record(it.key(), it.value()));
  }
  records_ = std::move(records);
}

std::string ExpectationStore::dump() const {
  json j = json::object();
  for (const auto& [key, r] : records_) {
    json o = r.extra.is_object() ? r.extra : json::object();
    if (r.originator) o[kOriginator] = *r.originator;
    if (r.assessment_type) o[kAssessmentType] = to_string(*r.assessment_type);
    if (r.last_updated) o[kLastUpdated] = *r.last_updated;
    j[key] = std::move(o);
  }
  // invalid UTF-8 in a key becomes U+FFFD rather than failing the whole save
  return j.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

void ExpectationStore::save() const {
  try {
    replace_file(storePath_, dump());
  } catch (const std::exception& e) {
    throw StoreWriteError("cannot write store " + storePath_ + ": " + e.what());
  }
  spdlog::debug("wrote {} record(s) to {}", records_.size(), storePath_);
}

// -------- mapping --------

std::optional<ExpectationRecord> ExpectationStore::get(const std::string& key) const {
  if (auto it = records_.find(key); it != records_.end()) return it->second;
  return std::nullopt;
}

void ExpectationStore::set(const std::string& key, ExpectationRecord record) {
  records_[key] = std::move(record);
}

bool ExpectationStore::remove(const std::string& key) {
  return records_.erase(key) != 0;
}

std::vector<std::string> ExpectationStore::keys() const {
  std::vector<std::string> out;
  out.reserve(records_.size());
  for (const auto& kv : records_) out.push_back(kv.first);
  return out;
}

// -------- key resolution --------

ResolvedKey ExpectationStore::resolve(const std::string& path) const {
  const std::string normalized = normalize_path(path);
  const std::string expanded = expand_home(normalized, home_);

  std::vector<std::string> candidates{path, normalized, expanded};
  std::string relative = normalized;
  if (substituteHome_) {
    relative = home_relative(normalized, home_);
    if (relative != normalized) candidates.push_back(relative);
  }

  for (const auto& c : candidates) {
    if (contains(c)) {
      spdlog::debug("resolved '{}' to existing key '{}'", path, c);
      return {expanded, c};
    }
  }
  spdlog::debug("'{}' is untracked, proposed key '{}'", path, relative);
  return {expanded, relative};
}

} // namespace sigdrift
