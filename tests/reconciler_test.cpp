#include <gtest/gtest.h>

#include <filesystem>
#include <map>
#include <memory>
#include <vector>

#include "TestUtil.hpp"
#include "core/Errors.hpp"
#include "services/reconcile/Reconciler.hpp"

using namespace sigdrift;

namespace {

const char* kStamp = "2024-06-01T12:00:00Z";

// Returns canned results per path and records every call.
class FakeAssessor : public Assessor {
public:
  struct Call {
    std::string path;
    AssessmentMode mode;
  };

  void accept(const std::string& path, const std::string& originator) {
    AssessmentResult r;
    r.properties = std::map<std::string, std::string>{{kOriginatorProperty, originator}};
    results_[path] = r;
  }
  void reject(const std::string& path, int status, const std::string& diagnostics) {
    AssessmentResult r;
    r.status = status;
    r.diagnostics = diagnostics;
    results_[path] = r;
  }
  void respond(const std::string& path, AssessmentResult r) { results_[path] = std::move(r); }

  AssessmentResult assess(const std::string& path, AssessmentMode mode) override {
    calls.push_back({path, mode});
    if (auto it = results_.find(path); it != results_.end()) return it->second;
    return AssessmentResult{1, std::nullopt, "no canned result for " + path};
  }

  std::vector<Call> calls;

private:
  std::map<std::string, AssessmentResult> results_;
};

class ReconcilerTest : public ::testing::Test {
protected:
  ReconcilerTest()
    : home_(tmp_.str("home")),
      storePath_(tmp_.str("state/expectations.json")) {
    std::filesystem::create_directories(home_);
  }

  // Writes raw store content, then loads a fresh store from it.
  ExpectationStore& openStore(const std::string& text, bool substituteHome = true) {
    if (!text.empty()) tmp_.touch("state/expectations.json", text);
    store_ = std::make_unique<ExpectationStore>(storePath_, home_, substituteHome);
    store_->load();
    return *store_;
  }

  RunReport run(const std::vector<std::string>& targets, bool add = false, bool freshen = false) {
    Reconciler r(*store_, assessor_, ReconcileOptions{add, freshen}, [] { return std::string(kStamp); });
    return r.run(targets);
  }

  std::string storeText() const { return test::slurp(storePath_); }
  bool storeExists() const { return std::filesystem::exists(storePath_); }

  test::TempDir tmp_;
  std::string home_;
  std::string storePath_;
  std::unique_ptr<ExpectationStore> store_;
  FakeAssessor assessor_;
};

std::string one_record(const std::string& key, const std::string& originator) {
  nlohmann::json j;
  j[key]["originator"] = originator;
  return j.dump();  // compact: any rewrite would reformat it
}

} // namespace

TEST_F(ReconcilerTest, ConfirmationIsIdempotent) {
  tmp_.touch("Applications/Foo.app/Contents/MacOS/Foo");
  const std::string bundle = tmp_.str("Applications/Foo.app");
  const std::string original = one_record(bundle, "id:ABCDEF1234");
  openStore(original);
  assessor_.accept(bundle, "Developer ID Application: Acme Inc. (ABCDEF1234)");

  for (int pass = 0; pass < 2; ++pass) {
    auto report = run({bundle});
    ASSERT_EQ(report.targets.size(), 1u);
    EXPECT_EQ(report.targets[0].outcome, Outcome::Verified);
    EXPECT_FALSE(report.changed);
    EXPECT_FALSE(report.failed());
    EXPECT_EQ(storeText(), original);
  }
  EXPECT_EQ(store_->get(bundle)->originator.value_or(""), "id:ABCDEF1234");
  EXPECT_FALSE(store_->get(bundle)->last_updated.has_value());
}

TEST_F(ReconcilerTest, UntrackedWithoutAddFails) {
  const std::string target = tmp_.touch("Applications/New.app");
  openStore("");
  assessor_.accept(target, "Developer ID Application: Acme Inc. (ABCDEF1234)");

  auto report = run({target});
  ASSERT_EQ(report.targets.size(), 1u);
  EXPECT_EQ(report.targets[0].outcome, Outcome::Failed);
  EXPECT_EQ(report.targets[0].message, "untracked, and adding is disabled");
  EXPECT_TRUE(report.failed());
  EXPECT_EQ(store_->size(), 0u);
  EXPECT_FALSE(storeExists());
  EXPECT_TRUE(assessor_.calls.empty());
}

TEST_F(ReconcilerTest, AddCreatesExactlyOneRecord) {
  const std::string target = tmp_.touch("Applications/New.app");
  openStore("");
  assessor_.accept(target, "Developer ID Application: Acme Inc. (ABCDEF1234)");

  auto report = run({target, target + "/"}, /*add=*/true);
  ASSERT_EQ(report.targets.size(), 2u);
  EXPECT_EQ(report.targets[0].outcome, Outcome::Created);
  EXPECT_EQ(report.targets[1].outcome, Outcome::Verified);
  EXPECT_TRUE(report.changed);
  EXPECT_FALSE(report.failed());

  ASSERT_EQ(store_->size(), 1u);
  auto rec = store_->get(target);
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->originator.value_or(""), "id:ABCDEF1234");
  EXPECT_EQ(rec->last_updated.value_or(""), kStamp);

  ExpectationStore reloaded(storePath_, home_, true);
  reloaded.load();
  EXPECT_EQ(reloaded.keys(), std::vector<std::string>{target});
}

TEST_F(ReconcilerTest, NonTeamIdentityStoredAsLiteral) {
  const std::string target = tmp_.touch("usr/bin/tool");
  openStore("");
  assessor_.accept(target, "Apple System");

  auto report = run({target}, /*add=*/true);
  EXPECT_EQ(report.targets[0].outcome, Outcome::Created);
  EXPECT_EQ(store_->get(target)->originator.value_or(""), "^Apple System$");
}

TEST_F(ReconcilerTest, DriftFailsInConfirmOnlyMode) {
  const std::string target = tmp_.touch("Applications/Foo.app");
  const std::string original = one_record(target, "id:AAAA");
  openStore(original);
  assessor_.accept(target, "Developer ID Application: Other Corp (BBBB)");

  auto report = run({target});
  ASSERT_EQ(report.targets.size(), 1u);
  EXPECT_EQ(report.targets[0].outcome, Outcome::Failed);
  EXPECT_NE(report.targets[0].message.find("Originator changed from id:AAAA to id:BBBB"), std::string::npos);
  EXPECT_FALSE(report.changed);
  EXPECT_EQ(store_->get(target)->originator.value_or(""), "id:AAAA");
  EXPECT_EQ(storeText(), original);
}

TEST_F(ReconcilerTest, DriftUpdatesWhenFreshening) {
  const std::string target = tmp_.touch("Applications/Foo.app");
  openStore(one_record(target, "id:AAAA"));
  assessor_.accept(target, "Developer ID Application: Other Corp (BBBB)");

  auto report = run({target}, /*add=*/false, /*freshen=*/true);
  ASSERT_EQ(report.targets.size(), 1u);
  EXPECT_EQ(report.targets[0].outcome, Outcome::Updated);
  EXPECT_EQ(report.targets[0].message, "Originator changing from id:AAAA to id:BBBB");
  EXPECT_TRUE(report.changed);
  EXPECT_FALSE(report.failed());

  EXPECT_EQ(store_->get(target)->originator.value_or(""), "id:BBBB");
  EXPECT_EQ(store_->get(target)->last_updated.value_or(""), kStamp);
  EXPECT_EQ(nlohmann::json::parse(storeText())[target]["originator"], "id:BBBB");
}

TEST_F(ReconcilerTest, FreshenWithoutDriftRefreshesTimestamp) {
  const std::string target = tmp_.touch("Applications/Foo.app");
  openStore(one_record(target, "id:AAAA"));
  assessor_.accept(target, "Developer ID Application: Acme (AAAA)");

  auto report = run({target}, false, true);
  EXPECT_EQ(report.targets[0].outcome, Outcome::Unchanged);
  EXPECT_EQ(report.targets[0].message, "No change");
  EXPECT_TRUE(report.changed);
  EXPECT_EQ(store_->get(target)->originator.value_or(""), "id:AAAA");
  EXPECT_EQ(store_->get(target)->last_updated.value_or(""), kStamp);
}

TEST_F(ReconcilerTest, MissingPatternCountsAsChanged) {
  const std::string target = tmp_.touch("Applications/Foo.app");
  nlohmann::json j;
  j[target] = nlohmann::json::object();
  openStore(j.dump());
  assessor_.accept(target, "Developer ID Application: Acme (AAAA)");

  auto report = run({target});
  EXPECT_EQ(report.targets[0].outcome, Outcome::Failed);
  EXPECT_NE(report.targets[0].message.find("from (none) to id:AAAA"), std::string::npos);

  report = run({target}, false, true);
  EXPECT_EQ(report.targets[0].outcome, Outcome::Updated);
  EXPECT_EQ(store_->get(target)->originator.value_or(""), "id:AAAA");
}

TEST_F(ReconcilerTest, BatchContinuesPastFailures) {
  const std::string a = tmp_.touch("a.app");
  const std::string b = tmp_.touch("b.app");
  const std::string c = tmp_.touch("c.app");
  nlohmann::json j;
  for (const auto& p : {a, b, c}) j[p]["originator"] = "id:AAAA";
  openStore(j.dump());
  assessor_.accept(a, "Acme (AAAA)");
  assessor_.reject(b, 3, "b.app: rejected");
  assessor_.accept(c, "Acme (AAAA)");

  auto report = run({a, b, c});
  ASSERT_EQ(report.targets.size(), 3u);
  EXPECT_EQ(report.targets[0].outcome, Outcome::Verified);
  EXPECT_EQ(report.targets[1].outcome, Outcome::Failed);
  EXPECT_EQ(report.targets[1].message, "assessment failed with status 3: b.app: rejected");
  EXPECT_EQ(report.targets[2].outcome, Outcome::Verified);
  EXPECT_EQ(assessor_.calls.size(), 3u);
  EXPECT_TRUE(report.failed());
  EXPECT_EQ(report.count(Outcome::Verified), 2u);
}

TEST_F(ReconcilerTest, ExplicitMissingTargetIsFatal) {
  openStore("");
  EXPECT_THROW(run({tmp_.str("not-there.app")}, true), TargetMissingError);
  EXPECT_FALSE(storeExists());
}

TEST_F(ReconcilerTest, StoreEnumerationSkipsVanishedPaths) {
  const std::string present = tmp_.touch("present.app");
  const std::string gone = tmp_.str("gone.app");
  nlohmann::json j;
  j[present]["originator"] = "id:AAAA";
  j[gone]["originator"] = "id:BBBB";
  openStore(j.dump());
  assessor_.accept(present, "Acme (AAAA)");

  auto report = run({});
  ASSERT_EQ(report.targets.size(), 2u);
  EXPECT_EQ(report.targets[0].key, gone);
  EXPECT_EQ(report.targets[0].outcome, Outcome::Skipped);
  EXPECT_EQ(report.targets[1].outcome, Outcome::Verified);
  EXPECT_FALSE(report.failed());
  ASSERT_EQ(assessor_.calls.size(), 1u);
  EXPECT_EQ(assessor_.calls[0].path, present);
}

TEST_F(ReconcilerTest, SuccessWithoutOriginatorIsFatal) {
  const std::string target = tmp_.touch("Applications/Foo.app");
  openStore(one_record(target, "id:AAAA"));
  AssessmentResult r;
  r.properties = std::map<std::string, std::string>{{"assessment:verdict", "true"}};
  assessor_.respond(target, r);

  EXPECT_THROW(run({target}), ContractError);

  assessor_.respond(target, AssessmentResult{});
  EXPECT_THROW(run({target}), ContractError);
}

TEST_F(ReconcilerTest, HomeTargetsUseExpandedPathAndPortableKey) {
  const std::string expanded = tmp_.touch("home/Applications/Mine.app");
  openStore("");
  assessor_.accept(expanded, "Developer ID Application: Me (MINE1)");

  auto report = run({"~/Applications/Mine.app"}, true);
  ASSERT_EQ(report.targets.size(), 1u);
  EXPECT_EQ(report.targets[0].outcome, Outcome::Created);
  EXPECT_EQ(report.targets[0].key, "~/Applications/Mine.app");
  ASSERT_EQ(assessor_.calls.size(), 1u);
  EXPECT_EQ(assessor_.calls[0].path, expanded);

  report = run({expanded});
  EXPECT_EQ(report.targets[0].key, "~/Applications/Mine.app");
  EXPECT_EQ(report.targets[0].outcome, Outcome::Verified);
  EXPECT_EQ(store_->size(), 1u);
}

TEST_F(ReconcilerTest, AssessmentModeFromRecordOrPath) {
  const std::string pane = tmp_.touch("home/Library/PreferencePanes/X.prefPane");
  const std::string tool = tmp_.touch("opt/tool");
  const std::string forced = tmp_.touch("opt/forced");
  nlohmann::json j;
  j["~/Library/PreferencePanes/X.prefPane"]["originator"] = "id:AAAA";
  j[tool]["originator"] = "id:AAAA";
  j[forced]["originator"] = "id:AAAA";
  j[forced]["assessment_type"] = "open";
  openStore(j.dump());
  for (const auto& p : {pane, tool, forced}) assessor_.accept(p, "Acme (AAAA)");

  auto report = run({});
  EXPECT_FALSE(report.failed());

  std::map<std::string, AssessmentMode> modes;
  for (const auto& c : assessor_.calls) modes[c.path] = c.mode;
  EXPECT_TRUE(modes.at(pane) == AssessmentMode::Open);
  EXPECT_TRUE(modes.at(tool) == AssessmentMode::Execute);
  EXPECT_TRUE(modes.at(forced) == AssessmentMode::Open);
}
