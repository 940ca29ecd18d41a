#include <thread>

#include <gtest/gtest.h>
#include <snipbox/paths.h>
#include <snipbox/pipeline.h>
#include <snipbox/artifacts.h>
#include "utils.h"

TEST(Submit, EmptySource) {
  size_t before = CountUnits();
  for (std::string source : {"", "   ", "\n\n\t \r\n"}) {
    SubmitResult res = Submit(source);
    EXPECT_EQ(res.outcome, Outcome::INVALID_INPUT);
    EXPECT_EQ(res.message, "No code provided");
    EXPECT_FALSE(res.unit);
  }
  EXPECT_EQ(CountUnits(), before);
}

TEST(Submit, OversizedSource) {
  long saved = kMaxSource;
  kMaxSource = 1;
  SubmitResult res = Submit(std::string(1025, '#'));
  EXPECT_EQ(res.outcome, Outcome::INVALID_INPUT);
  EXPECT_FALSE(res.unit);
  res = Submit(std::string(1024, '#'));
  EXPECT_EQ(res.outcome, Outcome::OK);
  ASSERT_TRUE(res.unit);
  Discard(*res.unit);
  kMaxSource = saved;
}

TEST(Submit, Accepted) {
  SubmitResult res = Submit("print('hello')\n");
  EXPECT_EQ(res.outcome, Outcome::OK);
  EXPECT_TRUE(res.message.empty());
  ASSERT_TRUE(res.unit);
  EXPECT_TRUE(LookupUnit(res.unit->Id()));
  Discard(*res.unit);
}

TEST(Submit, RejectedLeavesNothing) {
  size_t before = CountUnits();
  SubmitResult res = Submit("import os\nos.system('rm -rf /')\n");
  EXPECT_EQ(res.outcome, Outcome::REJECTED);
  EXPECT_EQ(res.message, "Potentially unsafe code detected: os.system(");
  EXPECT_FALSE(res.unit);
  EXPECT_EQ(CountUnits(), before);
}

// These never reach a sandbox, so they run unprivileged

TEST(Pipeline, RejectedUnitIsNeverRun) {
  SourceUnit unit = MaterializeOrDie("print(eval('1+1'))\n");
  ExecutionResult run = ::Run(unit);
  EXPECT_EQ(run.outcome, Outcome::REJECTED);
  EXPECT_FALSE(run.succeeded);
  EXPECT_EQ(run.output, "");
  EXPECT_EQ(run.exception, "Potentially unsafe code detected: eval(");

  CompileResult check = CheckSyntax(unit);
  EXPECT_EQ(check.outcome, Outcome::REJECTED);
  EXPECT_FALSE(check.accepted);
  EXPECT_EQ(check.diagnostic, "Potentially unsafe code detected: eval(");
  Discard(unit);
}

TEST(Pipeline, DiscardedUnitNotFound) {
  SourceUnit unit = MaterializeOrDie("print(1)\n");
  Discard(unit);
  ExecutionResult run = ::Run(unit);
  EXPECT_EQ(run.outcome, Outcome::NOT_FOUND);
  EXPECT_FALSE(run.succeeded);
  CompileResult check = CheckSyntax(unit);
  EXPECT_EQ(check.outcome, Outcome::NOT_FOUND);
  EXPECT_FALSE(check.accepted);
}

TEST(Pipeline, Reclaim) {
  auto now = std::chrono::system_clock::now();
  SourceUnit old_unit = MaterializeOrDie("print('old')\n");
  SourceUnit new_unit = MaterializeOrDie("print('new')\n");
  SetUnitAge(old_unit, now, kRetentionWindow + std::chrono::minutes(1));
  EXPECT_EQ(Reclaim(now), 1u);
  EXPECT_EQ(Reclaim(now), 0u);
  EXPECT_FALSE(LookupUnit(old_unit.Id()));
  EXPECT_TRUE(LookupUnit(new_unit.Id()));
  EXPECT_EQ(::Run(old_unit).outcome, Outcome::NOT_FOUND);
  Discard(new_unit);
}

TEST(Reaper, ReclaimsInBackground) {
  SourceUnit unit = MaterializeOrDie("print('old')\n");
  SetUnitAge(unit, std::chrono::system_clock::now(), kRetentionWindow + std::chrono::minutes(1));
  {
    Reaper reaper(std::chrono::seconds(3600));
    // the first sweep happens right after start
    for (int i = 0; i < 100 && LookupUnit(unit.Id()); i++) {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_FALSE(LookupUnit(unit.Id()));
  }
}

TEST(Reaper, StopIsPrompt) {
  auto start = std::chrono::steady_clock::now();
  Reaper reaper(std::chrono::seconds(3600));
  reaper.Stop();
  reaper.Stop();
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
}
