#include "intcode/errors.hpp"
#include "intcode/pipeline.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace intcode;

namespace {

std::vector<std::vector<Word>> phases_of(const std::vector<Word>& phases) {
  std::vector<std::vector<Word>> primes;
  for (Word p : phases) primes.push_back({p});
  return primes;
}

// Una sola etapa sin entradas iniciales.
std::vector<std::vector<Word>> one_stage() { return std::vector<std::vector<Word>>(1); }

Word best_signal(const Machine& tmpl, std::vector<Word> phases, bool feedback) {
  std::sort(phases.begin(), phases.end());
  Word best = std::numeric_limits<Word>::min();
  do {
    Pipeline chain(tmpl, phases_of(phases), feedback);
    best = std::max(best, chain.run(0));
  } while (std::next_permutation(phases.begin(), phases.end()));
  return best;
}

const char* kChainA = "3,15,3,16,1002,16,10,16,1,16,15,15,4,15,99,0,0";
const char* kChainB = "3,23,3,24,1002,24,10,24,1002,23,-1,23,101,5,23,23,1,24,23,23,4,23,99,0,0";
const char* kLoop =
  "3,26,1001,26,-4,26,3,27,1002,27,2,27,1,27,26,27,4,27,1001,28,-1,28,1005,28,6,99,0,0,5";

} // namespace

TEST(PipelineTest, SequentialChain) {
  const Machine tmpl = Machine::from_text(kChainA);
  Pipeline chain(tmpl, phases_of({4, 3, 2, 1, 0}));
  EXPECT_EQ(chain.size(), 5u);
  EXPECT_EQ(chain.run(0), 43210);
  for (std::size_t i = 0; i < chain.size(); ++i)
    EXPECT_TRUE(chain.stage(i).finished());

  Pipeline other(Machine::from_text(kChainB), phases_of({0, 1, 2, 3, 4}));
  EXPECT_EQ(other.run(0), 54321);
}

TEST(PipelineTest, PermutationSearchOverClones) {
  const Machine tmpl = Machine::from_text(kChainA);
  EXPECT_EQ(best_signal(tmpl, {0, 1, 2, 3, 4}, false), 43210);
  // la plantilla nunca se ejecuta
  EXPECT_EQ(tmpl.steps(), 0u);
  EXPECT_EQ(tmpl.pc(), 0);
}

TEST(PipelineTest, FeedbackLoopRunsUntilLastStageFinishes) {
  const Machine tmpl = Machine::from_text(kLoop);
  Pipeline loop(tmpl, phases_of({9, 8, 7, 6, 5}), true);
  EXPECT_TRUE(loop.feedback());
  EXPECT_EQ(loop.run(0), 139629729);
}

TEST(PipelineTest, StarvedChainIsReported) {
  Pipeline chain(Machine::from_text("3,0,3,0,4,0,99"), one_stage());
  EXPECT_THROW(chain.run(1), ProtocolError);
}

TEST(PipelineTest, LastStageWithoutOutputIsReported) {
  Pipeline chain(Machine::from_text("3,0,99"), one_stage());
  EXPECT_THROW(chain.run(1), ProtocolError);
}

TEST(PipelineTest, RejectsEmptyChainAndBadStageIndex) {
  EXPECT_THROW(Pipeline(Machine::from_text("99"), {}), ProtocolError);
  Pipeline chain(Machine::from_text("3,0,4,0,99"), one_stage());
  EXPECT_THROW(chain.stage(3), std::out_of_range);
}

TEST(PipelineTest, SecondRunIsRejected) {
  Pipeline chain(Machine::from_text("3,0,4,0,99"), one_stage());
  EXPECT_EQ(chain.run(3), 3);
  try {
    chain.run(4);
    FAIL() << "se esperaba ProtocolError";
  } catch (const ProtocolError& e) {
    EXPECT_NE(std::string(e.what()).find("ya ejecutado"), std::string::npos);
  }
}
