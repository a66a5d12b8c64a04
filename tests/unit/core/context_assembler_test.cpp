#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "docqa_core/context/context_assembler.hpp"
#include "../../common/utilities_test.hpp"

namespace docqa_core {

class ContextAssemblerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    chunks_ = docqa_tests::TestUtilities::create_test_chunks({"alpha", "bravo", "charlie", "delta"});
  }

  std::vector<Chunk> chunks_;
};

TEST_F(ContextAssemblerTest, JoinsChunksInGivenOrderWithSingleSpace) {
  ContextAssembler assembler(500);
  EXPECT_EQ(assembler.assemble(chunks_, {2, 0, 3}), "charlie alpha delta");
}

TEST_F(ContextAssemblerTest, EmptyOrderGivesEmptyContext) {
  ContextAssembler assembler(500);
  EXPECT_EQ(assembler.assemble(chunks_, {}), "");
}

TEST_F(ContextAssemblerTest, HardCutTruncatesMidWord) {
  ContextAssembler assembler(8);
  EXPECT_EQ(assembler.assemble(chunks_, {0, 1}), "alpha br");
}

TEST_F(ContextAssemblerTest, BudgetEqualToLengthKeepsEverything) {
  const std::string full = "alpha bravo";
  ContextAssembler assembler(full.size());
  EXPECT_EQ(assembler.assemble(chunks_, {0, 1}), full);
}

TEST_F(ContextAssemblerTest, OutputNeverExceedsBudget) {
  const std::vector<size_t> order = {3, 2, 1, 0};
  const std::string unbounded = "delta charlie bravo alpha";
  for (size_t budget = 1; budget <= unbounded.size() + 5; ++budget) {
    for (auto policy : {TruncationPolicy::HardCut, TruncationPolicy::ChunkBoundary}) {
      ContextAssembler assembler(budget, policy);
      std::string context = assembler.assemble(chunks_, order);
      EXPECT_LE(context.size(), budget);
      if (unbounded.size() <= budget) {
        EXPECT_EQ(context, unbounded);
      }
      if (policy == TruncationPolicy::HardCut) {
        EXPECT_EQ(context, unbounded.substr(0, budget));
      }
    }
  }
}

TEST_F(ContextAssemblerTest, ChunkBoundaryDropsChunksThatDoNotFit) {
  ContextAssembler assembler(14, TruncationPolicy::ChunkBoundary);
  // "alpha bravo" is 11 bytes; adding " charlie" would make 19
  EXPECT_EQ(assembler.assemble(chunks_, {0, 1, 2}), "alpha bravo");
}

TEST_F(ContextAssemblerTest, ChunkBoundaryStopsAtFirstChunkThatDoesNotFit) {
  ContextAssembler assembler(12, TruncationPolicy::ChunkBoundary);
  // "charlie" does not fit after "alpha"; the later "delta" is not considered
  EXPECT_EQ(assembler.assemble(chunks_, {0, 2, 3}), "alpha");
}

TEST_F(ContextAssemblerTest, ChunkBoundaryWithOversizedFirstChunkIsEmpty) {
  ContextAssembler assembler(3, TruncationPolicy::ChunkBoundary);
  EXPECT_EQ(assembler.assemble(chunks_, {0}), "");
}

TEST_F(ContextAssemblerTest, RepeatedPositionsAreRepeated) {
  ContextAssembler assembler(500);
  EXPECT_EQ(assembler.assemble(chunks_, {1, 1}), "bravo bravo");
}

TEST_F(ContextAssemblerTest, OutOfRangePositionThrows) {
  ContextAssembler assembler(500);
  EXPECT_THROW(assembler.assemble(chunks_, {0, 9}), std::out_of_range);
}

TEST_F(ContextAssemblerTest, OutOfRangePositionPastFullBudgetThrows) {
  for (auto policy : {TruncationPolicy::HardCut, TruncationPolicy::ChunkBoundary}) {
    ContextAssembler assembler(3, policy);
    EXPECT_THROW(assembler.assemble(chunks_, {0, 9}), std::out_of_range);
  }
}

TEST_F(ContextAssemblerTest, ZeroBudgetIsRejected) {
  EXPECT_THROW(ContextAssembler(0), ConfigurationError);
}

TEST(TruncationPolicyTest, RoundTripsThroughNames) {
  EXPECT_EQ(truncation_policy_from_string("hard_cut"), TruncationPolicy::HardCut);
  EXPECT_EQ(truncation_policy_from_string("chunk_boundary"), TruncationPolicy::ChunkBoundary);
  EXPECT_EQ(to_string(TruncationPolicy::HardCut), "hard_cut");
  EXPECT_EQ(to_string(TruncationPolicy::ChunkBoundary), "chunk_boundary");
  EXPECT_THROW(truncation_policy_from_string("word_boundary"), ConfigurationError);
}

}  // namespace docqa_core
