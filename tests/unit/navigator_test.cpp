#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "framewalk/common/diagnostic.hpp"
#include "framewalk/frame/execution_context.hpp"
#include "framewalk/navigation/frame_stack.hpp"
#include "framewalk/navigation/navigator.hpp"
#include "framewalk/navigation/stack_registry.hpp"
#include "tests/common/fake_context.hpp"

namespace framewalk::navigation {
namespace {

using test::FakeCallChain;

// Records every anchor call.
class RecordingBinding : public HostBinding {
 public:
  void AnchorAt(const frame::ExecutionContext& context, size_t index) override {
    anchors.emplace_back(&context, index);
  }

  std::vector<std::pair<const frame::ExecutionContext*, size_t>> anchors;
};

class NavigatorTest : public ::testing::Test {
 protected:
  void Register(size_t cursor = 0) {
    auto stack = FrameStack::Create(chain_.Frames(), cursor);
    ASSERT_TRUE(stack.has_value());
    registry_.Push(kSession, std::move(*stack));
  }

  [[nodiscard]] auto Cursor() const -> size_t {
    return registry_.ActiveStack(kSession)->CurrentIndex();
  }

  static constexpr const char* kSession = "s1";

  FakeCallChain chain_{5};
  StackRegistry registry_;
  RecordingBinding binding_;
  Navigator navigator_{registry_, kSession, &binding_};
};

// =============================================================================
// up
// =============================================================================

TEST_F(NavigatorTest, UpMovesTowardOlderFrames) {
  Register();
  auto report = navigator_.Up();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->index, 1);
  EXPECT_TRUE(report->moved);
  EXPECT_FALSE(report->clamped);
  EXPECT_EQ(report->text, "#1  f1 <App#f1(x)>\n      in main @ app.rb:11");
  EXPECT_EQ(Cursor(), 1);
}

TEST_F(NavigatorTest, UpClampsAtLastFrame) {
  Register(3);
  auto report = navigator_.Up(10);
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->index, 4);
  EXPECT_TRUE(report->clamped);
  EXPECT_EQ(Cursor(), 4);
}

TEST_F(NavigatorTest, UpAtLastFrameStaysAndReanchors) {
  Register(4);
  auto report = navigator_.Up();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->index, 4);
  ASSERT_EQ(binding_.anchors.size(), 1);
  EXPECT_EQ(binding_.anchors[0].second, 4);
}

TEST_F(NavigatorTest, UpWithNegativeCountMovesDown) {
  Register(3);
  auto report = navigator_.Up(-2);
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(Cursor(), 1);
}

TEST_F(NavigatorTest, UpNegativePastBottomFails) {
  Register(1);
  auto report = navigator_.Up(-3);
  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error().Kind(), DiagKind::kBelowBottom);
  EXPECT_EQ(Cursor(), 1);
  EXPECT_TRUE(binding_.anchors.empty());
}

TEST_F(NavigatorTest, UpHugeCountDoesNotOverflow) {
  Register(2);
  auto report = navigator_.Up(std::numeric_limits<int64_t>::max());
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(Cursor(), 4);
}

// =============================================================================
// down
// =============================================================================

TEST_F(NavigatorTest, DownMovesTowardNewerFrames) {
  Register(3);
  auto report = navigator_.Down(2);
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->index, 1);
  EXPECT_EQ(Cursor(), 1);
}

TEST_F(NavigatorTest, DownBelowBottomFailsAndKeepsCursor) {
  Register(2);
  auto report = navigator_.Down(5);
  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error().Kind(), DiagKind::kBelowBottom);
  EXPECT_EQ(report.error().Message(), "At bottom of stack, cannot go further!");
  EXPECT_EQ(Cursor(), 2);
  EXPECT_TRUE(binding_.anchors.empty());
}

TEST_F(NavigatorTest, DownAtBottomFails) {
  Register();
  auto report = navigator_.Down();
  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error().Kind(), DiagKind::kBelowBottom);
  EXPECT_EQ(Cursor(), 0);
}

TEST_F(NavigatorTest, DownHugeNegativeCountDoesNotOverflow) {
  Register(1);
  auto report = navigator_.Down(std::numeric_limits<int64_t>::min());
  // down(min) is up(max) with no clamp, which is out of range
  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(Cursor(), 1);
}

TEST_F(NavigatorTest, UpThenDownIsIdentityWithinRange) {
  for (size_t start = 0; start < 5; ++start) {
    for (size_t n = 0; start + n < 5; ++n) {
      registry_.EndSession(kSession);
      Register(start);
      ASSERT_TRUE(navigator_.Up(static_cast<int64_t>(n)).has_value());
      ASSERT_TRUE(navigator_.Down(static_cast<int64_t>(n)).has_value());
      EXPECT_EQ(Cursor(), start) << "start=" << start << " n=" << n;
    }
  }
}

// =============================================================================
// frame
// =============================================================================

TEST_F(NavigatorTest, FrameJumpsToIndex) {
  Register();
  auto report = navigator_.Frame(3);
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->index, 3);
  EXPECT_EQ(Cursor(), 3);
}

TEST_F(NavigatorTest, FrameNegativeCountsFromEnd) {
  Register();
  auto last = navigator_.Frame(-1);
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(Cursor(), 4);

  auto first = navigator_.Frame(-5);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(Cursor(), 0);
}

TEST_F(NavigatorTest, FrameOutOfRangeReportsTypedIndex) {
  Register(2);
  auto past = navigator_.Frame(5);
  ASSERT_FALSE(past.has_value());
  EXPECT_EQ(past.error().Kind(), DiagKind::kOutOfRange);
  EXPECT_EQ(
      past.error().Message(),
      "frame index 5 out of range (stack has 5 frames)");

  auto before = navigator_.Frame(-6);
  ASSERT_FALSE(before.has_value());
  EXPECT_EQ(
      before.error().Message(),
      "frame index -6 out of range (stack has 5 frames)");
  EXPECT_EQ(Cursor(), 2);
  EXPECT_TRUE(binding_.anchors.empty());
}

TEST_F(NavigatorTest, FrameWithoutIndexIsReadOnly) {
  Register(2);
  auto report = navigator_.Frame(std::nullopt);
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->index, 2);
  EXPECT_FALSE(report->moved);
  EXPECT_EQ(report->text, "#2  f2 <App#f2(x)>\n      in main @ app.rb:12");
  EXPECT_TRUE(binding_.anchors.empty());
}

// =============================================================================
// show-stack
// =============================================================================

TEST_F(NavigatorTest, ShowStackListsAllFramesWithMarker) {
  Register(1);
  auto result = navigator_.ShowStack({});
  EXPECT_TRUE(result.has_stack);
  EXPECT_EQ(result.total, 5);
  EXPECT_EQ(
      result.text,
      "Showing all accessible frames in stack (5 in total):\n"
      "--\n"
      "   #0  f0 <App#f0(x)>\n"
      "=> #1  f1 <App#f1(x)>\n"
      "   #2  f2 <App#f2(x)>\n"
      "   #3  f3 <App#f3(x)>\n"
      "   #4  f4 <App#f4(x)>");
}

TEST_F(NavigatorTest, ShowStackHead) {
  Register();
  auto result = navigator_.ShowStack({.head = 2, .tail = std::nullopt});
  EXPECT_EQ(
      result.text,
      "Showing all accessible frames in stack (5 in total):\n"
      "--\n"
      "=> #0  f0 <App#f0(x)>\n"
      "   #1  f1 <App#f1(x)>");
}

TEST_F(NavigatorTest, ShowStackTailKeepsOriginalIndices) {
  Register();
  auto result = navigator_.ShowStack({.head = std::nullopt, .tail = 2});
  EXPECT_EQ(
      result.text,
      "Showing all accessible frames in stack (5 in total):\n"
      "--\n"
      "   #3  f3 <App#f3(x)>\n"
      "   #4  f4 <App#f4(x)>");
}

TEST_F(NavigatorTest, ShowStackHeadWinsOverTail) {
  Register();
  auto result = navigator_.ShowStack({.head = 1, .tail = 3});
  EXPECT_NE(result.text.find("#0 "), std::string::npos);
  EXPECT_EQ(result.text.find("#4 "), std::string::npos);
}

TEST_F(NavigatorTest, ShowStackCountsLargerThanStack) {
  Register();
  auto head = navigator_.ShowStack({.head = 50, .tail = std::nullopt});
  auto tail = navigator_.ShowStack({.head = std::nullopt, .tail = 50});
  auto full = navigator_.ShowStack({});
  EXPECT_EQ(head.text, full.text);
  EXPECT_EQ(tail.text, full.text);
}

TEST_F(NavigatorTest, ShowStackVerbose) {
  Register();
  auto result = navigator_.ShowStack(
      {.head = 1, .tail = std::nullopt, .verbose = true});
  EXPECT_EQ(
      result.text,
      "Showing all accessible frames in stack (5 in total):\n"
      "--\n"
      "=> #0  f0 <App#f0(x)>\n      in main @ app.rb:10");
}

TEST_F(NavigatorTest, ShowStackDoesNotMoveOrAnchor) {
  Register(3);
  (void)navigator_.ShowStack({});
  EXPECT_EQ(Cursor(), 3);
  EXPECT_TRUE(binding_.anchors.empty());
}

TEST_F(NavigatorTest, ShowStackRendersEachFrameOnce) {
  Register();
  (void)navigator_.ShowStack({});
  size_t calls = chain_.Context(2).TotalCalls();
  (void)navigator_.ShowStack({});
  (void)navigator_.ShowStack({});
  EXPECT_EQ(chain_.Context(2).TotalCalls(), calls);
}

// =============================================================================
// No stack
// =============================================================================

TEST_F(NavigatorTest, NavigationWithoutStackFails) {
  for (auto report :
       {navigator_.Up(), navigator_.Down(), navigator_.Frame(0),
        navigator_.Frame(std::nullopt)}) {
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().Kind(), DiagKind::kNoContext);
    EXPECT_EQ(report.error().Message(), "Nowhere to go!");
  }
}

TEST_F(NavigatorTest, ShowStackWithoutStackIsInformational) {
  auto result = navigator_.ShowStack({});
  EXPECT_FALSE(result.has_stack);
  EXPECT_EQ(result.text, "No caller stack available!");
}

// =============================================================================
// Host binding and nesting
// =============================================================================

TEST_F(NavigatorTest, MovesAnchorSelectedContext) {
  Register();
  ASSERT_TRUE(navigator_.Up(2).has_value());
  ASSERT_TRUE(navigator_.Down().has_value());
  ASSERT_TRUE(navigator_.Frame(-1).has_value());

  ASSERT_EQ(binding_.anchors.size(), 3);
  EXPECT_EQ(binding_.anchors[0].first, &chain_.Context(2));
  EXPECT_EQ(binding_.anchors[1].first, &chain_.Context(1));
  EXPECT_EQ(binding_.anchors[2].first, &chain_.Context(4));
  EXPECT_EQ(binding_.anchors[2].second, 4);
}

TEST_F(NavigatorTest, NavigatorWithoutBinding) {
  Register();
  Navigator plain(registry_, kSession);
  ASSERT_TRUE(plain.Up().has_value());
  EXPECT_EQ(Cursor(), 1);
}

TEST_F(NavigatorTest, OperatesOnInnermostStack) {
  Register(2);
  FakeCallChain inner(2);
  auto nested = FrameStack::Create(inner.Frames());
  ASSERT_TRUE(nested.has_value());
  registry_.Push(kSession, std::move(*nested));

  ASSERT_TRUE(navigator_.Up(5).has_value());
  EXPECT_EQ(Cursor(), 1);

  registry_.Pop(kSession);
  EXPECT_EQ(Cursor(), 2);
}

TEST_F(NavigatorTest, OtherSessionIsUntouched) {
  Register();
  auto other = FrameStack::Create(chain_.Frames());
  ASSERT_TRUE(other.has_value());
  FrameStack& other_stack = registry_.Push("s2", std::move(*other));

  ASSERT_TRUE(navigator_.Up(3).has_value());
  EXPECT_EQ(other_stack.CurrentIndex(), 0);
}

// Five frames, cursor 0: up 2, down 1, frame -1, down 10, show-stack -H 2.
TEST_F(NavigatorTest, WalkThroughFiveFrames) {
  Register();

  ASSERT_TRUE(navigator_.Up(2).has_value());
  EXPECT_EQ(Cursor(), 2);
  ASSERT_TRUE(navigator_.Down(1).has_value());
  EXPECT_EQ(Cursor(), 1);
  ASSERT_TRUE(navigator_.Frame(-1).has_value());
  EXPECT_EQ(Cursor(), 4);

  auto too_far = navigator_.Down(10);
  ASSERT_FALSE(too_far.has_value());
  EXPECT_EQ(too_far.error().Kind(), DiagKind::kBelowBottom);
  EXPECT_EQ(Cursor(), 4);

  auto listing = navigator_.ShowStack({.head = 2, .tail = std::nullopt});
  EXPECT_EQ(
      listing.text,
      "Showing all accessible frames in stack (5 in total):\n"
      "--\n"
      "   #0  f0 <App#f0(x)>\n"
      "   #1  f1 <App#f1(x)>");
}

}  // namespace
}  // namespace framewalk::navigation
