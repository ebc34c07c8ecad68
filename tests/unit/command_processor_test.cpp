#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "framewalk/common/diagnostic.hpp"
#include "framewalk/navigation/frame_stack.hpp"
#include "framewalk/navigation/navigator.hpp"
#include "framewalk/navigation/stack_registry.hpp"
#include "framewalk/repl/command_processor.hpp"
#include "framewalk/repl/output_sink.hpp"
#include "tests/common/fake_context.hpp"

namespace framewalk::repl {
namespace {

using navigation::FrameStack;
using test::FakeCallChain;

constexpr const char* kSession = "main";

class CommandProcessorTest : public ::testing::Test {
 protected:
  void Register(
      const FakeCallChain& chain, size_t cursor = 0,
      const frame::ExecutionContext* prior = nullptr) {
    auto stack = FrameStack::Create(chain.Frames(), cursor, prior);
    ASSERT_TRUE(stack.has_value());
    registry_.Push(kSession, std::move(*stack));
  }

  [[nodiscard]] auto Cursor() const -> size_t {
    return registry_.ActiveStack(kSession)->CurrentIndex();
  }

  FakeCallChain chain_{5};
  navigation::StackRegistry registry_;
  navigation::Navigator navigator_{registry_, kSession};
  BufferSink sink_;
  CommandProcessor processor_{navigator_, registry_, sink_, 3};
};

// =============================================================================
// Line splitting and lookup
// =============================================================================

TEST(SplitCommandLineTest, SplitsOnWhitespace) {
  EXPECT_EQ(
      SplitCommandLine("  show-stack\t-H  2 "),
      (std::vector<std::string>{"show-stack", "-H", "2"}));
  EXPECT_TRUE(SplitCommandLine("   ").empty());
}

TEST_F(CommandProcessorTest, BuiltinCommands) {
  EXPECT_EQ(
      processor_.CommandNames(),
      (std::vector<std::string>{
          "down", "exit", "frame", "help", "show-stack", "up"}));
  EXPECT_TRUE(processor_.HasCommand("bt"));
  EXPECT_TRUE(processor_.HasCommand("u"));
  EXPECT_FALSE(processor_.HasCommand("step"));
}

TEST_F(CommandProcessorTest, CompletionsIncludeShortcuts) {
  auto matches = processor_.Completions("d");
  EXPECT_EQ(matches, (std::vector<std::string>{"down", "d"}));
  EXPECT_EQ(
      processor_.Completions("sh"), (std::vector<std::string>{"show-stack"}));
}

TEST_F(CommandProcessorTest, RegisterCustomCommand) {
  processor_.RegisterCommand(
      {.name = "where",
       .shortcut = "w",
       .usage = "where",
       .description = "Print the current index",
       .handler = [this](auto /*args*/) -> Result<bool> {
         sink_.Write(std::to_string(Cursor()));
         return true;
       }});
  Register(chain_, 2);

  auto result = processor_.Execute("w");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(sink_.Output(), "2");
}

TEST_F(CommandProcessorTest, EmptyLineIsNoop) {
  auto result = processor_.Execute("   ");
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(*result);
  EXPECT_TRUE(sink_.Output().empty());
}

TEST_F(CommandProcessorTest, UnknownCommand) {
  auto result = processor_.Execute("step 1");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().Kind(), DiagKind::kUsage);
  EXPECT_EQ(result.error().Message(), "unknown command 'step'");
  ASSERT_EQ(result.error().notes.size(), 1);
}

// =============================================================================
// Navigation commands
// =============================================================================

TEST_F(CommandProcessorTest, UpAndDownWithCounts) {
  Register(chain_);

  ASSERT_TRUE(processor_.Execute("up 2").has_value());
  EXPECT_EQ(Cursor(), 2);
  ASSERT_TRUE(processor_.Execute("d").has_value());
  EXPECT_EQ(Cursor(), 1);
  ASSERT_TRUE(processor_.Execute("u").has_value());
  EXPECT_EQ(Cursor(), 2);

  EXPECT_EQ(
      sink_.Output(),
      "#2  f2 <App#f2(x)>\n      in main @ app.rb:12\n"
      "#1  f1 <App#f1(x)>\n      in main @ app.rb:11\n"
      "#2  f2 <App#f2(x)>\n      in main @ app.rb:12\n");
}

TEST_F(CommandProcessorTest, UpRejectsBadArguments) {
  Register(chain_);

  auto bad = processor_.Execute("up two");
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().Message(), "invalid number 'two' (usage: up [n])");

  auto extra = processor_.Execute("down 1 2");
  ASSERT_FALSE(extra.has_value());
  EXPECT_EQ(
      extra.error().Message(), "too many arguments (usage: down [n])");
  EXPECT_EQ(Cursor(), 0);
}

TEST_F(CommandProcessorTest, DownBelowBottomReportsError) {
  Register(chain_, 1);
  auto status = processor_.Process("down 3");
  EXPECT_TRUE(status.failed);
  EXPECT_TRUE(status.keep_running);
  EXPECT_EQ(sink_.Errors(), "At bottom of stack, cannot go further!\n");
  EXPECT_EQ(Cursor(), 1);
}

TEST_F(CommandProcessorTest, FrameCommand) {
  Register(chain_);

  ASSERT_TRUE(processor_.Execute("frame -1").has_value());
  EXPECT_EQ(Cursor(), 4);
  ASSERT_TRUE(processor_.Execute("f 1").has_value());
  EXPECT_EQ(Cursor(), 1);

  sink_.Clear();
  ASSERT_TRUE(processor_.Execute("frame").has_value());
  EXPECT_EQ(
      sink_.Output(), "#1  f1 <App#f1(x)>\n      in main @ app.rb:11\n");
}

TEST_F(CommandProcessorTest, FrameRejectsBadIndex) {
  Register(chain_, 2);

  auto bad = processor_.Execute("frame x");
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().Message(), "invalid frame number 'x'");

  auto status = processor_.Process("frame 9");
  EXPECT_TRUE(status.failed);
  EXPECT_EQ(
      sink_.Errors(), "frame index 9 out of range (stack has 5 frames)\n");
  EXPECT_EQ(Cursor(), 2);
}

TEST_F(CommandProcessorTest, NoStackReportsNowhereToGo) {
  auto status = processor_.Process("up");
  EXPECT_TRUE(status.failed);
  EXPECT_EQ(sink_.Errors(), "Nowhere to go!\n");
}

// =============================================================================
// show-stack
// =============================================================================

TEST_F(CommandProcessorTest, ShowStackHeadWithCount) {
  Register(chain_);
  ASSERT_TRUE(processor_.Execute("show-stack -H 1").has_value());
  EXPECT_EQ(
      sink_.Output(),
      "Showing all accessible frames in stack (5 in total):\n"
      "--\n"
      "=> #0  f0 <App#f0(x)>\n");
}

TEST_F(CommandProcessorTest, ShowStackFlagWithoutCountUsesDefault) {
  Register(chain_);
  ASSERT_TRUE(processor_.Execute("bt -T").has_value());
  // Default count is 3 for this processor
  EXPECT_EQ(sink_.Output().find("#1 "), std::string::npos);
  EXPECT_NE(sink_.Output().find("#2 "), std::string::npos);
  EXPECT_NE(sink_.Output().find("#4 "), std::string::npos);
}

TEST_F(CommandProcessorTest, ShowStackVerboseAfterHead) {
  Register(chain_);
  ASSERT_TRUE(processor_.Execute("show-stack -H -v").has_value());
  EXPECT_NE(sink_.Output().find("in main @ app.rb:12"), std::string::npos);
  EXPECT_EQ(sink_.Output().find("#3 "), std::string::npos);
}

TEST_F(CommandProcessorTest, ShowStackRejectsUnknownOption) {
  Register(chain_);
  auto result = processor_.Execute("show-stack --all");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().Kind(), DiagKind::kUsage);
}

TEST_F(CommandProcessorTest, ShowStackRejectsBadCount) {
  Register(chain_);
  auto result = processor_.Execute("show-stack -H x");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().Message(), "invalid frame count 'x' for -H");
}

TEST_F(CommandProcessorTest, ShowStackWithoutStack) {
  auto status = processor_.Process("show-stack");
  EXPECT_FALSE(status.failed);
  EXPECT_EQ(sink_.Output(), "No caller stack available!\n");
}

// =============================================================================
// help and exit
// =============================================================================

TEST_F(CommandProcessorTest, HelpListsCommands) {
  ASSERT_TRUE(processor_.Execute("help").has_value());
  EXPECT_NE(sink_.Output().find("  show-stack   bt"), std::string::npos);
  EXPECT_NE(sink_.Output().find("  up           u "), std::string::npos);
}

TEST_F(CommandProcessorTest, HelpForOneCommand) {
  ASSERT_TRUE(processor_.Execute("h frame").has_value());
  EXPECT_EQ(sink_.Output().rfind("Usage: frame [n]\n", 0), 0);

  auto missing = processor_.Execute("help step");
  ASSERT_FALSE(missing.has_value());
}

TEST_F(CommandProcessorTest, ExitReturnsToEnclosingStack) {
  Register(chain_, 3);
  FakeCallChain inner(2);
  Register(inner);

  auto status = processor_.Process("exit");
  EXPECT_TRUE(status.keep_running);
  EXPECT_FALSE(status.failed);
  EXPECT_EQ(registry_.StackCount(kSession), 1);
  EXPECT_EQ(Cursor(), 3);
  EXPECT_EQ(
      sink_.Output(),
      "Returned to enclosing stack (1 remaining)\n"
      "#3  f3 <App#f3(x)>\n      in main @ app.rb:13\n");
}

TEST_F(CommandProcessorTest, ExitLastStackReturnsToPriorContext) {
  test::FakeContext prior(
      {}, "main", frame::SourceLocation{.file = "main.rb", .line = 42});
  Register(chain_, 0, &prior);

  auto status = processor_.Process("q");
  EXPECT_FALSE(status.keep_running);
  EXPECT_FALSE(status.failed);
  EXPECT_EQ(registry_.StackCount(kSession), 0);
  EXPECT_EQ(sink_.Output(), "Returned to prior context @ main.rb:42\n");
}

TEST_F(CommandProcessorTest, ExitWithoutStackStops) {
  auto status = processor_.Process("exit");
  EXPECT_FALSE(status.keep_running);
  EXPECT_FALSE(status.failed);
}

TEST_F(CommandProcessorTest, ProcessWritesNotes) {
  auto status = processor_.Process("jump");
  EXPECT_TRUE(status.failed);
  EXPECT_EQ(
      sink_.Errors(),
      "unknown command 'jump'\nnote: type 'help' for a list of commands\n");
}

}  // namespace
}  // namespace framewalk::repl
