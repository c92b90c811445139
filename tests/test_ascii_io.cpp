#include "intcode/errors.hpp"
#include "intcode/machine.hpp"
#include <gtest/gtest.h>
#include <deque>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace intcode;

namespace {

// Host por callbacks: entrega valores de una cola y registra las salidas.
class Recorder : public MachineIO {
public:
  explicit Recorder(std::deque<Word> feed) : feed_(std::move(feed)) {}

  Word input() override {
    if (feed_.empty()) throw ProtocolError("Recorder sin datos");
    const Word v = feed_.front();
    feed_.pop_front();
    ++requests;
    return v;
  }
  void output(Word value) override { seen.push_back(value); }

  std::vector<Word> seen;
  int requests = 0;

private:
  std::deque<Word> feed_;
};

// Eco infinito: lee un valor y lo devuelve.
constexpr const char* kEcho = "3,100,4,100,1105,1,0";

} // namespace

TEST(AsciiTest, AppendAsciiQueuesCharacterCodes) {
  Machine m = Machine::from_text(kEcho);
  m.append_ascii("hi\n");
  EXPECT_EQ(m.pending_input(), 3u);
  EXPECT_EQ(m.read_ascii(), std::optional<std::string>("hi\n"));
  EXPECT_FALSE(m.finished());
  EXPECT_EQ(m.pending_input(), 0u);
}

TEST(AsciiTest, StopsAtFirstNonAsciiValueWithoutConsumingIt) {
  Machine m = Machine::from_text("104,72,104,105,104,1000,104,33,99");
  EXPECT_EQ(m.read_ascii(), std::optional<std::string>("Hi"));
  ASSERT_TRUE(m.has_output());
  EXPECT_EQ(m.peek_output(), std::optional<Word>(1000));
  EXPECT_EQ(m.take_output(), 1000);
  EXPECT_EQ(m.read_ascii(), std::optional<std::string>("!"));
  EXPECT_TRUE(m.finished());
  EXPECT_EQ(m.read_ascii(), std::nullopt);
}

TEST(AsciiTest, NegativeValueIsNotText) {
  Machine m = Machine::from_text("104,-1,99");
  EXPECT_EQ(m.read_ascii(), std::nullopt);
  EXPECT_EQ(m.take_output(), -1);
}

TEST(AsciiTest, NothingPrintedBeforeInputIsNullopt) {
  Machine m = Machine::from_text("3,0,99");
  EXPECT_EQ(m.read_ascii(), std::nullopt);
  EXPECT_FALSE(m.finished());
}

TEST(MachineIOTest, CallbacksDriveMachineToCompletion) {
  Machine m = Machine::from_text("3,9,8,9,10,9,4,9,99,-1,8");
  Recorder io({8});
  m.run_with(io);
  EXPECT_TRUE(m.finished());
  EXPECT_EQ(io.seen, (std::vector<Word>{1}));
  EXPECT_EQ(io.requests, 1);
}

TEST(MachineIOTest, QueuedInputIsUsedBeforeAskingTheHost) {
  Machine m = Machine::from_text("3,0,3,1,1,0,1,2,4,2,99");
  m.append_input(40);
  Recorder io({2});
  m.run_with(io);
  EXPECT_EQ(io.seen, (std::vector<Word>{42}));
  EXPECT_EQ(io.requests, 1);
}

TEST(MachineIOTest, HostFaultPropagates) {
  Machine m = Machine::from_text(kEcho);
  Recorder io({1, 2});
  EXPECT_THROW(m.run_with(io), ProtocolError);
  EXPECT_EQ(io.seen, (std::vector<Word>{1, 2}));
}
