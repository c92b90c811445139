#include "intcode/console.hpp"
#include "intcode/machine.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <string>

using namespace intcode;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST(ConsoleTest, BatchPrintsOutputsAndReadsMissingInput) {
  std::istringstream in("42\n");
  std::ostringstream out;
  Console console(Machine::from_text("3,0,4,0,104,7,99"), in, out);
  EXPECT_EQ(console.run_batch(), 0);
  EXPECT_EQ(out.str(), "42\n7\n");
}

TEST(ConsoleTest, BatchReportsExhaustedInput) {
  std::istringstream in("");
  std::ostringstream out;
  Console console(Machine::from_text("3,0,4,0,99"), in, out);
  EXPECT_EQ(console.run_batch(), 1);
  EXPECT_FALSE(console.machine().finished());
}

TEST(ConsoleTest, AsciiModeEchoesTextAndNumbers) {
  std::istringstream in("A\n");
  std::ostringstream out;
  Console console(Machine::from_text("104,72,104,105,104,10,3,50,4,50,104,2000,99"), in, out);
  EXPECT_EQ(console.run_ascii(), 0);
  EXPECT_EQ(out.str(), "Hi\nA2000\n");
  EXPECT_EQ(console.machine().pending_input(), 1u);   // el '\n' sobrante
}

TEST(ConsoleTest, SteppingShowsEachInstruction) {
  std::istringstream in("\n\n");
  std::ostringstream out;
  Console console(Machine::from_text("104,5,99"), in, out);
  EXPECT_EQ(console.run_stepping(), 0);
  EXPECT_TRUE(contains(out.str(), "out #5"));
  EXPECT_TRUE(contains(out.str(), ">> salida: 5"));
  EXPECT_TRUE(contains(out.str(), ">> FINISHED"));
}

TEST(ConsoleTest, SteppingQueuesInputAndContinues) {
  std::istringstream in("\ni 9\nc\n");
  std::ostringstream out;
  Console console(Machine::from_text("3,0,4,0,99"), in, out);
  EXPECT_EQ(console.run_stepping(), 0);
  EXPECT_TRUE(contains(out.str(), "esperando entrada"));
  EXPECT_TRUE(contains(out.str(), ">> salida: 9"));
  EXPECT_TRUE(console.machine().finished());
}

TEST(ConsoleTest, SteppingQuit) {
  std::istringstream in("r\nm 0 4\nq\n");
  std::ostringstream out;
  Console console(Machine::from_text("104,5,99"), in, out);
  EXPECT_EQ(console.run_stepping(), 1);
  EXPECT_TRUE(contains(out.str(), "REGISTROS [M0]"));
  EXPECT_EQ(console.machine().steps(), 0u);
}

TEST(ConsoleTest, SteppingRejectsNonPositiveMemoryCount) {
  std::istringstream in("m 0 -1\nm 0 0\nm 0 2\nq\n");
  std::ostringstream out;
  Console console(Machine::from_text("104,5,99"), in, out);
  EXPECT_EQ(console.run_stepping(), 1);
  EXPECT_TRUE(contains(out.str(), "n > 0"));
  EXPECT_TRUE(contains(out.str(), "104"));
}

TEST(ConsoleTest, SteppingClampsHugeMemoryCount) {
  std::istringstream in("m 0 99999999999\nq\n");
  std::ostringstream out;
  Console console(Machine::from_text("99"), in, out);
  EXPECT_EQ(console.run_stepping(), 1);
  EXPECT_TRUE(contains(out.str(), "4088:"));
  EXPECT_FALSE(contains(out.str(), "4096:"));
}
