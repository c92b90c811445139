#include "intcode/errors.hpp"
#include "intcode/memory.hpp"
#include <gtest/gtest.h>

using namespace intcode;

TEST(MemoryTest, ReadBeyondExtentIsZeroAndDoesNotGrow) {
  Memory mem(Program{1, 2, 3});
  EXPECT_EQ(mem.read(2), 3);
  EXPECT_EQ(mem.read(3), 0);
  EXPECT_EQ(mem.read(1'000'000), 0);
  EXPECT_EQ(mem.size(), 3u);
}

TEST(MemoryTest, WriteBeyondExtentZeroFillsGap) {
  Memory mem(Program{7});
  mem.write(5, 42);
  ASSERT_EQ(mem.size(), 6u);
  EXPECT_EQ(mem.cells(), (std::vector<Word>{7, 0, 0, 0, 0, 42}));
}

TEST(MemoryTest, NegativeAddressesFault) {
  Memory mem(Program{1});
  EXPECT_THROW(mem.read(-1), AddressError);
  EXPECT_THROW(mem.write(-7, 3), AddressError);
  try {
    mem.write(-7, 3);
    FAIL() << "se esperaba AddressError";
  } catch (const AddressError& e) {
    EXPECT_EQ(e.address(), -7);
  }
}

TEST(MemoryTest, CeilingRejectsWritesButNotReads) {
  Memory mem(Program{}, 16);
  mem.write(15, 1);
  EXPECT_THROW(mem.write(16, 1), AddressError);
  EXPECT_EQ(mem.read(1'000), 0);

  mem.set_limit(0);   // sin techo
  mem.write(100'000, 9);
  EXPECT_EQ(mem.read(100'000), 9);
}

TEST(MemoryTest, CopiesAreIndependent) {
  Memory a(Program{1, 2});
  Memory b = a;
  b.write(0, 99);
  b.write(10, 5);
  EXPECT_EQ(a.read(0), 1);
  EXPECT_EQ(a.size(), 2u);
  EXPECT_EQ(b.read(0), 99);
}
