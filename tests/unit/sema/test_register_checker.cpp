// tests/unit/sema/test_register_checker.cpp - Unit tests for register access modes
//
#include <gtest/gtest.h>

#include <string>

#include "cnext/test_support/parse_helpers.hpp"

using cnext::test_support::TestModule;

namespace
{

const char * const k_uart = R"(
  register UART @ 0x40001000 {
    DATA: u32 rw @ 0x00,
    STATUS: u32 ro @ 0x04,
    TX: u8 wo @ 0x08,
    FLAGS: u32 w1c @ 0x0C,
    SET: u32 w1s @ 0x10,
  }
)";

std::string with_uart(const std::string & body)
{
  return std::string(k_uart) + body;
}

}  // namespace

TEST(SemaRegisterChecker, ReadWriteFieldAllowsEverything)
{
  TestModule m;
  EXPECT_TRUE(m.analyze(with_uart(R"(
    void f() {
      u32 v <- UART.DATA;
      UART.DATA <- v;
      UART.DATA +<- 1;
      UART.DATA[3] <- true;
    }
  )")));
}

TEST(SemaRegisterChecker, ReadOnlyFieldIsReadable)
{
  TestModule m;
  EXPECT_TRUE(m.analyze(with_uart(R"(
    u32 status() {
      return UART.STATUS;
    }
  )")));
}

TEST(SemaRegisterChecker, WritingReadOnlyFieldIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(with_uart(R"(
    void f() {
      UART.STATUS <- 0;
    }
  )")));
  EXPECT_EQ(m.diags.count_code("E1002"), 1U);
}

TEST(SemaRegisterChecker, ReadingWriteOnlyFieldIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(with_uart(R"(
    u8 f() {
      return UART.TX;
    }
  )")));
  EXPECT_TRUE(m.diags.has_code("E1001"));
}

TEST(SemaRegisterChecker, WholeWriteToWriteOnlyFieldIsAccepted)
{
  TestModule m;
  EXPECT_TRUE(m.analyze(with_uart(R"(
    void send(u8 byte) {
      UART.TX <- byte;
    }
  )")));
}

TEST(SemaRegisterChecker, WholeWriteToClearOnWriteFieldIsAccepted)
{
  TestModule m;
  EXPECT_TRUE(m.analyze(with_uart(R"(
    void clear_all() {
      UART.FLAGS <- 0xFFFFFFFF;
      UART.SET <- 1;
    }
  )")));
}

TEST(SemaRegisterChecker, BitRangeWriteToClearOnWriteFieldIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(with_uart(R"(
    void f() {
      UART.FLAGS[0, 4] <- 3;
    }
  )")));
  EXPECT_EQ(m.diags.count_code("E1003"), 1U);
  EXPECT_FALSE(m.diags.has_code("E1001"));
}

TEST(SemaRegisterChecker, SingleBitWriteToSetOnWriteFieldIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(with_uart(R"(
    void f() {
      UART.SET[2] <- true;
    }
  )")));
  EXPECT_TRUE(m.diags.has_code("E1003"));
}

TEST(SemaRegisterChecker, CompoundAssignToWriteOnlyFieldIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(with_uart(R"(
    void f() {
      UART.TX +<- 1;
    }
  )")));
  EXPECT_TRUE(m.diags.has_code("E1003"));
}

TEST(SemaRegisterChecker, UnknownFieldIsReported)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(with_uart(R"(
    void f() {
      UART.CTRL <- 1;
    }
  )")));
  EXPECT_TRUE(m.diags.has_code("E0420"));
}
