#include <gtest/gtest.h>

#include "cantypes/CanMessage.hh"

namespace {

using namespace CanTypesN;

TEST(CanFd, ResizeToValidLengths) {
  size_t resized = 0;
  ASSERT_TRUE(CanFdResize(5, resized));
  EXPECT_EQ(resized, 5u);
  ASSERT_TRUE(CanFdResize(9, resized));
  EXPECT_EQ(resized, 12u);
  ASSERT_TRUE(CanFdResize(33, resized));
  EXPECT_EQ(resized, 48u);
  ASSERT_TRUE(CanFdResize(64, resized));
  EXPECT_EQ(resized, 64u);
  EXPECT_FALSE(CanFdResize(65, resized));
}

TEST(CanFd, DlcMapping) {
  EXPECT_EQ(LengthToDlc(8), 8);
  EXPECT_EQ(LengthToDlc(12), 9);
  EXPECT_EQ(LengthToDlc(64), 15);
  EXPECT_EQ(DlcToLength(13), 32u);
  EXPECT_EQ(DlcToLength(15), 64u);
}

TEST(CanMessage, ClassicFrame) {
  CanMessageC msg;
  ASSERT_TRUE(CanMessageC::Create(IdC::FromBits(0x123), ByteArrayT{1, 2, 3}, msg));
  EXPECT_FALSE(msg.IsCanFd());
  EXPECT_FALSE(msg.IsRemote());
  EXPECT_FALSE(msg.IsExtended());
  EXPECT_EQ(msg.Length(), 3u);
  EXPECT_EQ(msg.Dlc(), 3u);
  EXPECT_EQ(msg.Direct(), D_Transmit);
}

TEST(CanMessage, LongPayloadMakesCanFdFrame) {
  CanMessageC msg;
  ASSERT_TRUE(CanMessageC::Create(IdC::FromBits(0x18DA10F1), ByteArrayT(10, 0x55), msg));
  EXPECT_TRUE(msg.IsCanFd());
  EXPECT_TRUE(msg.IsExtended());
  ASSERT_EQ(msg.Length(), 12u);
  EXPECT_EQ(msg.Data()[9], 0x55);
  EXPECT_EQ(msg.Data()[10], 0x00);
  EXPECT_EQ(msg.Dlc(), 9u);

  EXPECT_FALSE(CanMessageC::Create(IdC::FromBits(0x1), ByteArrayT(65, 0), msg));
}

TEST(CanMessage, ClearingCanFdClearsFlags) {
  CanMessageC msg;
  ASSERT_TRUE(CanMessageC::Create(IdC::FromBits(0x10), ByteArrayT(16, 0), msg));
  msg.SetBitrateSwitch(true).SetEsi(true);
  EXPECT_TRUE(msg.IsBitrateSwitch());
  msg.SetCanFd(false);
  EXPECT_FALSE(msg.IsBitrateSwitch());
  EXPECT_FALSE(msg.IsEsi());
}

TEST(CanMessage, RemoteFrame) {
  CanMessageC msg;
  ASSERT_TRUE(CanMessageC::CreateRemote(IdC::FromBits(0x7FF), 4, msg));
  EXPECT_TRUE(msg.IsRemote());
  EXPECT_EQ(msg.Length(), 4u);
  EXPECT_TRUE(msg.Data().empty());
  EXPECT_FALSE(CanMessageC::CreateRemote(IdC::FromBits(0x7FF), 9, msg));
}

TEST(CanMessage, J1939View) {
  CanMessageC msg;
  ASSERT_TRUE(CanMessageC::Create(IdC::FromBits(0x0CF00400), ByteArrayT{0}, msg));
  EXPECT_EQ(msg.Id().Type(), IT_Can2B);
  EXPECT_EQ(msg.Id(P_J1939).Type(), IT_J1939);
  EXPECT_EQ(msg.Id(P_J1939).AsJ1939().Pgn(), 0xF004u);

  ASSERT_TRUE(CanMessageC::Create(IdC::FromBits(0x100), ByteArrayT{0}, msg));
  EXPECT_EQ(msg.Id(P_J1939).Type(), IT_Can2A);
}

TEST(CanMessage, AscFormat) {
  CanMessageC msg;
  ASSERT_TRUE(CanMessageC::Create(IdC::FromBits(0x123), ByteArrayT{0x01, 0x02}, msg));
  msg.SetTimestamp(1500).SetChannel("can0").SetDirect(D_Transmit);
  EXPECT_EQ(msg.ToString(), "1.500 can0      123     Tx d  2 01 02 ");

  CanMessageC ext;
  ASSERT_TRUE(CanMessageC::Create(IdC::FromBits(0x18DA10F1), ByteArrayT{0xff}, ext));
  ext.SetTimestamp(0).SetChannel("can1").SetDirect(D_Receive);
  EXPECT_EQ(ext.ToString(), "0.000 can1 18da10f1x    Rx d  1 ff ");
}

TEST(CanMessage, AscFormatCanFd) {
  CanMessageC msg;
  ASSERT_TRUE(CanMessageC::Create(IdC::FromBits(0x10), ByteArrayT(12, 0xab), msg));
  msg.SetBitrateSwitch(true).SetChannel("can0");
  std::string line = msg.ToString();
  EXPECT_EQ(line.find("0.000 CANFD can0 Tx       10 1 0  9 12 ab ab"), 0u);
  // FD flag plus bit rate switch.
  EXPECT_NE(line.find("    3000"), std::string::npos);
}

}  // namespace
