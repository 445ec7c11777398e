#include <gtest/gtest.h>

#include "cantypes/J1939Message.hh"
#include "cantypes/J1939Address.hh"

namespace {

using namespace CanTypesN;

TEST(J1939Address, KnownNames) {
  EXPECT_TRUE(IsKnownAddress(JA_Brakes));
  EXPECT_EQ(AddressToString(JA_Retarder), "Retarder");
  EXPECT_EQ(AddressToByte(JA_ServiceTool), 249);
  EXPECT_EQ(AddressFromByte(0), JA_PrimaryEngineController);
}

TEST(J1939Address, UnknownValuesKeepTheirNumber) {
  J1939AddressT address = AddressFromByte(200);
  EXPECT_FALSE(IsKnownAddress(address));
  EXPECT_EQ(AddressToString(address), "Unknown(200)");
}

TEST(J1939Address, OptionalAddress) {
  DestinationAddressC none;
  EXPECT_FALSE(none.IsSet());
  J1939AddressT address;
  EXPECT_FALSE(none.Lookup(address));

  SourceAddressC source(11);
  ASSERT_TRUE(source.Lookup(address));
  EXPECT_EQ(address, JA_Brakes);
}

TEST(J1939Name, Fields) {
  // Arbitrary address capable, industry group 1, function 0x81, manufacturer 0x123, identity 0x1ABCD.
  uint64_t bits = (1ull << 63) | (1ull << 60) | (0x81ull << 40) | (0x123ull << 21) | 0x1ABCDull;
  NameFieldC name = NameFieldC::FromBits(bits);
  EXPECT_TRUE(name.ArbitraryAddressCapable());
  EXPECT_EQ(name.IndustryGroup(), 1);
  EXPECT_EQ(name.Function(), 0x81);
  EXPECT_EQ(name.ManufacturerCode(), 0x123);
  EXPECT_EQ(name.IdentityNumber(), 0x1ABCDu);
  EXPECT_EQ(name.IntoHex().size(), 16u);

  NameFieldC parsed;
  ASSERT_TRUE(NameFieldC::TryFromHex(name.IntoHex(), parsed));
  EXPECT_EQ(parsed, name);
  EXPECT_FALSE(NameFieldC::TryFromHex("not hex", parsed));
}

TEST(J1939Data, BytesArePaddedWithFF) {
  DataFieldC data;
  ASSERT_TRUE(DataFieldC::FromBytes(ByteArrayT{0x01, 0x02, 0x03}, data));
  EXPECT_EQ(data.IntoBits(), 0x010203FFFFFFFFFFull);
  EXPECT_EQ(data.Byte(0), 0x01);
  EXPECT_EQ(data.Byte(7), 0xFF);
  ByteArrayT bytes = data.IntoBytes();
  ASSERT_EQ(bytes.size(), 8u);
  EXPECT_EQ(bytes[2], 0x03);
  EXPECT_FALSE(DataFieldC::FromBytes(ByteArrayT(9, 0), data));
}

TEST(J1939Message, FromPartsRejectsStandardIds) {
  J1939MessageC msg;
  EXPECT_FALSE(J1939MessageC::FromParts(IdC::FromBits(0x123), J1939PduC(DataFieldC(0)), msg));

  ASSERT_TRUE(J1939MessageC::FromParts(IdC::FromBits(0x18FEF100), J1939PduC(DataFieldC(0x1122)), msg));
  EXPECT_EQ(msg.Id().Type(), IT_J1939);
  EXPECT_EQ(msg.Id().AsJ1939().Pgn(), 0xFEF1u);
  EXPECT_EQ(msg.Pdu().Type(), PT_Data);
  EXPECT_EQ(msg.Pdu().AsData().IntoBits(), 0x1122u);

  IdC id;
  J1939PduC pdu;
  msg.IntoParts(id, pdu);
  EXPECT_EQ(id.AsRaw(), 0x18FEF100u);
}

TEST(J1939Message, TryFromBitsChecksIdRange) {
  J1939MessageC msg;
  EXPECT_TRUE(J1939MessageC::TryFromBits(0x0CF00400, 0, PT_Data, msg));
  EXPECT_FALSE(J1939MessageC::TryFromBits(0x20000000, 0, PT_Data, msg));
  // The unchecked version masks to 29 bits.
  EXPECT_EQ(J1939MessageC::FromBits(0xFFFFFFFF, 0, PT_Name).Id().AsRaw(), 0x1FFFFFFFu);
}

TEST(J1939Message, FromHex) {
  J1939MessageC msg;
  ASSERT_TRUE(J1939MessageC::TryFromHex("18EAFFF9", "00EE00", PT_Data, msg));
  EXPECT_EQ(msg.Id().AsJ1939().PduFormat(), 0xEA);
  EXPECT_EQ(msg.Pdu().IntoBits(), 0xEE00u);
  EXPECT_FALSE(J1939MessageC::TryFromHex("18EAFFF9", "zz", PT_Data, msg));
  EXPECT_EQ(J1939MessageC::FromHex("xyz", "xyz", PT_Data).Id().AsRaw(), 0u);
}

}  // namespace
