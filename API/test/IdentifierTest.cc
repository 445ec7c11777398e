#include <gtest/gtest.h>

#include "cantypes/Identifier.hh"
#include "cantypes/Util.hh"

namespace {

using namespace CanTypesN;

TEST(Can2A, RejectsMoreThanElevenBits) {
  Can2AC id;
  EXPECT_TRUE(Can2AC::TryFromBits(0x7FF, id));
  EXPECT_EQ(id.IntoBits(), 0x7FF);
  EXPECT_FALSE(Can2AC::TryFromBits(0x800, id));
  EXPECT_FALSE(Can2AC::TryFromHex("800", id));
  EXPECT_FALSE(Can2AC::TryFromHex("xyz", id));
}

TEST(Can2A, HexIsThreeDigitsUpperCase) {
  EXPECT_EQ(Can2AC::FromBits(0x7e).IntoHex(), "07E");
  EXPECT_EQ(Can2AC::FromHex("1ab").IntoBits(), 0x1AB);
  // Parse failures give zero.
  EXPECT_EQ(Can2AC::FromHex("zz").IntoBits(), 0);
}

TEST(Can2B, RejectsMoreThanTwentyNineBits) {
  Can2BC id;
  EXPECT_TRUE(Can2BC::TryFromBits(0x1FFFFFFF, id));
  EXPECT_FALSE(Can2BC::TryFromBits(0x20000000, id));
  EXPECT_TRUE(Can2BC::TryFromHex("0x18DA00F1", id));
  EXPECT_EQ(id.IntoBits(), 0x18DA00F1u);
  EXPECT_EQ(id.IntoHex(), "18DA00F1");
}

TEST(J1939Id, FieldsFromRawParts) {
  J1939IdC id;
  ASSERT_TRUE(J1939IdC::FromRawParts(6, false, false, 0xEA, 0x10, 0xF9, id));
  EXPECT_EQ(id.IntoBits(), 0x18EA10F9u);
  EXPECT_EQ(id.Priority(), 6);
  EXPECT_FALSE(id.Reserved());
  EXPECT_FALSE(id.DataPage());
  EXPECT_EQ(id.PduFormat(), 0xEA);
  EXPECT_EQ(id.PduSpecific(), 0x10);
  EXPECT_EQ(id.SourceAddress().Value(), 0xF9);
  EXPECT_TRUE(id.IsPdu1());
  ASSERT_TRUE(id.DestinationAddress().IsSet());
  EXPECT_EQ(id.DestinationAddress().Value(), 0x10);
  EXPECT_EQ(id.Pgn(), 0xEA00u);
}

TEST(J1939Id, BroadcastHasNoDestination) {
  J1939IdC id;
  ASSERT_TRUE(J1939IdC::FromRawParts(3, false, false, 0xF0, 0x04, 0x00, id));
  EXPECT_FALSE(id.IsPdu1());
  EXPECT_FALSE(id.DestinationAddress().IsSet());
  EXPECT_EQ(id.Pgn(), 0xF004u);
}

TEST(J1939Id, PriorityAboveSevenFails) {
  J1939IdC id;
  EXPECT_FALSE(J1939IdC::FromRawParts(8, false, false, 0, 0, 0, id));
}

TEST(Id, FromBitsPicksFormat) {
  IdC standard = IdC::FromBits(0x7E0);
  EXPECT_EQ(standard.Type(), IT_Can2A);
  EXPECT_FALSE(standard.IsExtended());

  IdC forced = IdC::FromBits(0x7E0, true);
  EXPECT_EQ(forced.Type(), IT_Can2B);
  // Extended frame format is only needed when the value doesn't fit in 11 bits.
  EXPECT_FALSE(forced.IsExtended());

  IdC extended = IdC::FromBits(0x18DAF110);
  EXPECT_EQ(extended.Type(), IT_Can2B);
  EXPECT_TRUE(extended.IsExtended());
  EXPECT_EQ(extended.AsRaw(), 0x18DAF110u);

  // Values are truncated to 29 bits.
  EXPECT_EQ(IdC::FromBits(0xFFFFFFFF).AsRaw(), 0x1FFFFFFFu);
}

TEST(Id, StandardIdOfExtended) {
  IdC extended = IdC::FromBits(0x18DAF110);
  IdC base = extended.StandardId();
  EXPECT_EQ(base.Type(), IT_Can2A);
  EXPECT_EQ(base.AsRaw(), (0x18DAF110u >> 18) & 0x7FF);
  EXPECT_EQ(IdC::FromBits(0x123).StandardId(), IdC::FromBits(0x123));
}

TEST(Id, TryFromHex) {
  IdC id;
  EXPECT_TRUE(IdC::TryFromHex("7DF", false, id));
  EXPECT_EQ(id, IdC(Can2AC(0x7DF)));
  EXPECT_TRUE(IdC::TryFromHex("7DF", true, id));
  EXPECT_EQ(id, IdC(Can2BC(0x7DF)));
  EXPECT_FALSE(IdC::TryFromHex("20000000", false, id));
  EXPECT_FALSE(IdC::TryFromHex("", false, id));
  EXPECT_EQ(IdC::FromHex("bogus"), IdC::FromBits(0));
}

TEST(Id, HexMatchesType) {
  EXPECT_EQ(IdC::FromBits(0x12).IntoHex(), "012");
  EXPECT_EQ(IdC::FromBits(0x12, true).IntoHex(), "00000012");
  EXPECT_EQ(IdC(J1939IdC(0x0CF00400)).IntoHex(), "0CF00400");
}

TEST(Util, ParseHexBytes) {
  ByteArrayT data;
  ASSERT_TRUE(ParseHexBytes("01 02:ff.A0", data));
  ASSERT_EQ(data.size(), 4u);
  EXPECT_EQ(data[0], 0x01);
  EXPECT_EQ(data[2], 0xFF);
  EXPECT_EQ(data[3], 0xA0);
  EXPECT_FALSE(ParseHexBytes("123", data));
  EXPECT_FALSE(ParseHexBytes("0g", data));
  EXPECT_EQ(BytesToHex(ByteArrayT{0x0a, 0xff}), "0a ff ");
}

}  // namespace
