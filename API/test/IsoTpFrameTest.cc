#include <gtest/gtest.h>

#include "cantypes/IsoTpFrame.hh"
#include "cantypes/Util.hh"

namespace {

using namespace CanTypesN;

ByteArrayT Sequence(size_t len)
{
  ByteArrayT ret(len);
  for(size_t i = 0;i < len;i++)
    ret[i] = (uint8_t) i;
  return ret;
}

//! Decode and return the error code, IE_InvalidParam if decoding succeeded.
IsoTpErrorT DecodeError(const ByteArrayT &data,const IsoTpConfigC &config)
{
  try {
    CanIsoTpFrameC::Decode(data,config);
  } catch(ExceptionIsoTpC &ex) {
    return ex.Code();
  }
  ADD_FAILURE() << "Decode of " << BytesToHex(data) << "succeeded";
  return IE_InvalidParam;
}

TEST(FlowControlContext, SeparationTime) {
  EXPECT_EQ(FlowControlContextC(FCS_Continues, 0, 0x14).StMinMicroseconds(), 20000u);
  EXPECT_EQ(FlowControlContextC(FCS_Continues, 0, 0xF3).StMinMicroseconds(), 300u);
  EXPECT_FALSE(FlowControlContextC::IsValidStMin(0x80));
  EXPECT_FALSE(FlowControlContextC::IsValidStMin(0xFA));
  EXPECT_THROW(FlowControlContextC(FCS_Continues, 0, 0x80), ExceptionIsoTpC);
  IsoTpConfigC config;
  EXPECT_THROW(config.SetStMin(0xF0), ExceptionIsoTpC);
}

TEST(IsoTpFrame, SingleFrame) {
  IsoTpConfigC config;
  std::vector<CanIsoTpFrameC> frames = CanIsoTpFrameC::FromData(ByteArrayT{0x3E, 0x00}, config);
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0].Type(), FT_Single);
  EXPECT_EQ(frames[0].Encode(config), (ByteArrayT{0x02, 0x3E, 0x00, 0xAA, 0xAA, 0xAA, 0xAA, 0xAA}));

  CanIsoTpFrameC decoded = CanIsoTpFrameC::Decode(frames[0].Encode(config), config);
  EXPECT_EQ(decoded.Type(), FT_Single);
  EXPECT_EQ(decoded.Data(), (ByteArrayT{0x3E, 0x00}));
}

TEST(IsoTpFrame, SegmentedPayload) {
  IsoTpConfigC config;
  ByteArrayT data = Sequence(20);
  std::vector<CanIsoTpFrameC> frames = CanIsoTpFrameC::FromData(data, config);
  ASSERT_EQ(frames.size(), 3u);
  EXPECT_EQ(frames[0].Type(), FT_First);
  EXPECT_EQ(frames[0].Length(), 20u);
  EXPECT_EQ(frames[0].Encode(config), (ByteArrayT{0x10, 0x14, 0, 1, 2, 3, 4, 5}));
  EXPECT_EQ(frames[1].Sequence(), 1);
  EXPECT_EQ(frames[1].Encode(config), (ByteArrayT{0x21, 6, 7, 8, 9, 10, 11, 12}));
  EXPECT_EQ(frames[2].Sequence(), 2);
  EXPECT_EQ(frames[2].Encode(config), (ByteArrayT{0x22, 13, 14, 15, 16, 17, 18, 19}));

  // Eight bytes no longer fit in a single frame.
  EXPECT_EQ(CanIsoTpFrameC::FromData(Sequence(7), config).size(), 1u);
  frames = CanIsoTpFrameC::FromData(Sequence(8), config);
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_EQ(frames[1].Encode(config), (ByteArrayT{0x21, 6, 7, 0xAA, 0xAA, 0xAA, 0xAA, 0xAA}));
}

TEST(IsoTpFrame, SequenceWraps) {
  IsoTpConfigC config;
  std::vector<CanIsoTpFrameC> frames = CanIsoTpFrameC::FromData(Sequence(6 + 7 * 16), config);
  ASSERT_EQ(frames.size(), 17u);
  EXPECT_EQ(frames[15].Sequence(), 15);
  EXPECT_EQ(frames[16].Sequence(), 0);
  EXPECT_EQ(frames[16].Encode(config)[0], 0x20);
}

TEST(IsoTpFrame, LongPayloadUsesEscapedLength) {
  IsoTpConfigC config;
  std::vector<CanIsoTpFrameC> frames = CanIsoTpFrameC::FromData(ByteArrayT(5000, 0x11), config);
  EXPECT_EQ(frames[0].Encode(config), (ByteArrayT{0x10, 0x00, 0x00, 0x00, 0x13, 0x88, 0x11, 0x11}));
  CanIsoTpFrameC decoded = CanIsoTpFrameC::Decode(frames[0].Encode(config), config);
  EXPECT_EQ(decoded.Type(), FT_First);
  EXPECT_EQ(decoded.Length(), 5000u);
  EXPECT_EQ(decoded.Data().size(), 2u);

  // The 2004 standard is limited to 12 bit lengths.
  config.SetStandard(ITS_2004);
  try {
    CanIsoTpFrameC::FromData(ByteArrayT(0x1000, 0), config);
    FAIL() << "Expected an exception";
  } catch(ExceptionIsoTpC &ex) {
    EXPECT_EQ(ex.Code(), IE_LengthOutOfRange);
  }
  EXPECT_EQ(DecodeError(ByteArrayT{0x10, 0x00, 0x00, 0x00, 0x13, 0x88, 0x11, 0x11}, config), IE_InvalidPdu);
}

TEST(IsoTpFrame, EmptyPayload) {
  IsoTpConfigC config;
  try {
    CanIsoTpFrameC::FromData(ByteArrayT(), config);
    FAIL() << "Expected an exception";
  } catch(ExceptionIsoTpC &ex) {
    EXPECT_EQ(ex.Code(), IE_EmptyPdu);
  }
  EXPECT_EQ(DecodeError(ByteArrayT(), config), IE_EmptyPdu);
}

TEST(IsoTpFrame, DecodeErrors) {
  IsoTpConfigC config;
  // First frame must fill the CAN frame.
  EXPECT_EQ(DecodeError(ByteArrayT{0x10, 0x14, 0, 1, 2, 3, 4}, config), IE_InvalidDataLength);
  // Single frame claims more bytes than it carries.
  EXPECT_EQ(DecodeError(ByteArrayT{0x05, 1, 2}, config), IE_InvalidPdu);
  EXPECT_EQ(DecodeError(ByteArrayT(9, 0x01), config), IE_LengthOutOfRange);
  EXPECT_EQ(DecodeError(ByteArrayT{0x33, 0, 0}, config), IE_InvalidPdu);
  EXPECT_EQ(DecodeError(ByteArrayT{0x30, 0}, config), IE_InvalidDataLength);
  EXPECT_EQ(DecodeError(ByteArrayT{0x40, 0, 0, 0, 0, 0, 0, 0}, config), IE_InvalidPdu);
  EXPECT_EQ(DecodeError(ByteArrayT{0x00, 0x00, 0, 0, 0, 0, 0, 0}, config), IE_EmptyPdu);

  config.SetStandard(ITS_2004);
  EXPECT_EQ(DecodeError(ByteArrayT{0x00, 0x05, 1, 2, 3, 4, 5, 0xAA}, config), IE_InvalidPdu);
}

TEST(IsoTpFrame, DecodeEscapedSingleFrame) {
  IsoTpConfigC config;
  CanIsoTpFrameC frame = CanIsoTpFrameC::Decode(ByteArrayT{0x00, 0x05, 1, 2, 3, 4, 5, 0xAA}, config);
  EXPECT_EQ(frame.Type(), FT_Single);
  EXPECT_EQ(frame.Data(), (ByteArrayT{1, 2, 3, 4, 5}));
}

TEST(IsoTpFrame, DecodeConsecutiveAndFlowControl) {
  IsoTpConfigC config;
  CanIsoTpFrameC frame = CanIsoTpFrameC::Decode(ByteArrayT{0x25, 1, 2, 3, 4, 5, 6, 7}, config);
  EXPECT_EQ(frame.Type(), FT_Consecutive);
  EXPECT_EQ(frame.Sequence(), 5);
  EXPECT_EQ(frame.Data().size(), 7u);

  frame = CanIsoTpFrameC::Decode(ByteArrayT{0x30, 0x05, 0x14, 0xAA, 0xAA, 0xAA, 0xAA, 0xAA}, config);
  EXPECT_EQ(frame.Type(), FT_FlowControl);
  EXPECT_EQ(frame.Context().State(), FCS_Continues);
  EXPECT_EQ(frame.Context().BlockSize(), 5);
  EXPECT_EQ(frame.Context().StMin(), 0x14);

  frame = CanIsoTpFrameC::Decode(ByteArrayT{0x31, 0x00, 0x00}, config);
  EXPECT_EQ(frame.Context().State(), FCS_Wait);
}

TEST(IsoTpFrame, EncodeFlowControl) {
  IsoTpConfigC config;
  config.SetPadding(0x55).SetBlockSize(8).SetStMin(0x0A);
  EXPECT_EQ(CanIsoTpFrameC::DefaultFlowControl(config).Encode(config),
            (ByteArrayT{0x30, 0x08, 0x0A, 0x55, 0x55, 0x55, 0x55, 0x55}));
  EXPECT_EQ(CanIsoTpFrameC::FlowControl(FlowControlContextC(FCS_Overload, 0, 0)).Encode(config)[0], 0x32);
}

TEST(IsoTpFrame, CanFdFrames) {
  IsoTpConfigC config;
  config.SetCanFd(true);
  std::vector<CanIsoTpFrameC> frames = CanIsoTpFrameC::FromData(Sequence(20), config);
  ASSERT_EQ(frames.size(), 1u);
  ByteArrayT encoded = frames[0].Encode(config);
  ASSERT_EQ(encoded.size(), 24u);
  EXPECT_EQ(encoded[0], 0x00);
  EXPECT_EQ(encoded[1], 20);
  EXPECT_EQ(encoded[23], 0xAA);
  EXPECT_EQ(CanIsoTpFrameC::Decode(encoded, config).Data(), Sequence(20));

  frames = CanIsoTpFrameC::FromData(Sequence(100), config);
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_EQ(frames[0].Encode(config).size(), 64u);
  EXPECT_EQ(frames[1].Data().size(), 38u);
  EXPECT_EQ(frames[1].Encode(config).size(), 48u);
}

TEST(IsoTpFrame, IntoCanMessage) {
  IsoTpConfigC config;
  CanMessageC msg;
  ASSERT_TRUE(CanIsoTpFrameC::Single(ByteArrayT{0x10, 0x01}).IntoCanMessage(0x7E0, config, msg));
  EXPECT_EQ(msg.Id().Type(), IT_Can2A);
  EXPECT_EQ(msg.Id().AsRaw(), 0x7E0u);
  EXPECT_EQ(msg.Length(), 8u);
  EXPECT_FALSE(msg.IsCanFd());

  config.SetCanFd(true);
  ASSERT_TRUE(CanIsoTpFrameC::Single(ByteArrayT{0x10, 0x01}).IntoCanMessage(0x18DA10F1, config, msg));
  EXPECT_TRUE(msg.IsCanFd());
  EXPECT_TRUE(msg.IsExtended());
}

}  // namespace
