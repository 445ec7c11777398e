
#include "cantypes/IsoTpFrame.hh"
#include "cantypes/Util.hh"
#include "cantypes/Strings.hh"
#include <spdlog/fmt/fmt.h>

#define DODEBUG 0
#if DODEBUG
#define ONDEBUG(x) x
#else
#define ONDEBUG(x)
#endif

namespace CanTypesN {

  // Header sizes in bytes.
  static const size_t g_singleHeader = 1;
  static const size_t g_singleEscapeHeader = 2;
  static const size_t g_firstHeader = 2;
  static const size_t g_firstEscapeHeader = 6;
  static const size_t g_consecutiveHeader = 1;
  static const size_t g_flowControlSize = 3;

  // Largest payload with a 4 bit length.
  static const size_t g_singleNibbleMax = CAN_FRAME_MAX_SIZE - g_singleHeader;

  // Largest length that fits in a 12 bit first frame header.
  static const uint32_t g_firstShortMax = 0xFFF;

  size_t IsoTpSingleFrameCapacity(const IsoTpConfigC &config)
  {
    if(config.IsCanFd())
      return CANFD_FRAME_MAX_SIZE - g_singleEscapeHeader;
    return g_singleNibbleMax;
  }

  //! Pad to 8 bytes, or to the next CAN-FD length for longer frames.

  static void PadFrame(ByteArrayT &data,uint8_t padding)
  {
    size_t target = CAN_FRAME_MAX_SIZE;
    if(data.size() > CAN_FRAME_MAX_SIZE) {
      if(!CanFdResize(data.size(),target))
        throw ExceptionIsoTpC(IE_LengthOutOfRange,fmt::format("Frame of {} bytes is too long ",data.size()));
    }
    data.resize(target,padding);
  }

  // -----------------------------------------------------

  CanIsoTpFrameC CanIsoTpFrameC::Single(const ByteArrayT &data)
  {
    CanIsoTpFrameC ret;
    ret.m_type = FT_Single;
    ret.m_data = data;
    ret.m_length = (uint32_t) data.size();
    return ret;
  }

  CanIsoTpFrameC CanIsoTpFrameC::First(uint32_t length,const ByteArrayT &data)
  {
    CanIsoTpFrameC ret;
    ret.m_type = FT_First;
    ret.m_data = data;
    ret.m_length = length;
    return ret;
  }

  CanIsoTpFrameC CanIsoTpFrameC::Consecutive(uint8_t sequence,const ByteArrayT &data)
  {
    CanIsoTpFrameC ret;
    ret.m_type = FT_Consecutive;
    ret.m_data = data;
    ret.m_sequence = sequence & 0x0F;
    return ret;
  }

  CanIsoTpFrameC CanIsoTpFrameC::FlowControl(const FlowControlContextC &context)
  {
    CanIsoTpFrameC ret;
    ret.m_type = FT_FlowControl;
    ret.m_context = context;
    return ret;
  }

  CanIsoTpFrameC CanIsoTpFrameC::DefaultFlowControl(const IsoTpConfigC &config)
  {
    return FlowControl(FlowControlContextC(FCS_Continues,config.BlockSize(),config.StMin()));
  }

  // -----------------------------------------------------

  CanIsoTpFrameC CanIsoTpFrameC::Decode(const ByteArrayT &data,const IsoTpConfigC &config)
  {
    if(data.empty())
      throw ExceptionIsoTpC(IE_EmptyPdu,"Empty frame ");
    const size_t frameLen = data.size();
    const uint8_t byte0 = data[0];
    ONDEBUG(DefaultLogger()->info("Decoding {} ",BytesToHex(data)));

    switch(byte0 & 0xF0) {
    case FT_Single: {
      if(frameLen > config.MaxFrameSize())
        throw ExceptionIsoTpC(IE_LengthOutOfRange,fmt::format("Single frame of {} bytes is too long ",frameLen));
      size_t pduLen = byte0 & 0x0F;
      size_t offset = g_singleHeader;
      if(pduLen == 0) {
        // Length escape, the length is in the next byte.
        if(!config.IsCanFd() && config.Standard() != ITS_2016)
          throw ExceptionIsoTpC(IE_InvalidPdu,fmt::format("Single frame with zero length: {}",BytesToHex(data)));
        if(frameLen < g_singleEscapeHeader)
          throw ExceptionIsoTpC(IE_InvalidPdu,fmt::format("Truncated single frame: {}",BytesToHex(data)));
        pduLen = data[1];
        offset = g_singleEscapeHeader;
        if(pduLen == 0)
          throw ExceptionIsoTpC(IE_EmptyPdu,"Single frame with no data ");
      }
      if(frameLen < pduLen + offset)
        throw ExceptionIsoTpC(IE_InvalidPdu,fmt::format("Single frame shorter than its length {}: {}",pduLen,BytesToHex(data)));
      return Single(ByteArrayT(data.begin() + offset,data.begin() + offset + pduLen));
    }
    case FT_First: {
      if(frameLen != config.MaxFrameSize())
        throw ExceptionIsoTpC(IE_InvalidDataLength,fmt::format("First frame has {} bytes, expected {} ",frameLen,config.MaxFrameSize()));
      uint32_t pduLen = ((uint32_t) (byte0 & 0x0F) << 8) | data[1];
      size_t offset = g_firstHeader;
      if(pduLen == 0) {
        if(config.Standard() != ITS_2016)
          throw ExceptionIsoTpC(IE_InvalidPdu,fmt::format("First frame with zero length: {}",BytesToHex(data)));
        pduLen = ((uint32_t) data[2] << 24) | ((uint32_t) data[3] << 16) | ((uint32_t) data[4] << 8) | data[5];
        offset = g_firstEscapeHeader;
        if(pduLen == 0)
          throw ExceptionIsoTpC(IE_InvalidPdu,fmt::format("First frame with zero length: {}",BytesToHex(data)));
      }
      return First(pduLen,ByteArrayT(data.begin() + offset,data.end()));
    }
    case FT_Consecutive:
      return Consecutive(byte0 & 0x0F,ByteArrayT(data.begin() + g_consecutiveHeader,data.end()));
    case FT_FlowControl: {
      if(frameLen < g_flowControlSize)
        throw ExceptionIsoTpC(IE_InvalidDataLength,fmt::format("Flow control frame has {} bytes, expected {} ",frameLen,g_flowControlSize));
      uint8_t state = byte0 & 0x0F;
      if(state > FCS_Overload)
        throw ExceptionIsoTpC(IE_InvalidPdu,fmt::format("Unknown flow control state {} ",state));
      return FlowControl(FlowControlContextC((FlowControlStateT) state,data[1],data[2]));
    }
    default:
      break;
    }
    throw ExceptionIsoTpC(IE_InvalidPdu,fmt::format("Unknown frame type: {}",BytesToHex(data)));
  }

  // -----------------------------------------------------

  std::vector<CanIsoTpFrameC> CanIsoTpFrameC::FromData(const ByteArrayT &data,const IsoTpConfigC &config)
  {
    std::vector<CanIsoTpFrameC> ret;
    const size_t length = data.size();
    if(length == 0)
      throw ExceptionIsoTpC(IE_EmptyPdu,"No data to send ");
    if(length <= IsoTpSingleFrameCapacity(config)) {
      ret.push_back(Single(data));
      return ret;
    }
    if(length > config.MaxLength())
      throw ExceptionIsoTpC(IE_LengthOutOfRange,fmt::format("Payload of {} bytes exceeds the limit of {} ",length,config.MaxLength()));

    const size_t frameSize = config.MaxFrameSize();
    const size_t firstSize = frameSize - (length > g_firstShortMax ? g_firstEscapeHeader : g_firstHeader);
    const size_t consecutiveSize = frameSize - g_consecutiveHeader;

    ret.push_back(First((uint32_t) length,ByteArrayT(data.begin(),data.begin() + firstSize)));
    size_t offset = firstSize;
    uint8_t sequence = ISOTP_CONSECUTIVE_SEQUENCE_START;
    while(offset < length) {
      size_t len = Min(consecutiveSize,length - offset);
      ret.push_back(Consecutive(sequence,ByteArrayT(data.begin() + offset,data.begin() + offset + len)));
      offset += len;
      sequence = (sequence + 1) & 0x0F;
    }
    return ret;
  }

  // -----------------------------------------------------

  ByteArrayT CanIsoTpFrameC::Encode(const IsoTpConfigC &config) const
  {
    ByteArrayT ret;
    switch(m_type) {
    case FT_Single: {
      const size_t length = m_data.size();
      if(length == 0)
        throw ExceptionIsoTpC(IE_EmptyPdu,"Single frame with no data ");
      if(length > IsoTpSingleFrameCapacity(config))
        throw ExceptionIsoTpC(IE_LengthOutOfRange,fmt::format("{} bytes don't fit in a single frame ",length));
      if(length <= g_singleNibbleMax) {
        ret.push_back((uint8_t) (FT_Single | length));
      } else {
        ret.push_back(FT_Single);
        ret.push_back((uint8_t) length);
      }
      ret.insert(ret.end(),m_data.begin(),m_data.end());
      PadFrame(ret,config.Padding());
    } break;
    case FT_First: {
      if(m_length > g_firstShortMax) {
        if(config.Standard() != ITS_2016)
          throw ExceptionIsoTpC(IE_LengthOutOfRange,fmt::format("Length {} needs the 2016 standard ",m_length));
        ret.push_back(FT_First);
        ret.push_back(0);
        ret.push_back((uint8_t) (m_length >> 24));
        ret.push_back((uint8_t) (m_length >> 16));
        ret.push_back((uint8_t) (m_length >> 8));
        ret.push_back((uint8_t) m_length);
      } else {
        ret.push_back((uint8_t) (FT_First | (m_length >> 8)));
        ret.push_back((uint8_t) (m_length & 0xFF));
      }
      ret.insert(ret.end(),m_data.begin(),m_data.end());
      if(ret.size() > config.MaxFrameSize())
        throw ExceptionIsoTpC(IE_LengthOutOfRange,fmt::format("First frame of {} bytes is too long ",ret.size()));
      ret.resize(config.MaxFrameSize(),config.Padding());
    } break;
    case FT_Consecutive:
      ret.push_back((uint8_t) (FT_Consecutive | (m_sequence & 0x0F)));
      ret.insert(ret.end(),m_data.begin(),m_data.end());
      if(ret.size() > config.MaxFrameSize())
        throw ExceptionIsoTpC(IE_LengthOutOfRange,fmt::format("Consecutive frame of {} bytes is too long ",ret.size()));
      PadFrame(ret,config.Padding());
      break;
    case FT_FlowControl:
      ret.push_back((uint8_t) (FT_FlowControl | m_context.State()));
      ret.push_back(m_context.BlockSize());
      ret.push_back(m_context.StMin());
      PadFrame(ret,config.Padding());
      break;
    }
    return ret;
  }

  bool CanIsoTpFrameC::IntoCanMessage(uint32_t id,const IsoTpConfigC &config,CanMessageC &msg) const
  {
    ByteArrayT data = Encode(config);
    if(!CanMessageC::Create(IdC::FromBits(id),data,msg))
      return false;
    if(config.IsCanFd())
      msg.SetCanFd(true);
    return true;
  }

  std::string CanIsoTpFrameC::ToString() const
  {
    switch(m_type) {
    case FT_Single:
      return fmt::format("Single [{}]",BytesToHex(m_data));
    case FT_First:
      return fmt::format("First length={} [{}]",m_length,BytesToHex(m_data));
    case FT_Consecutive:
      return fmt::format("Consecutive seq={} [{}]",m_sequence,BytesToHex(m_data));
    case FT_FlowControl:
      return fmt::format("FlowControl state={} bs={} stmin=0x{:02X}",FlowControlStateToString(m_context.State()),m_context.BlockSize(),m_context.StMin());
    }
    return "Unknown";
  }

}
