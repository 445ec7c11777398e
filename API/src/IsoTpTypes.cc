
#include "cantypes/IsoTpTypes.hh"
#include "cantypes/Util.hh"
#include <spdlog/fmt/fmt.h>

namespace CanTypesN {

  FlowControlContextC::FlowControlContextC(FlowControlStateT state,uint8_t blockSize,uint8_t stMin)
    : m_state(state),
      m_blockSize(blockSize),
      m_stMin(stMin)
  {
    if(!IsValidStMin(stMin))
      throw ExceptionIsoTpC(IE_InvalidStMin,fmt::format("Invalid separation time 0x{:02X}",stMin));
  }

  uint32_t FlowControlContextC::StMinMicroseconds() const
  {
    if(m_stMin <= 0x7F)
      return (uint32_t) m_stMin * 1000;
    if(m_stMin >= 0xF1 && m_stMin <= 0xF9)
      return (uint32_t) (m_stMin - 0xF0) * 100;
    // Reserved values are treated as the longest time.
    return 0x7F * 1000;
  }

  // -----------------------------------------------------

  uint32_t ReadIdFromJSON(const Json::Value &value,const char *key,uint32_t defaultValue)
  {
    if(!value.isMember(key))
      return defaultValue;
    const Json::Value &entry = value[key];
    if(entry.isString()) {
      uint64_t id = 0;
      if(!ParseHex(entry.asString(),EFF_MASK,id))
        throw ExceptionBadConfigC(fmt::format("Invalid id '{}' for '{}'",entry.asString(),key));
      return (uint32_t) id;
    }
    if(entry.isUInt()) {
      unsigned id = entry.asUInt();
      if(id > EFF_MASK)
        throw ExceptionBadConfigC(fmt::format("Id {} for '{}' out of range",id,key));
      return id;
    }
    throw ExceptionBadConfigC(fmt::format("Id for '{}' must be a number or hex string",key));
  }

  bool ReadBoolFromJSON(const Json::Value &value,const char *key,bool defaultValue)
  {
    if(!value.isMember(key))
      return defaultValue;
    const Json::Value &entry = value[key];
    if(!entry.isBool())
      throw ExceptionBadConfigC(fmt::format("Value for '{}' must be true or false",key));
    return entry.asBool();
  }

  int ReadIntFromJSON(const Json::Value &value,const char *key,int defaultValue)
  {
    if(!value.isMember(key))
      return defaultValue;
    const Json::Value &entry = value[key];
    if(!entry.isInt())
      throw ExceptionBadConfigC(fmt::format("Value for '{}' must be an integer",key));
    return entry.asInt();
  }

  std::string ReadStringFromJSON(const Json::Value &value,const char *key,const std::string &defaultValue)
  {
    if(!value.isMember(key))
      return defaultValue;
    const Json::Value &entry = value[key];
    if(!entry.isString())
      throw ExceptionBadConfigC(fmt::format("Value for '{}' must be a string",key));
    return entry.asString();
  }

  static unsigned ReadByteFromJSON(const Json::Value &value,const char *key,unsigned defaultValue)
  {
    if(!value.isMember(key))
      return defaultValue;
    const Json::Value &entry = value[key];
    if(!entry.isUInt() || entry.asUInt() > 0xff)
      throw ExceptionBadConfigC(fmt::format("Value for '{}' must be in the range 0 to 255",key));
    return entry.asUInt();
  }

  void IsoTpAddressC::ConfigAsJSON(Json::Value &value) const
  {
    value["tx_id"] = fmt::format("0x{:X}",m_txId);
    value["rx_id"] = fmt::format("0x{:X}",m_rxId);
    value["fid"] = fmt::format("0x{:X}",m_fid);
  }

  void IsoTpAddressC::ConfigureFromJSON(const Json::Value &value)
  {
    if(!value.isMember("tx_id") || !value.isMember("rx_id"))
      throw ExceptionBadConfigC("ISO-TP address requires 'tx_id' and 'rx_id'");
    m_txId = ReadIdFromJSON(value,"tx_id",m_txId);
    m_rxId = ReadIdFromJSON(value,"rx_id",m_rxId);
    m_fid = ReadIdFromJSON(value,"fid",m_fid);
  }

  // -----------------------------------------------------

  IsoTpConfigC &IsoTpConfigC::SetStMin(uint8_t stMin)
  {
    if(!FlowControlContextC::IsValidStMin(stMin))
      throw ExceptionIsoTpC(IE_InvalidStMin,fmt::format("Invalid separation time 0x{:02X}",stMin));
    m_stMin = stMin;
    return *this;
  }

  void IsoTpConfigC::ConfigAsJSON(Json::Value &value) const
  {
    value["standard"] = m_standard == ITS_2016 ? "2016" : "2004";
    value["canfd"] = m_canFd;
    value["padding"] = (unsigned) m_padding;
    value["block_size"] = (unsigned) m_blockSize;
    value["st_min"] = (unsigned) m_stMin;
    value["timeout_ms"] = m_timeoutMs;
    value["responder"] = m_responder;
  }

  void IsoTpConfigC::ConfigureFromJSON(const Json::Value &value)
  {
    if(value.isMember("standard")) {
      const Json::Value &entry = value["standard"];
      std::string standard;
      if(entry.isInt())
        standard = std::to_string(entry.asInt());
      else if(entry.isString())
        standard = entry.asString();
      else
        throw ExceptionBadConfigC("Value for 'standard' must be 2004 or 2016");
      if(standard == "2004")
        m_standard = ITS_2004;
      else if(standard == "2016")
        m_standard = ITS_2016;
      else
        throw ExceptionBadConfigC(fmt::format("Unknown ISO-TP standard '{}'",standard));
    }
    m_canFd = ReadBoolFromJSON(value,"canfd",m_canFd);
    m_padding = (uint8_t) ReadByteFromJSON(value,"padding",m_padding);
    m_blockSize = (uint8_t) ReadByteFromJSON(value,"block_size",m_blockSize);
    unsigned stMin = ReadByteFromJSON(value,"st_min",m_stMin);
    if(!FlowControlContextC::IsValidStMin((uint8_t) stMin))
      throw ExceptionBadConfigC(fmt::format("Invalid separation time {}",stMin));
    m_stMin = (uint8_t) stMin;
    m_timeoutMs = ReadIntFromJSON(value,"timeout_ms",m_timeoutMs);
    if(m_timeoutMs <= 0)
      throw ExceptionBadConfigC("ISO-TP 'timeout_ms' must be positive");
    m_responder = ReadBoolFromJSON(value,"responder",m_responder);
  }

}
