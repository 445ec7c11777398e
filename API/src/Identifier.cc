
#include "cantypes/Identifier.hh"
#include "cantypes/Util.hh"
#include <spdlog/fmt/fmt.h>

namespace CanTypesN {

  // -----------------------------------------------------

  Can2AC Can2AC::FromHex(const std::string &hexStr)
  {
    uint64_t value = 0;
    if(!ParseHex(hexStr,0xFFFF,value))
      return Can2AC();
    return Can2AC((uint16_t) value);
  }

  bool Can2AC::TryFromBits(uint16_t bits,Can2AC &id)
  {
    if(bits > SFF_MASK)
      return false;
    id = Can2AC(bits);
    return true;
  }

  bool Can2AC::TryFromHex(const std::string &hexStr,Can2AC &id)
  {
    uint64_t value = 0;
    if(!ParseHex(hexStr,0xFFFF,value))
      return false;
    return TryFromBits((uint16_t) value,id);
  }

  std::string Can2AC::IntoHex() const
  {
    return fmt::format("{:03X}",m_bits);
  }

  // -----------------------------------------------------

  Can2BC Can2BC::FromHex(const std::string &hexStr)
  {
    uint64_t value = 0;
    if(!ParseHex(hexStr,0xFFFFFFFF,value))
      return Can2BC();
    return Can2BC((uint32_t) value);
  }

  bool Can2BC::TryFromBits(uint32_t bits,Can2BC &id)
  {
    if(bits > EFF_MASK)
      return false;
    id = Can2BC(bits);
    return true;
  }

  bool Can2BC::TryFromHex(const std::string &hexStr,Can2BC &id)
  {
    uint64_t value = 0;
    if(!ParseHex(hexStr,0xFFFFFFFF,value))
      return false;
    return TryFromBits((uint32_t) value,id);
  }

  std::string Can2BC::IntoHex() const
  {
    return fmt::format("{:08X}",m_bits);
  }

  // -----------------------------------------------------

  J1939IdC J1939IdC::FromHex(const std::string &hexStr)
  {
    uint64_t value = 0;
    if(!ParseHex(hexStr,0xFFFFFFFF,value))
      return J1939IdC();
    return J1939IdC((uint32_t) value);
  }

  bool J1939IdC::TryFromBits(uint32_t bits,J1939IdC &id)
  {
    if(bits > EFF_MASK)
      return false;
    id = J1939IdC(bits);
    return true;
  }

  bool J1939IdC::TryFromHex(const std::string &hexStr,J1939IdC &id)
  {
    uint64_t value = 0;
    if(!ParseHex(hexStr,0xFFFFFFFF,value))
      return false;
    return TryFromBits((uint32_t) value,id);
  }

  bool J1939IdC::FromRawParts(
      uint8_t priority,
      bool reserved,
      bool dataPage,
      uint8_t pduFormat,
      uint8_t pduSpecific,
      uint8_t sourceAddress,
      J1939IdC &id
      )
  {
    if(priority > 0x7)
      return false;
    uint32_t bits = ((uint32_t) priority << 26) |
                    ((uint32_t) (reserved ? 1 : 0) << 25) |
                    ((uint32_t) (dataPage ? 1 : 0) << 24) |
                    ((uint32_t) pduFormat << 16) |
                    ((uint32_t) pduSpecific << 8) |
                    (uint32_t) sourceAddress;
    id = J1939IdC(bits);
    return true;
  }

  std::string J1939IdC::IntoHex() const
  {
    return fmt::format("{:08X}",m_bits);
  }

  DestinationAddressC J1939IdC::DestinationAddress() const
  {
    if(!IsPdu1())
      return DestinationAddressC();
    return DestinationAddressC(PduSpecific());
  }

  uint32_t J1939IdC::Pgn() const
  {
    uint32_t pgn = ((uint32_t) (Reserved() ? 1 : 0) << 17) |
                   ((uint32_t) (DataPage() ? 1 : 0) << 16) |
                   ((uint32_t) PduFormat() << 8);
    // PDU2 format uses the specific byte as a group extension.
    if(!IsPdu1())
      pgn |= PduSpecific();
    return pgn;
  }

  // -----------------------------------------------------

  IdC IdC::FromBits(uint32_t bits,bool forceExtended)
  {
    if(bits <= SFF_MASK && !forceExtended)
      return IdC(Can2AC((uint16_t) bits));
    return IdC(Can2BC(bits & EFF_MASK));
  }

  IdC IdC::FromHex(const std::string &hexStr,bool forceExtended)
  {
    uint64_t value = 0;
    if(!ParseHex(hexStr,0xFFFFFFFF,value))
      value = 0;
    return FromBits((uint32_t) value,forceExtended);
  }

  bool IdC::TryFromHex(const std::string &hexStr,bool forceExtended,IdC &id)
  {
    uint64_t value = 0;
    if(!ParseHex(hexStr,EFF_MASK,value))
      return false;
    id = FromBits((uint32_t) value,forceExtended);
    return true;
  }

  IdC IdC::StandardId() const
  {
    if(m_type == IT_Can2A)
      return *this;
    // ID-28 to ID-18
    return IdC(Can2AC((uint16_t) ((m_bits >> 18) & SFF_MASK)));
  }

  bool IdC::IsExtended() const
  {
    if(m_type == IT_Can2A)
      return false;
    return (m_bits & ~SFF_MASK) > 0;
  }

  std::string IdC::IntoHex() const
  {
    switch(m_type) {
    case IT_Can2A: return AsCan2A().IntoHex();
    case IT_Can2B: return AsCan2B().IntoHex();
    case IT_J1939: return AsJ1939().IntoHex();
    }
    return AsCan2B().IntoHex();
  }

}
