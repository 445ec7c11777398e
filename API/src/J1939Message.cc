
#include "cantypes/J1939Message.hh"
#include "cantypes/Util.hh"
#include <spdlog/fmt/fmt.h>

namespace CanTypesN {

  // -----------------------------------------------------

  NameFieldC NameFieldC::FromHex(const std::string &hexStr)
  {
    uint64_t value = 0;
    if(!ParseHex(hexStr,UINT64_MAX,value))
      return NameFieldC();
    return NameFieldC(value);
  }

  bool NameFieldC::TryFromBits(uint64_t bits,NameFieldC &name)
  {
    name = NameFieldC(bits);
    return true;
  }

  bool NameFieldC::TryFromHex(const std::string &hexStr,NameFieldC &name)
  {
    uint64_t value = 0;
    if(!ParseHex(hexStr,UINT64_MAX,value))
      return false;
    name = NameFieldC(value);
    return true;
  }

  std::string NameFieldC::IntoHex() const
  {
    return fmt::format("{:016X}",m_bits);
  }

  // -----------------------------------------------------

  DataFieldC DataFieldC::FromHex(const std::string &hexStr)
  {
    uint64_t value = 0;
    if(!ParseHex(hexStr,UINT64_MAX,value))
      return DataFieldC();
    return DataFieldC(value);
  }

  bool DataFieldC::TryFromBits(uint64_t bits,DataFieldC &data)
  {
    data = DataFieldC(bits);
    return true;
  }

  bool DataFieldC::TryFromHex(const std::string &hexStr,DataFieldC &data)
  {
    uint64_t value = 0;
    if(!ParseHex(hexStr,UINT64_MAX,value))
      return false;
    data = DataFieldC(value);
    return true;
  }

  bool DataFieldC::FromBytes(const ByteArrayT &data,DataFieldC &field)
  {
    if(data.size() > 8)
      return false;
    uint64_t bits = 0;
    for(size_t i = 0;i < 8;i++) {
      uint8_t value = i < data.size() ? data[i] : 0xff;
      bits = (bits << 8) | value;
    }
    field = DataFieldC(bits);
    return true;
  }

  std::string DataFieldC::IntoHex() const
  {
    return fmt::format("{:016X}",m_bits);
  }

  ByteArrayT DataFieldC::IntoBytes() const
  {
    ByteArrayT ret(8);
    for(int i = 0;i < 8;i++)
      ret[i] = Byte(i);
    return ret;
  }

  // -----------------------------------------------------

  static J1939PduC MakePdu(uint64_t bits,J1939PduTypeT pduType)
  {
    if(pduType == PT_Name)
      return J1939PduC(NameFieldC(bits));
    return J1939PduC(DataFieldC(bits));
  }

  bool J1939MessageC::FromParts(const IdC &id,const J1939PduC &pdu,J1939MessageC &msg)
  {
    switch(id.Type()) {
    case IT_Can2A:
      return false;
    case IT_Can2B:
      msg = J1939MessageC(IdC(J1939IdC(id.AsRaw())),pdu);
      return true;
    case IT_J1939:
      msg = J1939MessageC(id,pdu);
      return true;
    }
    return false;
  }

  J1939MessageC J1939MessageC::FromBits(uint32_t id,uint64_t pdu,J1939PduTypeT pduType)
  {
    return J1939MessageC(IdC(J1939IdC(id & EFF_MASK)),MakePdu(pdu,pduType));
  }

  J1939MessageC J1939MessageC::FromHex(const std::string &hexId,const std::string &hexPdu,J1939PduTypeT pduType)
  {
    uint64_t id = 0;
    if(!ParseHex(hexId,0xFFFFFFFF,id))
      id = 0;
    uint64_t pdu = 0;
    if(!ParseHex(hexPdu,UINT64_MAX,pdu))
      pdu = 0;
    return FromBits((uint32_t) id,pdu,pduType);
  }

  bool J1939MessageC::TryFromBits(uint32_t id,uint64_t pdu,J1939PduTypeT pduType,J1939MessageC &msg)
  {
    J1939IdC j1939Id;
    if(!J1939IdC::TryFromBits(id,j1939Id))
      return false;
    msg = J1939MessageC(IdC(j1939Id),MakePdu(pdu,pduType));
    return true;
  }

  bool J1939MessageC::TryFromHex(const std::string &hexId,const std::string &hexPdu,J1939PduTypeT pduType,J1939MessageC &msg)
  {
    J1939IdC j1939Id;
    if(!J1939IdC::TryFromHex(hexId,j1939Id))
      return false;
    uint64_t pdu = 0;
    if(!ParseHex(hexPdu,UINT64_MAX,pdu))
      return false;
    msg = J1939MessageC(IdC(j1939Id),MakePdu(pdu,pduType));
    return true;
  }

}
