
#include "cantypes/CanMessage.hh"

namespace CanTypesN {

  const char *DirectToString(DirectT direct)
  {
    switch(direct) {
    case D_Transmit: return "Tx";
    case D_Receive: return "Rx";
    }
    return "Tx";
  }

  bool CanFdResize(size_t length,size_t &resized)
  {
    if(length <= CAN_FRAME_MAX_SIZE)
      resized = length;
    else if(length <= 12)
      resized = 12;
    else if(length <= 16)
      resized = 16;
    else if(length <= 20)
      resized = 20;
    else if(length <= 24)
      resized = 24;
    else if(length <= 32)
      resized = 32;
    else if(length <= 48)
      resized = 48;
    else if(length <= CANFD_FRAME_MAX_SIZE)
      resized = 64;
    else
      return false;
    return true;
  }

  uint8_t LengthToDlc(size_t length)
  {
    if(length <= 8)
      return (uint8_t) length;
    if(length <= 12)
      return 9;
    if(length <= 16)
      return 10;
    if(length <= 20)
      return 11;
    if(length <= 24)
      return 12;
    if(length <= 32)
      return 13;
    if(length <= 48)
      return 14;
    return 15;
  }

  size_t DlcToLength(uint8_t dlc)
  {
    static const size_t lengths[16] = { 0,1,2,3,4,5,6,7,8,12,16,20,24,32,48,64 };
    return lengths[dlc & 0xf];
  }

  // -----------------------------------------------------

  bool CanMessageC::Create(const IdC &id,const ByteArrayT &data,CanMessageC &msg)
  {
    size_t length = 0;
    if(!CanFdResize(data.size(),length))
      return false;
    CanMessageC ret;
    ret.m_id = id;
    ret.m_data = data;
    ret.m_data.resize(length,0);
    ret.m_isCanFd = length > CAN_FRAME_MAX_SIZE;
    msg = ret;
    return true;
  }

  bool CanMessageC::CreateRemote(const IdC &id,size_t len,CanMessageC &msg)
  {
    if(len > CAN_FRAME_MAX_SIZE)
      return false;
    CanMessageC ret;
    ret.m_id = id;
    ret.m_isRemote = true;
    ret.m_remoteLength = len;
    msg = ret;
    return true;
  }

  IdC CanMessageC::Id(ProtocolT protocol) const
  {
    if(protocol == P_J1939 && m_id.Type() != IT_Can2A)
      return IdC(J1939IdC(m_id.AsRaw()));
    return m_id;
  }

  CanMessageC &CanMessageC::SetCanFd(bool value)
  {
    m_isCanFd = value;
    if(!m_isCanFd) {
      m_isBitrateSwitch = false;
      m_isEsi = false;
    }
    return *this;
  }

  size_t CanMessageC::Dlc() const
  {
    return LengthToDlc(Length());
  }

  size_t CanMessageC::Length() const
  {
    if(m_isRemote)
      return m_remoteLength;
    return m_data.size();
  }

}
