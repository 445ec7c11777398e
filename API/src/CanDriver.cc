
#include "cantypes/CanDriver.hh"
#include "cantypes/CanDriverSocket.hh"
#include "cantypes/CanDriverVirtual.hh"

namespace CanTypesN {

  CanDriverC::CanDriverC()
  {}

  CanDriverC::~CanDriverC()
  {}

  void CanDriverC::SetLogger(const std::shared_ptr<spdlog::logger> &log)
  {
    m_log = log;
  }

  void CanDriverC::StampReceived(CanMessageC &msg) const
  {
    msg.SetChannel(m_name);
    msg.SetDirect(D_Receive);
    msg.SetTimestampNow();
  }

  std::shared_ptr<CanDriverC> MakeDriver(const std::string &driverType)
  {
    if(driverType == "socketcan" || driverType == "SocketCAN")
      return std::make_shared<CanDriverSocketC>();
    if(driverType == "virtual" || driverType == "Virtual")
      return std::make_shared<CanDriverVirtualC>();
    return std::shared_ptr<CanDriverC>();
  }

}
