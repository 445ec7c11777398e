
#include <map>
#include <algorithm>
#include "cantypes/CanDriverVirtual.hh"

#define DODEBUG 0
#if DODEBUG
#define ONDEBUG(x) x
#else
#define ONDEBUG(x)
#endif

namespace CanTypesN {

  VirtualBusC::VirtualBusC(const std::string &name)
   : m_name(name)
  {}

  std::shared_ptr<VirtualBusC> VirtualBusC::Get(const std::string &name)
  {
    static std::mutex mutexBuses;
    static std::map<std::string,std::weak_ptr<VirtualBusC> > buses;

    std::lock_guard<std::mutex> lock(mutexBuses);
    std::shared_ptr<VirtualBusC> bus = buses[name].lock();
    if(!bus) {
      bus = std::make_shared<VirtualBusC>(name);
      buses[name] = bus;
    }
    return bus;
  }

  void VirtualBusC::Attach(CanDriverVirtualC *driver)
  {
    std::lock_guard<std::mutex> lock(m_mutexDrivers);
    if(std::find(m_drivers.begin(),m_drivers.end(),driver) == m_drivers.end())
      m_drivers.push_back(driver);
  }

  void VirtualBusC::Detach(CanDriverVirtualC *driver)
  {
    std::lock_guard<std::mutex> lock(m_mutexDrivers);
    auto at = std::find(m_drivers.begin(),m_drivers.end(),driver);
    if(at != m_drivers.end())
      m_drivers.erase(at);
  }

  int VirtualBusC::Broadcast(const CanDriverVirtualC *sender,const CanMessageC &msg)
  {
    std::lock_guard<std::mutex> lock(m_mutexDrivers);
    int count = 0;
    for(auto a : m_drivers) {
      if(a == sender)
        continue;
      a->Deliver(msg);
      count++;
    }
    return count;
  }

  size_t VirtualBusC::DriverCount()
  {
    std::lock_guard<std::mutex> lock(m_mutexDrivers);
    return m_drivers.size();
  }

  // -----------------------------------------------------

  CanDriverVirtualC::CanDriverVirtualC()
  {}

  CanDriverVirtualC::~CanDriverVirtualC()
  {
    Close();
  }

  bool CanDriverVirtualC::Open(const std::string &name,bool canFd)
  {
    if(IsReady()) {
      m_log->warn("Virtual driver already attached to bus '{}' ",m_name);
      return false;
    }
    m_name = name;
    m_canFd = canFd;
    std::shared_ptr<VirtualBusC> bus = VirtualBusC::Get(name);
    {
      std::lock_guard<std::mutex> lock(m_mutexRx);
      m_bus = bus;
    }
    bus->Attach(this);
    m_log->debug("Attached to virtual bus '{}' ",name);
    return true;
  }

  void CanDriverVirtualC::Close()
  {
    std::shared_ptr<VirtualBusC> bus;
    {
      std::lock_guard<std::mutex> lock(m_mutexRx);
      bus = m_bus;
    }
    if(!bus)
      return;
    // Once detached the bus will not deliver any more frames.
    bus->Detach(this);
    std::lock_guard<std::mutex> lock(m_mutexRx);
    m_bus.reset();
    m_rxQueue.clear();
    m_rxReady.notify_all();
  }

  bool CanDriverVirtualC::IsReady() const
  {
    std::lock_guard<std::mutex> lock(m_mutexRx);
    return (bool) m_bus;
  }

  bool CanDriverVirtualC::Transmit(const CanMessageC &msg)
  {
    std::shared_ptr<VirtualBusC> bus;
    {
      std::lock_guard<std::mutex> lock(m_mutexRx);
      bus = m_bus;
    }
    if(!bus) {
      m_log->error("Transmit on closed virtual driver '{}' ",m_name);
      return false;
    }
    if(msg.IsCanFd() && !m_canFd) {
      m_log->warn("CAN-FD frame not supported on '{}' ",m_name);
      return false;
    }
    int n = bus->Broadcast(this,msg);
    ONDEBUG(m_log->debug("Sent {} to {} listeners ",msg.ToString(),n));
    (void) n;
    return true;
  }

  bool CanDriverVirtualC::Receive(std::vector<CanMessageC> &frames,int timeoutMs)
  {
    std::unique_lock<std::mutex> lock(m_mutexRx);
    if(m_rxQueue.empty() && timeoutMs > 0) {
      m_rxReady.wait_for(lock,std::chrono::milliseconds(timeoutMs));
    }
    if(!m_bus)
      return false;
    while(!m_rxQueue.empty()) {
      frames.push_back(m_rxQueue.front());
      m_rxQueue.pop_front();
    }
    return true;
  }

  void CanDriverVirtualC::Deliver(const CanMessageC &msg)
  {
    CanMessageC rxMsg = msg;
    StampReceived(rxMsg);
    std::lock_guard<std::mutex> lock(m_mutexRx);
    m_rxQueue.push_back(rxMsg);
    m_rxReady.notify_one();
  }

}
