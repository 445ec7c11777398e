
#include "cantypes/SyncCanDevice.hh"

namespace CanTypesN {

  SyncCanDeviceC::SyncCanDeviceC(const std::shared_ptr<CanDriverC> &driver)
   : CanDeviceC(driver)
  {}

  SyncCanDeviceC::~SyncCanDeviceC()
  {
    Close();
  }

  bool SyncCanDeviceC::SyncStart(int intervalMs)
  {
    std::lock_guard<std::mutex> lock(m_mutexStartStop);
    if(m_running) {
      m_log->warn("Device already started. ");
      return false;
    }
    if(!m_driver || !m_driver->IsReady()) {
      m_log->error("Can't start device, driver not ready. ");
      return false;
    }
    m_terminate = false;
    m_txQueue->Reopen();
    m_running = true;
    m_threadTransmit = std::thread([this,intervalMs]{ RunTransmit(intervalMs); });
    m_threadReceive = std::thread([this,intervalMs]{ RunReceive(intervalMs); });
    m_log->info("Started device '{}' ",m_driver->Name());
    return true;
  }

  void SyncCanDeviceC::Close()
  {
    std::lock_guard<std::mutex> lock(m_mutexStartStop);
    m_terminate = true;
    m_txQueue->Notify();
    if(m_threadTransmit.joinable())
      m_threadTransmit.join();
    if(m_threadReceive.joinable())
      m_threadReceive.join();
    if(m_running)
      m_log->info("Closed device '{}' ",m_driver ? m_driver->Name() : std::string());
    m_running = false;
    ShutdownDriver();
  }

}
