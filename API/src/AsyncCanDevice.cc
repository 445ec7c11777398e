
#include "cantypes/AsyncCanDevice.hh"

namespace CanTypesN {

  AsyncCanDeviceC::AsyncCanDeviceC(const std::shared_ptr<CanDriverC> &driver)
   : CanDeviceC(driver)
  {}

  AsyncCanDeviceC::~AsyncCanDeviceC()
  {
    std::shared_future<void> closing;
    {
      std::lock_guard<std::mutex> lock(m_mutexClose);
      closing = m_closing;
    }
    if(closing.valid())
      closing.wait();
    StopTasks();
  }

  bool AsyncCanDeviceC::AsyncStart(int intervalMs)
  {
    std::lock_guard<std::mutex> lockClose(m_mutexClose);
    // Let any earlier close finish before starting again.
    if(m_closing.valid()) {
      m_closing.wait();
      m_closing = std::shared_future<void>();
    }
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
    m_taskTransmit = std::async(std::launch::async,[this,intervalMs]{ RunTransmit(intervalMs); });
    m_taskReceive = std::async(std::launch::async,[this,intervalMs]{ RunReceive(intervalMs); });
    m_log->info("Started device '{}' ",m_driver->Name());
    return true;
  }

  std::future<void> AsyncCanDeviceC::Close()
  {
    std::lock_guard<std::mutex> lock(m_mutexClose);
    m_terminate = true;
    m_txQueue->Notify();
    if(!m_closing.valid()) {
      m_closing = std::async(std::launch::async,[this]{ StopTasks(); }).share();
    }
    std::shared_future<void> closing = m_closing;
    return std::async(std::launch::async,[closing]{ closing.wait(); });
  }

  void AsyncCanDeviceC::StopTasks()
  {
    std::lock_guard<std::mutex> lock(m_mutexStartStop);
    m_terminate = true;
    m_txQueue->Notify();
    if(m_taskTransmit.valid())
      m_taskTransmit.wait();
    if(m_taskReceive.valid())
      m_taskReceive.wait();
    m_taskTransmit = std::future<void>();
    m_taskReceive = std::future<void>();
    if(m_running)
      m_log->info("Closed device '{}' ",m_driver ? m_driver->Name() : std::string());
    m_running = false;
    ShutdownDriver();
  }

}
