
#include <thread>
#include <algorithm>
#include "cantypes/CanDevice.hh"

#define DODEBUG 0
#if DODEBUG
#define ONDEBUG(x) x
#else
#define ONDEBUG(x)
#endif

namespace CanTypesN {

  CanListenerC::~CanListenerC()
  {}

  // -----------------------------------------------------

  bool CanTxQueueC::Push(const CanMessageC &msg)
  {
    std::lock_guard<std::mutex> lock(m_mutexQueue);
    if(m_closed)
      return false;
    m_queue.push_back(msg);
    m_ready.notify_all();
    return true;
  }

  void CanTxQueueC::PopAll(std::vector<CanMessageC> &frames)
  {
    std::lock_guard<std::mutex> lock(m_mutexQueue);
    while(!m_queue.empty()) {
      frames.push_back(m_queue.front());
      m_queue.pop_front();
    }
  }

  void CanTxQueueC::Wait(int timeoutMs)
  {
    std::unique_lock<std::mutex> lock(m_mutexQueue);
    if(!m_queue.empty() || m_closed)
      return;
    m_ready.wait_for(lock,std::chrono::milliseconds(timeoutMs));
  }

  void CanTxQueueC::Notify()
  {
    std::lock_guard<std::mutex> lock(m_mutexQueue);
    m_ready.notify_all();
  }

  void CanTxQueueC::Close()
  {
    std::lock_guard<std::mutex> lock(m_mutexQueue);
    m_closed = true;
    m_queue.clear();
    m_ready.notify_all();
  }

  void CanTxQueueC::Reopen()
  {
    std::lock_guard<std::mutex> lock(m_mutexQueue);
    m_closed = false;
  }

  bool CanTxQueueC::IsClosed() const
  {
    std::lock_guard<std::mutex> lock(m_mutexQueue);
    return m_closed;
  }

  // -----------------------------------------------------

  bool CanSenderC::Send(const CanMessageC &msg) const
  {
    if(!m_queue)
      return false;
    return m_queue->Push(msg);
  }

  // -----------------------------------------------------

  CanDeviceC::CanDeviceC(const std::shared_ptr<CanDriverC> &driver)
    : m_driver(driver),
      m_txQueue(std::make_shared<CanTxQueueC>()),
      m_terminate(false),
      m_running(false)
  {
    if(!m_driver)
      m_txQueue->Close();
  }

  CanDeviceC::~CanDeviceC()
  {}

  void CanDeviceC::SetLogger(const std::shared_ptr<spdlog::logger> &log)
  {
    m_log = log;
    if(m_driver)
      m_driver->SetLogger(log);
  }

  bool CanDeviceC::RegisterListener(const std::string &name,const std::shared_ptr<CanListenerC> &listener)
  {
    if(!listener) {
      m_log->error("Attempt to register empty listener '{}' ",name);
      return false;
    }
    std::lock_guard<std::mutex> lock(m_mutexListeners);
    if(m_listeners.find(name) != m_listeners.end()) {
      m_log->warn("Listener '{}' already registered. ",name);
      return false;
    }
    m_listeners[name] = listener;
    return true;
  }

  bool CanDeviceC::UnregisterListener(const std::string &name)
  {
    std::lock_guard<std::mutex> lock(m_mutexListeners);
    auto at = m_listeners.find(name);
    if(at == m_listeners.end())
      return false;
    m_listeners.erase(at);
    return true;
  }

  bool CanDeviceC::UnregisterAll()
  {
    std::lock_guard<std::mutex> lock(m_mutexListeners);
    m_listeners.clear();
    return true;
  }

  std::vector<std::string> CanDeviceC::ListenerNames() const
  {
    std::lock_guard<std::mutex> lock(m_mutexListeners);
    std::vector<std::string> ret;
    ret.reserve(m_listeners.size());
    for(auto &a : m_listeners)
      ret.push_back(a.first);
    return ret;
  }

  std::vector<std::shared_ptr<CanListenerC> > CanDeviceC::Listeners() const
  {
    std::lock_guard<std::mutex> lock(m_mutexListeners);
    std::vector<std::shared_ptr<CanListenerC> > ret;
    ret.reserve(m_listeners.size());
    for(auto &a : m_listeners)
      ret.push_back(a.second);
    return ret;
  }

  int CanDeviceC::TransmitOnce()
  {
    std::vector<CanMessageC> frames;
    m_txQueue->PopAll(frames);
    if(frames.empty())
      return 0;
    if(!m_driver) {
      m_log->error("No driver, dropping {} frames ",frames.size());
      return 0;
    }

    int count = 0;
    for(auto &msg : frames) {
      if(msg.Channel().empty())
        msg.SetChannel(m_driver->Name());
      msg.SetDirect(D_Transmit);
      msg.SetTimestampNow();
      if(!m_driver->Transmit(msg)) {
        m_log->warn("Failed to transmit frame {} on '{}' ",msg.Id().IntoHex(),msg.Channel());
        continue;
      }
      ONDEBUG(m_log->debug("Tx {} ",msg.ToString()));
      count++;
      for(auto &listener : Listeners()) {
        try {
          listener->OnFrameTransmitted(msg.Id(),msg.Channel());
        } catch(std::exception &ex) {
          m_log->error("Listener failed on transmit notification: {} ",ex.what());
        }
      }
    }
    return count;
  }

  bool CanDeviceC::ReceiveOnce(int timeoutMs)
  {
    if(!m_driver)
      return false;
    std::vector<CanMessageC> frames;
    if(!m_driver->Receive(frames,timeoutMs))
      return false;
    if(frames.empty())
      return true;

    // Group frames by the channel they arrived on.
    std::map<std::string,std::vector<CanMessageC> > byChannel;
    for(auto &a : frames) {
      ONDEBUG(m_log->debug("Rx {} ",a.ToString()));
      byChannel[a.Channel()].push_back(a);
    }

    std::vector<std::shared_ptr<CanListenerC> > listeners = Listeners();
    for(auto &entry : byChannel) {
      for(auto &listener : listeners) {
        try {
          listener->OnFrameReceived(entry.second,entry.first);
        } catch(std::exception &ex) {
          m_log->error("Listener failed on receive notification: {} ",ex.what());
        }
      }
    }
    return true;
  }

  void CanDeviceC::RunTransmit(int intervalMs)
  {
    m_log->debug("Transmit loop started for '{}' ",m_driver ? m_driver->Name() : std::string());
    int waitMs = Max(intervalMs,1);
    while(!m_terminate) {
      m_txQueue->Wait(waitMs);
      TransmitOnce();
    }
    m_log->debug("Transmit loop exiting. ");
  }

  void CanDeviceC::RunReceive(int intervalMs)
  {
    m_log->debug("Receive loop started for '{}' ",m_driver ? m_driver->Name() : std::string());
    int waitMs = Max(intervalMs,1);
    bool lastFailed = false;
    while(!m_terminate) {
      if(ReceiveOnce(waitMs)) {
        lastFailed = false;
        continue;
      }
      if(!lastFailed)
        m_log->error("Receive failed on '{}' ",m_driver ? m_driver->Name() : std::string());
      lastFailed = true;
      std::this_thread::sleep_for(std::chrono::milliseconds(waitMs));
    }
    m_log->debug("Receive loop exiting. ");
  }

  void CanDeviceC::ShutdownDriver()
  {
    m_txQueue->Close();
    if(m_driver)
      m_driver->Close();
  }

}
