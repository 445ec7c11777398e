
#include "cantypes/CanIsoTpClient.hh"

namespace CanTypesN {

  static const char *g_clientListenerName = "isotp-client";

  bool IsoTpChannelMapC::Add(const std::shared_ptr<SyncCanIsoTpC> &isoTp)
  {
    if(!isoTp)
      return false;
    std::lock_guard<std::mutex> lock(m_mutexChannels);
    if(m_channels.find(isoTp->Channel()) != m_channels.end())
      return false;
    m_channels[isoTp->Channel()] = isoTp;
    return true;
  }

  bool IsoTpChannelMapC::Remove(const std::string &channel)
  {
    std::lock_guard<std::mutex> lock(m_mutexChannels);
    return m_channels.erase(channel) > 0;
  }

  std::shared_ptr<SyncCanIsoTpC> IsoTpChannelMapC::Find(const std::string &channel) const
  {
    std::lock_guard<std::mutex> lock(m_mutexChannels);
    auto at = m_channels.find(channel);
    if(at == m_channels.end())
      return std::shared_ptr<SyncCanIsoTpC>();
    return at->second;
  }

  std::vector<std::string> IsoTpChannelMapC::Channels() const
  {
    std::lock_guard<std::mutex> lock(m_mutexChannels);
    std::vector<std::string> ret;
    for(auto &a : m_channels)
      ret.push_back(a.first);
    return ret;
  }

  void IsoTpChannelMapC::OnFrameTransmitted(const IdC &id,const std::string &channel)
  {
    std::shared_ptr<SyncCanIsoTpC> isoTp = Find(channel);
    if(isoTp)
      isoTp->OnFrameTransmitted(id,channel);
  }

  void IsoTpChannelMapC::OnFrameReceived(const std::vector<CanMessageC> &frames,const std::string &channel)
  {
    std::shared_ptr<SyncCanIsoTpC> isoTp = Find(channel);
    if(isoTp)
      isoTp->OnFrameReceived(frames,channel);
  }

  // -----------------------------------------------------

  CanIsoTpClientC::CanIsoTpClientC(const std::shared_ptr<SyncCanDeviceC> &device)
    : m_device(device),
      m_channels(std::make_shared<IsoTpChannelMapC>())
  {
    if(!m_device) {
      m_log->error("ISO-TP client created without a device. ");
      return;
    }
    if(!m_device->RegisterListener(g_clientListenerName,m_channels))
      m_log->warn("Failed to register ISO-TP client with device. ");
  }

  CanIsoTpClientC::~CanIsoTpClientC()
  {
    if(m_device)
      m_device->UnregisterListener(g_clientListenerName);
  }

  bool CanIsoTpClientC::AddChannel(const std::string &channel,const IsoTpAddressC &address,const IsoTpConfigC &config)
  {
    if(!m_device)
      return false;
    auto isoTp = std::make_shared<SyncCanIsoTpC>(channel,address,m_device->Sender(),config);
    isoTp->SetLogger(m_log);
    if(!m_channels->Add(isoTp)) {
      m_log->warn("ISO-TP channel '{}' already exists. ",channel);
      return false;
    }
    m_log->info("Added ISO-TP channel '{}' tx {:X} rx {:X} ",channel,address.TxId(),address.RxId());
    return true;
  }

  bool CanIsoTpClientC::RemoveChannel(const std::string &channel)
  {
    return m_channels->Remove(channel);
  }

  bool CanIsoTpClientC::ResetChannel(const std::string &channel)
  {
    std::shared_ptr<SyncCanIsoTpC> isoTp = m_channels->Find(channel);
    if(!isoTp)
      return false;
    isoTp->Reset();
    return true;
  }

  bool CanIsoTpClientC::State(const std::string &channel,IsoTpStateFlagsT &state) const
  {
    std::shared_ptr<SyncCanIsoTpC> isoTp = m_channels->Find(channel);
    if(!isoTp)
      return false;
    state = isoTp->State();
    return true;
  }

  bool CanIsoTpClientC::StateAdd(const std::string &channel,IsoTpStateFlagsT flags)
  {
    std::shared_ptr<SyncCanIsoTpC> isoTp = m_channels->Find(channel);
    if(!isoTp)
      return false;
    isoTp->StateAdd(flags);
    return true;
  }

  bool CanIsoTpClientC::RegisterListener(const std::string &channel,const IsoTpEventFuncT &func)
  {
    std::shared_ptr<SyncCanIsoTpC> isoTp = m_channels->Find(channel);
    if(!isoTp)
      return false;
    isoTp->AddEventListener(func);
    return true;
  }

  bool CanIsoTpClientC::UnregisterListeners(const std::string &channel)
  {
    std::shared_ptr<SyncCanIsoTpC> isoTp = m_channels->Find(channel);
    if(!isoTp)
      return false;
    isoTp->ClearEventListeners();
    return true;
  }

  bool CanIsoTpClientC::Write(const std::string &channel,bool functional,const ByteArrayT &data)
  {
    std::shared_ptr<SyncCanIsoTpC> isoTp = m_channels->Find(channel);
    if(!isoTp) {
      m_log->warn("Write to unknown ISO-TP channel '{}' ",channel);
      return false;
    }
    isoTp->Write(functional,data);
    return true;
  }

  void CanIsoTpClientC::Close()
  {
    m_log->info("Closing ISO-TP client. ");
    if(!m_device)
      return;
    m_device->UnregisterListener(g_clientListenerName);
    m_device->Close();
  }

}
