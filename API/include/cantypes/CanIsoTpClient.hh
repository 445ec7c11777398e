#ifndef CANTYPES_CANISOTPCLIENT_HEADER
#define CANTYPES_CANISOTPCLIENT_HEADER 1

#include <map>
#include "cantypes/SyncCanDevice.hh"
#include "cantypes/CanIsoTp.hh"

namespace CanTypesN {

  //! Routes device traffic to the ISO-TP transport for each channel.

  class IsoTpChannelMapC
   : public CanListenerC
  {
  public:
    IsoTpChannelMapC()
    {}

    //! Add a transport, fails if the channel is already in use.
    bool Add(const std::shared_ptr<SyncCanIsoTpC> &isoTp);

    //! Remove a transport.
    bool Remove(const std::string &channel);

    //! Find the transport for a channel, returns an empty pointer if there isn't one.
    std::shared_ptr<SyncCanIsoTpC> Find(const std::string &channel) const;

    //! Names of the channels in use.
    std::vector<std::string> Channels() const;

    virtual void OnFrameTransmitted(const IdC &id,const std::string &channel) override;

    virtual void OnFrameReceived(const std::vector<CanMessageC> &frames,const std::string &channel) override;

  protected:
    mutable std::mutex m_mutexChannels;
    std::map<std::string,std::shared_ptr<SyncCanIsoTpC> > m_channels;
  };

  //! ISO-TP over a device with several channels.

  class CanIsoTpClientC
  {
  public:
    //! Attach to a device, registers a listener named "isotp-client".
    CanIsoTpClientC(const std::shared_ptr<SyncCanDeviceC> &device);

    //! Unregisters from the device, the device is left open.
    ~CanIsoTpClientC();

    //! Set the logger to use
    void SetLogger(const std::shared_ptr<spdlog::logger> &log)
    { m_log = log; }

    //! Access the device.
    const std::shared_ptr<SyncCanDeviceC> &Device() const
    { return m_device; }

    //! Start ISO-TP on a channel.
    //! Returns false if the channel is already in use.
    bool AddChannel(const std::string &channel,const IsoTpAddressC &address,const IsoTpConfigC &config = IsoTpConfigC());

    //! Stop ISO-TP on a channel.
    bool RemoveChannel(const std::string &channel);

    //! Return a channel to idle.
    bool ResetChannel(const std::string &channel);

    //! Get the state of a channel.
    bool State(const std::string &channel,IsoTpStateFlagsT &state) const;

    //! Add state flags to a channel.
    bool StateAdd(const std::string &channel,IsoTpStateFlagsT flags);

    //! Add an event listener to a channel.
    bool RegisterListener(const std::string &channel,const IsoTpEventFuncT &func);

    //! Remove all event listeners from a channel.
    bool UnregisterListeners(const std::string &channel);

    //! Send a payload on a channel, blocking until it has been transmitted.
    //! Returns false if the channel isn't known, throws ExceptionIsoTpC on protocol errors.
    bool Write(const std::string &channel,bool functional,const ByteArrayT &data);

    //! Names of channels in use.
    std::vector<std::string> Channels() const
    { return m_channels->Channels(); }

    //! Detach from the device and close it.
    void Close();

  protected:
    std::shared_ptr<SyncCanDeviceC> m_device;
    std::shared_ptr<IsoTpChannelMapC> m_channels;
    std::shared_ptr<spdlog::logger> m_log = DefaultLogger();
  };

}

#endif
