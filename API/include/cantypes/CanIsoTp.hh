#ifndef CANTYPES_CANISOTP_HEADER
#define CANTYPES_CANISOTP_HEADER 1

#include <future>
#include <functional>
#include <mutex>
#include <condition_variable>
#include "cantypes/CanDevice.hh"
#include "cantypes/IsoTpFrame.hh"
#include "cantypes/CallbackArray.hh"
#include "cantypes/Strings.hh"

namespace CanTypesN {

  typedef std::function<void (const IsoTpEventC &event)> IsoTpEventFuncT;

  //! ISO-TP transport for one channel and address pair.
  //! Register it with a device to receive frames, it transmits through the device's sender.

  class CanIsoTpC
   : public CanListenerC
  {
  public:
    CanIsoTpC(const std::string &channel,
              const IsoTpAddressC &address,
              const CanSenderC &sender,
              const IsoTpConfigC &config = IsoTpConfigC());

    //! Destructor
    virtual ~CanIsoTpC();

    //! Set the logger to use
    void SetLogger(const std::shared_ptr<spdlog::logger> &log)
    { m_log = log; }

    const std::string &Channel() const
    { return m_channel; }

    const IsoTpAddressC &Address() const
    { return m_address; }

    const IsoTpConfigC &Config() const
    { return m_config; }

    //! Add a function to be called on protocol events.
    //! Events are delivered on the thread servicing the device.
    CallbackHandleC AddEventListener(const IsoTpEventFuncT &func)
    { return m_events.Add(func); }

    //! Remove all event listeners.
    void ClearEventListeners()
    { m_events.Clear(); }

    //! Current state flags.
    IsoTpStateFlagsT State() const;

    //! Test if any of the flags are set.
    bool StateContains(IsoTpStateFlagsT flags) const;

    //! Add state flags. Adding IS_Error replaces all other flags.
    void StateAdd(IsoTpStateFlagsT flags);

    //! Remove state flags.
    void StateRemove(IsoTpStateFlagsT flags);

    //! Return to idle, discarding any partially received payload.
    void Reset();

    //! Clears the sending flag once our frame is on the bus.
    virtual void OnFrameTransmitted(const IdC &id,const std::string &channel) override;

    //! Decode frames addressed to us.
    virtual void OnFrameReceived(const std::vector<CanMessageC> &frames,const std::string &channel) override;

  protected:
    //! Send a payload, blocking until the last frame is transmitted.
    //! Throws ExceptionIsoTpC on failure.
    void WriteFrames(bool functional,const ByteArrayT &data);

    //! Wait until none of the flags are set.
    //! Throws ExceptionIsoTpC if the state goes to error or the timeout expires.
    void WaitWhile(IsoTpStateFlagsT flags);

    //! Encode and queue a frame, marking the channel as sending.
    bool SendFrame(uint32_t id,const CanIsoTpFrameC &frame);

    //! Move to the error state and report it to listeners.
    void SetError(IsoTpErrorT code,const std::string &message);

    //! Check one of the expected flags is set, otherwise go to the error state with IE_StateError.
    bool FrameStateCheck(IsoTpStateFlagsT expected);

    //! Pass an event to listeners.
    void Emit(const IsoTpEventC &event);

    void OnSingleFrame(const CanIsoTpFrameC &frame);
    void OnFirstFrame(const CanIsoTpFrameC &frame);
    void OnConsecutiveFrame(const CanIsoTpFrameC &frame);
    void OnFlowControlFrame(const CanIsoTpFrameC &frame);

    std::string m_channel;
    IsoTpAddressC m_address;
    CanSenderC m_sender;
    IsoTpConfigC m_config;

    mutable std::mutex m_mutexState;
    std::condition_variable m_stateChanged;
    IsoTpStateFlagsT m_state = IS_Idle;

    // Receive context.
    uint32_t m_rxLength = 0;
    uint8_t m_rxSequence = ISOTP_CONSECUTIVE_SEQUENCE_START;
    unsigned m_rxBlockCount = 0;
    ByteArrayT m_rxBuffer;

    // Flow control from the peer.
    uint8_t m_peerBlockSize = 0;
    uint32_t m_peerStMinUs = 0;
    unsigned m_flowWaitCount = 0;

    std::mutex m_mutexWrite;

    CallbackArrayC<IsoTpEventFuncT> m_events;

    std::shared_ptr<spdlog::logger> m_log = DefaultLogger();
  };

  //! ISO-TP transport with blocking writes.

  class SyncCanIsoTpC
   : public CanIsoTpC
  {
  public:
    SyncCanIsoTpC(const std::string &channel,
                  const IsoTpAddressC &address,
                  const CanSenderC &sender,
                  const IsoTpConfigC &config = IsoTpConfigC());

    //! Send a payload, returns once the last frame has been transmitted.
    //! Functional writes use the functional id and must fit in a single frame.
    //! Throws ExceptionIsoTpC on failure.
    void Write(bool functional,const ByteArrayT &data);
  };

  //! ISO-TP transport where writes run in the background.
  //! The object must outlive any future returned by Write().

  class AsyncCanIsoTpC
   : public CanIsoTpC
  {
  public:
    AsyncCanIsoTpC(const std::string &channel,
                   const IsoTpAddressC &address,
                   const CanSenderC &sender,
                   const IsoTpConfigC &config = IsoTpConfigC());

    //! Start sending a payload.
    //! Errors are reported as an ExceptionIsoTpC stored in the future.
    std::future<void> Write(bool functional,const ByteArrayT &data);
  };

}

#endif
