
#include <thread>
#include "cantypes/CanIsoTp.hh"
#include <spdlog/fmt/fmt.h>

#define DODEBUG 0
#if DODEBUG
#define ONDEBUG(x) x
#else
#define ONDEBUG(x)
#endif

namespace CanTypesN {

  // Flags that stop the next frame being sent.
  static const IsoTpStateFlagsT g_txBlockingFlags = IS_Sending | IS_WaitBusy | IS_WaitFlowCtrl;

  CanIsoTpC::CanIsoTpC(const std::string &channel,
                       const IsoTpAddressC &address,
                       const CanSenderC &sender,
                       const IsoTpConfigC &config)
    : m_channel(channel),
      m_address(address),
      m_sender(sender),
      m_config(config)
  {}

  CanIsoTpC::~CanIsoTpC()
  {}

  IsoTpStateFlagsT CanIsoTpC::State() const
  {
    std::lock_guard<std::mutex> lock(m_mutexState);
    return m_state;
  }

  bool CanIsoTpC::StateContains(IsoTpStateFlagsT flags) const
  {
    std::lock_guard<std::mutex> lock(m_mutexState);
    return (m_state & flags) != 0;
  }

  void CanIsoTpC::StateAdd(IsoTpStateFlagsT flags)
  {
    if(flags & IS_Error) {
      SetError(IE_DeviceError,"Error state set");
      return;
    }
    std::lock_guard<std::mutex> lock(m_mutexState);
    m_state |= flags;
    m_stateChanged.notify_all();
  }

  void CanIsoTpC::StateRemove(IsoTpStateFlagsT flags)
  {
    std::lock_guard<std::mutex> lock(m_mutexState);
    m_state &= ~flags;
    m_stateChanged.notify_all();
  }

  void CanIsoTpC::Reset()
  {
    std::lock_guard<std::mutex> lock(m_mutexState);
    m_state = IS_Idle;
    m_rxLength = 0;
    m_rxSequence = ISOTP_CONSECUTIVE_SEQUENCE_START;
    m_rxBlockCount = 0;
    m_rxBuffer.clear();
    m_peerBlockSize = 0;
    m_peerStMinUs = 0;
    m_stateChanged.notify_all();
  }

  void CanIsoTpC::SetError(IsoTpErrorT code,const std::string &message)
  {
    m_log->warn("ISO-TP error on '{}': {} ",m_channel,message);
    {
      std::lock_guard<std::mutex> lock(m_mutexState);
      m_state = IS_Error;
      m_stateChanged.notify_all();
    }
    Emit(IsoTpEventC::ErrorOccurred(code,message));
  }

  bool CanIsoTpC::FrameStateCheck(IsoTpStateFlagsT expected)
  {
    IsoTpStateFlagsT state = IS_Idle;
    {
      std::lock_guard<std::mutex> lock(m_mutexState);
      state = m_state;
    }
    if((state & expected) != 0)
      return true;
    SetError(IE_StateError,fmt::format("Expected state {} found {}",IsoTpStateToString(expected),IsoTpStateToString(state)));
    return false;
  }

  void CanIsoTpC::Emit(const IsoTpEventC &event)
  {
    ONDEBUG(m_log->debug("Event {} on '{}' ",IsoTpEventTypeToString(event.Type()),m_channel));
    m_events.Call(event);
  }

  bool CanIsoTpC::SendFrame(uint32_t id,const CanIsoTpFrameC &frame)
  {
    CanMessageC msg;
    if(!frame.IntoCanMessage(id,m_config,msg)) {
      m_log->error("Failed to convert {} into a CAN message ",frame.ToString());
      return false;
    }
    msg.SetChannel(m_channel);
    StateAdd(IS_Sending);
    if(!m_sender.Send(msg)) {
      m_log->error("Failed to queue frame {:X} on '{}' ",id,m_channel);
      return false;
    }
    return true;
  }

  // -----------------------------------------------------

  void CanIsoTpC::OnFrameTransmitted(const IdC &id,const std::string &channel)
  {
    if(channel != m_channel)
      return;
    uint32_t raw = id.AsRaw();
    if(raw == m_address.TxId() || raw == m_address.Fid())
      StateRemove(IS_Sending);
  }

  void CanIsoTpC::OnFrameReceived(const std::vector<CanMessageC> &frames,const std::string &channel)
  {
    if(channel != m_channel || StateContains(IS_Error))
      return;

    for(auto &msg : frames) {
      if(msg.Id().AsRaw() != m_address.RxId())
        continue;
      ONDEBUG(m_log->debug("ISO-TP received {} on '{}' ",BytesToHex(msg.Data()),channel));

      CanIsoTpFrameC frame;
      try {
        frame = CanIsoTpFrameC::Decode(msg.Data(),m_config);
      } catch(ExceptionIsoTpC &ex) {
        SetError(ex.Code(),ex.what());
        break;
      }

      switch(frame.Type()) {
      case FT_Single:
        OnSingleFrame(frame);
        break;
      case FT_First:
        OnFirstFrame(frame);
        break;
      case FT_Consecutive:
        OnConsecutiveFrame(frame);
        break;
      case FT_FlowControl:
        OnFlowControlFrame(frame);
        break;
      }
      if(StateContains(IS_Error))
        break;
    }
  }

  void CanIsoTpC::OnSingleFrame(const CanIsoTpFrameC &frame)
  {
    if(!m_config.IsResponder() && !FrameStateCheck(IS_WaitSingle))
      return;
    StateRemove(IS_WaitSingle | IS_WaitFirst | IS_ResponsePending);
    Emit(IsoTpEventC::DataReceived(frame.Data()));
  }

  void CanIsoTpC::OnFirstFrame(const CanIsoTpFrameC &frame)
  {
    if(!m_config.IsResponder() && !FrameStateCheck(IS_WaitFirst))
      return;
    ByteArrayT complete;
    {
      std::lock_guard<std::mutex> lock(m_mutexState);
      m_rxLength = frame.Length();
      m_rxSequence = ISOTP_CONSECUTIVE_SEQUENCE_START;
      m_rxBlockCount = 0;
      m_rxBuffer = frame.Data();
      m_state &= ~(IS_WaitSingle | IS_WaitFirst | IS_ResponsePending);
      if(m_rxBuffer.size() >= m_rxLength) {
        // Whole payload fitted in the first frame.
        m_rxBuffer.resize(m_rxLength);
        complete.swap(m_rxBuffer);
      } else {
        m_state |= IS_WaitData;
      }
      m_stateChanged.notify_all();
    }
    if(!complete.empty()) {
      Emit(IsoTpEventC::DataReceived(complete));
      return;
    }
    if(!SendFrame(m_address.TxId(),CanIsoTpFrameC::DefaultFlowControl(m_config))) {
      SetError(IE_DeviceError,"Failed to send flow control");
      return;
    }
    Emit(IsoTpEventC::FirstFrameReceived());
  }

  void CanIsoTpC::OnConsecutiveFrame(const CanIsoTpFrameC &frame)
  {
    ByteArrayT complete;
    bool isComplete = false;
    bool sendFlowControl = false;
    {
      std::unique_lock<std::mutex> lock(m_mutexState);
      if((m_state & IS_WaitData) == 0) {
        lock.unlock();
        SetError(IE_MixFrames,"Consecutive frame without a first frame");
        return;
      }
      if(frame.Sequence() != m_rxSequence) {
        std::string msg = fmt::format("Expected sequence {} got {}",m_rxSequence,frame.Sequence());
        lock.unlock();
        SetError(IE_InvalidSequence,msg);
        return;
      }
      m_rxSequence = (m_rxSequence + 1) & 0x0F;
      const ByteArrayT &data = frame.Data();
      m_rxBuffer.insert(m_rxBuffer.end(),data.begin(),data.end());
      if(m_rxBuffer.size() >= m_rxLength) {
        // Drop padding from the last frame.
        m_rxBuffer.resize(m_rxLength);
        complete.swap(m_rxBuffer);
        isComplete = true;
        m_rxLength = 0;
        m_rxSequence = ISOTP_CONSECUTIVE_SEQUENCE_START;
        m_rxBlockCount = 0;
        m_state &= ~IS_WaitData;
        m_stateChanged.notify_all();
      } else if(m_config.BlockSize() != 0 && ++m_rxBlockCount >= m_config.BlockSize()) {
        m_rxBlockCount = 0;
        sendFlowControl = true;
      }
    }
    if(isComplete) {
      m_log->debug("ISO-TP received {} bytes on '{}' ",complete.size(),m_channel);
      Emit(IsoTpEventC::DataReceived(complete));
      return;
    }
    if(sendFlowControl) {
      if(!SendFrame(m_address.TxId(),CanIsoTpFrameC::DefaultFlowControl(m_config))) {
        SetError(IE_DeviceError,"Failed to send flow control");
        return;
      }
    }
    Emit(IsoTpEventC::Wait());
  }

  void CanIsoTpC::OnFlowControlFrame(const CanIsoTpFrameC &frame)
  {
    // Only valid while a write is waiting for it.
    if(!FrameStateCheck(IS_WaitFlowCtrl))
      return;
    const FlowControlContextC &context = frame.Context();
    switch(context.State()) {
    case FCS_Continues: {
      std::lock_guard<std::mutex> lock(m_mutexState);
      m_peerBlockSize = context.BlockSize();
      m_peerStMinUs = context.StMinMicroseconds();
      m_state &= ~(IS_WaitBusy | IS_WaitFlowCtrl);
      m_stateChanged.notify_all();
    } break;
    case FCS_Wait: {
      {
        std::lock_guard<std::mutex> lock(m_mutexState);
        m_state |= IS_WaitBusy;
        m_flowWaitCount++;
        m_stateChanged.notify_all();
      }
      Emit(IsoTpEventC::Wait());
    } break;
    case FCS_Overload:
      SetError(IE_OverloadFlow,"Receiver reported overflow");
      break;
    }
  }

  // -----------------------------------------------------

  void CanIsoTpC::WaitWhile(IsoTpStateFlagsT flags)
  {
    std::unique_lock<std::mutex> lock(m_mutexState);
    const std::chrono::milliseconds timeout(m_config.TimeoutMs());
    auto deadline = std::chrono::steady_clock::now() + timeout;
    unsigned flowWaitCount = m_flowWaitCount;
    while(true) {
      if(m_state & IS_Error)
        throw ExceptionIsoTpC(IE_DeviceError,"Channel is in the error state");
      if((m_state & flags) == 0)
        return;
      if(m_stateChanged.wait_until(lock,deadline) != std::cv_status::timeout) {
        // Each wait request from the peer restarts the timer.
        if(m_flowWaitCount != flowWaitCount) {
          flowWaitCount = m_flowWaitCount;
          deadline = std::chrono::steady_clock::now() + timeout;
        }
        continue;
      }
      if(m_state & IS_Error)
        throw ExceptionIsoTpC(IE_DeviceError,"Channel is in the error state");
      if((m_state & flags) == 0)
        return;
      std::string msg = fmt::format("Timed out after {} ms in state {}",m_config.TimeoutMs(),IsoTpStateToString(m_state));
      m_state &= ~(g_txBlockingFlags | IS_WaitSingle | IS_WaitFirst);
      lock.unlock();
      m_log->warn("ISO-TP on '{}': {} ",m_channel,msg);
      Emit(IsoTpEventC::ErrorOccurred(IE_Timeout,msg));
      throw ExceptionIsoTpC(IE_Timeout,msg);
    }
  }

  void CanIsoTpC::WriteFrames(bool functional,const ByteArrayT &data)
  {
    std::lock_guard<std::mutex> lockWrite(m_mutexWrite);
    std::vector<CanIsoTpFrameC> frames = CanIsoTpFrameC::FromData(data,m_config);
    if(functional && frames.size() > 1)
      throw ExceptionIsoTpC(IE_InvalidParam,fmt::format("Functional request of {} bytes doesn't fit in a single frame",data.size()));

    const uint32_t id = functional ? m_address.Fid() : m_address.TxId();
    m_log->debug("ISO-TP sending {} bytes in {} frames to {:X} on '{}' ",data.size(),frames.size(),id,m_channel);
    {
      std::lock_guard<std::mutex> lock(m_mutexState);
      m_peerBlockSize = 0;
      m_peerStMinUs = 0;
    }

    unsigned blockCount = 0;
    for(size_t i = 0;i < frames.size();i++) {
      const CanIsoTpFrameC &frame = frames[i];
      WaitWhile(g_txBlockingFlags);

      uint32_t stMinUs = 0;
      {
        std::lock_guard<std::mutex> lock(m_mutexState);
        stMinUs = m_peerStMinUs;
      }
      if(i > 0 && stMinUs > 0)
        std::this_thread::sleep_for(std::chrono::microseconds(stMinUs));

      CanMessageC msg;
      if(!frame.IntoCanMessage(id,m_config,msg))
        throw ExceptionIsoTpC(IE_ConvertError,fmt::format("Failed to convert {} into a CAN message",frame.ToString()));
      msg.SetChannel(m_channel);

      {
        std::lock_guard<std::mutex> lock(m_mutexState);
        m_state |= IS_Sending;
        bool isLast = (i + 1) == frames.size();
        if(isLast) {
          // Expect the peer's response next.
          m_state |= IS_WaitSingle | IS_WaitFirst;
        } else {
          if(i == 0) {
            m_state |= IS_WaitFlowCtrl;
          } else if(m_peerBlockSize != 0 && ++blockCount >= m_peerBlockSize) {
            blockCount = 0;
            m_state |= IS_WaitFlowCtrl;
          }
        }
      }

      if(!m_sender.Send(msg)) {
        SetError(IE_DeviceError,fmt::format("Failed to queue frame {} of {}",i + 1,frames.size()));
        throw ExceptionIsoTpC(IE_DeviceError,"Device closed");
      }
    }

    // Wait for the last frame to go out.
    WaitWhile(IS_Sending);
  }

  // -----------------------------------------------------

  SyncCanIsoTpC::SyncCanIsoTpC(const std::string &channel,
                               const IsoTpAddressC &address,
                               const CanSenderC &sender,
                               const IsoTpConfigC &config)
    : CanIsoTpC(channel,address,sender,config)
  {}

  void SyncCanIsoTpC::Write(bool functional,const ByteArrayT &data)
  {
    WriteFrames(functional,data);
  }

  // -----------------------------------------------------

  AsyncCanIsoTpC::AsyncCanIsoTpC(const std::string &channel,
                                 const IsoTpAddressC &address,
                                 const CanSenderC &sender,
                                 const IsoTpConfigC &config)
    : CanIsoTpC(channel,address,sender,config)
  {}

  std::future<void> AsyncCanIsoTpC::Write(bool functional,const ByteArrayT &data)
  {
    return std::async(std::launch::async,[this,functional,data]{ WriteFrames(functional,data); });
  }

}
