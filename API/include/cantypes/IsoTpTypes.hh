#ifndef CANTYPES_ISOTPTYPES_HEADER
#define CANTYPES_ISOTPTYPES_HEADER 1

#include <string>
#include <jsoncpp/json/json.h>
#include "cantypes/Types.hh"
#include "cantypes/Exception.hh"

namespace CanTypesN {

  //! ISO-TP state flags, these may be combined.

  enum IsoTpStateT {
    IS_Idle            = 0x00,
    IS_WaitSingle      = 0x01,
    IS_WaitFirst       = 0x02,
    IS_WaitFlowCtrl    = 0x04,
    IS_WaitData        = 0x08,
    IS_WaitBusy        = 0x10,
    IS_ResponsePending = 0x20,
    IS_Sending         = 0x40,
    IS_Error           = 0x80
  };

  typedef unsigned IsoTpStateFlagsT;

  //! Protocol control information, the high nibble of the first byte.

  enum IsoTpFrameTypeT {
    FT_Single      = 0x00,
    FT_First       = 0x10,
    FT_Consecutive = 0x20,
    FT_FlowControl = 0x30
  };

  enum FlowControlStateT {
    FCS_Continues = 0,
    FCS_Wait      = 1,
    FCS_Overload  = 2
  };

  //! Which revision of ISO 15765-2 to follow.

  enum IsoTpStandardT {
    ITS_2004 = 0,
    ITS_2016 = 1
  };

  //! Content of a flow control frame.

  class FlowControlContextC
  {
  public:
    //! Continue to send, no block limit and no separation time.
    FlowControlContextC()
    {}

    //! Construct from fields.
    //! Throws ExceptionIsoTpC if stMin is a reserved value.
    FlowControlContextC(FlowControlStateT state,uint8_t blockSize,uint8_t stMin);

    //! Test if a separation time value is valid.
    //! 0x00-0x7F are milliseconds, 0xF1-0xF9 are 100-900 microseconds.
    static bool IsValidStMin(uint8_t stMin)
    { return stMin <= 0x7F || (stMin >= 0xF1 && stMin <= 0xF9); }

    FlowControlStateT State() const
    { return m_state; }

    //! Number of consecutive frames to send before waiting for the next flow control, 0 for no limit.
    uint8_t BlockSize() const
    { return m_blockSize; }

    //! Raw separation time.
    uint8_t StMin() const
    { return m_stMin; }

    //! Separation time in microseconds.
    uint32_t StMinMicroseconds() const;

  protected:
    FlowControlStateT m_state = FCS_Continues;
    uint8_t m_blockSize = 0;
    uint8_t m_stMin = 0;
  };

  //! CAN ids used by an ISO-TP channel.

  class IsoTpAddressC
  {
  public:
    IsoTpAddressC()
    {}

    //! \param txId physical id frames are sent with.
    //! \param rxId id of frames addressed to us.
    //! \param fid functional id used for broadcast requests.
    IsoTpAddressC(uint32_t txId,uint32_t rxId,uint32_t fid)
      : m_txId(txId),
        m_rxId(rxId),
        m_fid(fid)
    {}

    uint32_t TxId() const
    { return m_txId; }

    uint32_t RxId() const
    { return m_rxId; }

    uint32_t Fid() const
    { return m_fid; }

    bool operator==(const IsoTpAddressC &other) const
    { return m_txId == other.m_txId && m_rxId == other.m_rxId && m_fid == other.m_fid; }

    //! Get the address as JSON
    void ConfigAsJSON(Json::Value &value) const;

    //! Configure from JSON, throws ExceptionBadConfigC on errors.
    void ConfigureFromJSON(const Json::Value &value);

  protected:
    uint32_t m_txId = 0;
    uint32_t m_rxId = 0;
    uint32_t m_fid = 0;
  };

  //! Protocol options for an ISO-TP channel.

  class IsoTpConfigC
  {
  public:
    IsoTpConfigC()
    {}

    IsoTpStandardT Standard() const
    { return m_standard; }

    IsoTpConfigC &SetStandard(IsoTpStandardT standard)
    { m_standard = standard; return *this; }

    bool IsCanFd() const
    { return m_canFd; }

    IsoTpConfigC &SetCanFd(bool canFd)
    { m_canFd = canFd; return *this; }

    //! Byte used to fill unused space in frames.
    uint8_t Padding() const
    { return m_padding; }

    IsoTpConfigC &SetPadding(uint8_t padding)
    { m_padding = padding; return *this; }

    //! Block size sent in our flow control frames.
    uint8_t BlockSize() const
    { return m_blockSize; }

    IsoTpConfigC &SetBlockSize(uint8_t blockSize)
    { m_blockSize = blockSize; return *this; }

    //! Separation time sent in our flow control frames.
    uint8_t StMin() const
    { return m_stMin; }

    //! Set separation time, throws ExceptionIsoTpC for reserved values.
    IsoTpConfigC &SetStMin(uint8_t stMin);

    //! How long to wait for the peer before giving up.
    int TimeoutMs() const
    { return m_timeoutMs; }

    IsoTpConfigC &SetTimeoutMs(int timeoutMs)
    { m_timeoutMs = timeoutMs; return *this; }

    //! A responder accepts requests that arrive without a write of its own.
    //! Otherwise single and first frames are only accepted in reply to a write.
    bool IsResponder() const
    { return m_responder; }

    IsoTpConfigC &SetResponder(bool responder)
    { m_responder = responder; return *this; }

    //! Size of a full frame, 8 or 64 bytes.
    size_t MaxFrameSize() const
    { return m_canFd ? CANFD_FRAME_MAX_SIZE : CAN_FRAME_MAX_SIZE; }

    //! Largest payload the standard allows.
    uint32_t MaxLength() const
    { return m_standard == ITS_2016 ? ISOTP_MAX_LENGTH_2016 : ISOTP_MAX_LENGTH_2004; }

    //! Get the configuration as JSON
    void ConfigAsJSON(Json::Value &value) const;

    //! Configure from JSON, missing fields keep their current values.
    //! Throws ExceptionBadConfigC on errors.
    void ConfigureFromJSON(const Json::Value &value);

  protected:
    IsoTpStandardT m_standard = ITS_2016;
    bool m_canFd = false;
    uint8_t m_padding = CAN_DEFAULT_PADDING;
    uint8_t m_blockSize = 0;
    uint8_t m_stMin = 0;
    int m_timeoutMs = 1000;
    bool m_responder = false;
  };

  enum IsoTpEventTypeT {
    IET_Wait = 0,
    IET_FirstFrameReceived,
    IET_DataReceived,
    IET_ErrorOccurred
  };

  //! Event reported to ISO-TP listeners.

  class IsoTpEventC
  {
  public:
    IsoTpEventC()
    {}

    static IsoTpEventC Wait()
    { return IsoTpEventC(IET_Wait); }

    static IsoTpEventC FirstFrameReceived()
    { return IsoTpEventC(IET_FirstFrameReceived); }

    static IsoTpEventC DataReceived(const ByteArrayT &data)
    {
      IsoTpEventC ret(IET_DataReceived);
      ret.m_data = data;
      return ret;
    }

    static IsoTpEventC ErrorOccurred(IsoTpErrorT error,const std::string &message)
    {
      IsoTpEventC ret(IET_ErrorOccurred);
      ret.m_error = error;
      ret.m_message = message;
      return ret;
    }

    IsoTpEventTypeT Type() const
    { return m_type; }

    //! Payload of a DataReceived event.
    const ByteArrayT &Data() const
    { return m_data; }

    //! Error code of an ErrorOccurred event.
    IsoTpErrorT Error() const
    { return m_error; }

    //! Description of an ErrorOccurred event.
    const std::string &Message() const
    { return m_message; }

  protected:
    explicit IsoTpEventC(IsoTpEventTypeT type)
      : m_type(type)
    {}

    IsoTpEventTypeT m_type = IET_Wait;
    ByteArrayT m_data;
    IsoTpErrorT m_error = IE_EmptyPdu;
    std::string m_message;
  };

  //! Read a CAN id from JSON, either a number or a hex string.
  //! Returns defaultValue if the key is missing, throws ExceptionBadConfigC if it's invalid.
  uint32_t ReadIdFromJSON(const Json::Value &value,const char *key,uint32_t defaultValue);

  //! Read typed values from JSON.
  //! Return defaultValue if the key is missing, throw ExceptionBadConfigC naming the key if it has the wrong type.
  bool ReadBoolFromJSON(const Json::Value &value,const char *key,bool defaultValue);
  int ReadIntFromJSON(const Json::Value &value,const char *key,int defaultValue);
  std::string ReadStringFromJSON(const Json::Value &value,const char *key,const std::string &defaultValue);

}

#endif
