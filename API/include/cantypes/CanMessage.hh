#ifndef CANTYPES_CANMESSAGE_HEADER
#define CANTYPES_CANMESSAGE_HEADER 1

#include "cantypes/Frame.hh"

namespace CanTypesN {

  //! Round a payload length up to the next valid CAN-FD length.
  //! Returns false if the length is larger than 64 bytes.
  bool CanFdResize(size_t length,size_t &resized);

  //! Convert a payload length to a data length code.
  uint8_t LengthToDlc(size_t length);

  //! Convert a data length code to a payload length.
  size_t DlcToLength(uint8_t dlc);

  //! Frame on a CAN bus, channels are identified by name.

  class CanMessageC
   : public FrameC<std::string>
  {
  public:
    //! Default, empty standard data frame with id 0.
    CanMessageC()
    {}

    //! Create a data frame.
    //! Fails if the payload is larger than 64 bytes.
    //! Payloads over 8 bytes make a CAN-FD frame, zero padded to a valid length.
    static bool Create(const IdC &id,const ByteArrayT &data,CanMessageC &msg);

    //! Create a remote frame.
    //! Fails if len is larger than 8.
    static bool CreateRemote(const IdC &id,size_t len,CanMessageC &msg);

    virtual TimestampT Timestamp() const override
    { return m_timestamp; }

    virtual CanMessageC &SetTimestamp(TimestampT value) override
    {
      m_timestamp = value;
      return *this;
    }

    //! Set the timestamp to now.
    CanMessageC &SetTimestampNow()
    { return SetTimestamp(TimestampNow()); }

    virtual IdC Id(ProtocolT protocol = P_Can) const override;

    virtual bool IsCanFd() const override
    { return m_isCanFd; }

    virtual CanMessageC &SetCanFd(bool value) override;

    virtual bool IsRemote() const override
    { return m_isRemote; }

    virtual bool IsExtended() const override
    { return m_id.IsExtended(); }

    virtual DirectT Direct() const override
    { return m_direct; }

    virtual CanMessageC &SetDirect(DirectT direct) override
    {
      m_direct = direct;
      return *this;
    }

    virtual bool IsBitrateSwitch() const override
    { return m_isBitrateSwitch; }

    virtual CanMessageC &SetBitrateSwitch(bool value) override
    {
      m_isBitrateSwitch = value;
      return *this;
    }

    virtual bool IsErrorFrame() const override
    { return m_isErrorFrame; }

    virtual CanMessageC &SetErrorFrame(bool value) override
    {
      m_isErrorFrame = value;
      return *this;
    }

    virtual bool IsEsi() const override
    { return m_isEsi; }

    virtual CanMessageC &SetEsi(bool value) override
    {
      m_isEsi = value;
      return *this;
    }

    virtual const std::string &Channel() const override
    { return m_channel; }

    virtual CanMessageC &SetChannel(const std::string &value) override
    {
      m_channel = value;
      return *this;
    }

    virtual const ByteArrayT &Data() const override
    { return m_data; }

    virtual size_t Dlc() const override;

    virtual size_t Length() const override;

    //! Frame as a line of an ASC log.
    std::string ToString() const
    { return FormatAsc(*this); }

  protected:
    TimestampT m_timestamp = 0;
    IdC m_id;
    DirectT m_direct = D_Transmit;
    bool m_isCanFd = false;
    bool m_isRemote = false;
    bool m_isErrorFrame = false;
    bool m_isBitrateSwitch = false;
    bool m_isEsi = false;
    size_t m_remoteLength = 0;
    std::string m_channel;
    ByteArrayT m_data;
  };

}

#endif
