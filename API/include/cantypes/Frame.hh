#ifndef CANTYPES_FRAME_HEADER
#define CANTYPES_FRAME_HEADER 1

#include <string>
#include <spdlog/fmt/fmt.h>
#include "cantypes/Types.hh"
#include "cantypes/Identifier.hh"

namespace CanTypesN {

  //! Convert a direction to its log file string, "Tx" or "Rx"
  const char *DirectToString(DirectT direct);

  //! Abstract CAN frame, the channel type is what identifies the bus the frame was seen on.

  template<typename ChannelT>
  class FrameC
  {
  public:
    //! Virtual destructor to keep the compiler happy.
    virtual ~FrameC()
    {}

    //! Timestamp in milliseconds.
    virtual TimestampT Timestamp() const = 0;

    //! Set the timestamp in milliseconds.
    virtual FrameC<ChannelT> &SetTimestamp(TimestampT value) = 0;

    //! Identifier, interpreted for the given protocol.
    virtual IdC Id(ProtocolT protocol = P_Can) const = 0;

    virtual bool IsCanFd() const = 0;

    virtual FrameC<ChannelT> &SetCanFd(bool value) = 0;

    virtual bool IsRemote() const = 0;

    virtual bool IsExtended() const = 0;

    //! Frame direction
    virtual DirectT Direct() const = 0;

    virtual FrameC<ChannelT> &SetDirect(DirectT direct) = 0;

    virtual bool IsBitrateSwitch() const = 0;

    virtual FrameC<ChannelT> &SetBitrateSwitch(bool value) = 0;

    virtual bool IsErrorFrame() const = 0;

    virtual FrameC<ChannelT> &SetErrorFrame(bool value) = 0;

    //! Error state indicator
    virtual bool IsEsi() const = 0;

    //! Set error state indicator
    virtual FrameC<ChannelT> &SetEsi(bool value) = 0;

    //! Channel the frame belongs to.
    virtual const ChannelT &Channel() const = 0;

    virtual FrameC<ChannelT> &SetChannel(const ChannelT &value) = 0;

    //! Payload bytes.
    virtual const ByteArrayT &Data() const = 0;

    //! Data length code.
    virtual size_t Dlc() const = 0;

    //! Payload length in bytes.
    virtual size_t Length() const = 0;
  };

  //! Format a frame as a line of a Vector ASC log file.

  template<typename ChannelT>
  std::string FormatAsc(const FrameC<ChannelT> &frame)
  {
    std::string dataStr;
    if(frame.IsRemote()) {
      dataStr = " ";
    } else {
      for(auto b : frame.Data())
        dataStr += fmt::format("{:02x} ",b);
    }
    double seconds = (double) frame.Timestamp() / 1000.0;

    if(frame.IsCanFd()) {
      unsigned flags = 1 << 12;
      if(frame.IsBitrateSwitch())
        flags |= 1 << 13;
      if(frame.IsEsi())
        flags |= 1 << 14;
      // Message duration, message length, flags, crc and bit timing fields follow the data.
      return fmt::format("{:.3f} CANFD {} {} {:>8x} {} {} {:>2} {:>2} {} {:>8} {:<4} {:>8x} {:>8} {:>8} {:>8} {:>8} {:>8}",
                         seconds,
                         frame.Channel(),
                         DirectToString(frame.Direct()),
                         frame.Id().AsRaw(),
                         frame.IsBitrateSwitch() ? 1 : 0,
                         frame.IsEsi() ? 1 : 0,
                         frame.Dlc(),
                         frame.Length(),
                         dataStr,
                         0,
                         0,
                         flags,
                         0,
                         0,
                         0,
                         0,
                         0
                         );
    }

    return fmt::format("{:.3f} {} {:>8x}{:<4} {} {} {:>2} {}",
                       seconds,
                       frame.Channel(),
                       frame.Id().AsRaw(),
                       frame.IsExtended() ? "x" : "",
                       DirectToString(frame.Direct()),
                       frame.IsRemote() ? "r" : "d",
                       frame.Length(),
                       dataStr
                       );
  }

}

#endif
