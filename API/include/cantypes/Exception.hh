#ifndef CANTYPES_EXCEPTION_HEADER
#define CANTYPES_EXCEPTION_HEADER 1

#include <exception>
#include <string>

namespace CanTypesN {

  //! Exception thrown if we find an error in a configuration file.

  class ExceptionBadConfigC
   : public std::exception
  {
  public:
    ExceptionBadConfigC(const std::string &msg)
      : m_msg(msg)
    {}

    virtual const char *what() const noexcept override
    { return m_msg.c_str(); }

  protected:
    std::string m_msg;
  };

  //! ISO-TP error codes.

  enum IsoTpErrorT {
    IE_EmptyPdu = 0,        // No data to send or decode.
    IE_InvalidPdu,          // Frame content is malformed.
    IE_InvalidDataLength,   // Frame or payload has the wrong size.
    IE_LengthOutOfRange,    // Payload too large for the frame or standard.
    IE_InvalidSequence,     // Consecutive frame out of order.
    IE_MixFrames,           // Consecutive frame without a first frame.
    IE_StateError,          // Frame not expected in the current state.
    IE_ContextError,        // Internal context failure.
    IE_DeviceError,         // Frame could not be handed to the device.
    IE_OverloadFlow,        // Peer reported an overflow.
    IE_ConvertError,        // Frame could not be converted to a CAN message.
    IE_Timeout,             // Peer didn't respond in time.
    IE_InvalidStMin,        // Separation time value is reserved.
    IE_InvalidParam         // Bad argument.
  };

  //! Exception thrown for ISO-TP protocol errors.

  class ExceptionIsoTpC
   : public std::exception
  {
  public:
    ExceptionIsoTpC(IsoTpErrorT code,const std::string &msg)
      : m_code(code),
        m_msg(msg)
    {}

    //! Error code.
    IsoTpErrorT Code() const
    { return m_code; }

    virtual const char *what() const noexcept override
    { return m_msg.c_str(); }

  protected:
    IsoTpErrorT m_code;
    std::string m_msg;
  };

}

#endif
