#ifndef CANTYPES_CANDRIVER_HEADER
#define CANTYPES_CANDRIVER_HEADER 1

#include <string>
#include <vector>
#include <memory>
#include <spdlog/spdlog.h>
#include "cantypes/CanMessage.hh"
#include "cantypes/Util.hh"

namespace CanTypesN {

  //! Low level access to a CAN interface.
  //! Received frames are stamped with the driver name as their channel.

  class CanDriverC
  {
  public:
    CanDriverC();

    //! Destructor
    virtual ~CanDriverC();

    //! Name of the interface, this is the same string as used to open it.
    const std::string &Name() const
    { return m_name; }

    //! Is CAN-FD enabled ?
    bool IsCanFd() const
    { return m_canFd; }

    //! Set the logger to use
    virtual void SetLogger(const std::shared_ptr<spdlog::logger> &log);

    //! Open an interface.
    virtual bool Open(const std::string &name,bool canFd) = 0;

    //! Close the interface.
    virtual void Close() = 0;

    //! Is the interface ready ?
    virtual bool IsReady() const = 0;

    //! Send a frame, returns true if it was accepted by the interface.
    virtual bool Transmit(const CanMessageC &msg) = 0;

    //! Wait up to timeoutMs for frames and append any that arrive to 'frames'.
    //! Returns false on an interface error, a timeout is not an error.
    virtual bool Receive(std::vector<CanMessageC> &frames,int timeoutMs) = 0;

  protected:
    //! Fill in the fields common to all received frames.
    void StampReceived(CanMessageC &msg) const;

    std::string m_name;
    bool m_canFd = false;
    std::shared_ptr<spdlog::logger> m_log = DefaultLogger();
  };

  //! Create a driver by type name, "socketcan" or "virtual".
  //! Returns an empty pointer for unknown names.
  std::shared_ptr<CanDriverC> MakeDriver(const std::string &driverType);

}

#endif
