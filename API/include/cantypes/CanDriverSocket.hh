#ifndef CANTYPES_CANDRIVERSOCKET_HEADER
#define CANTYPES_CANDRIVERSOCKET_HEADER 1

#include <mutex>
#include "cantypes/CanDriver.hh"

namespace CanTypesN {

  //! Linux SocketCAN raw socket driver.

  class CanDriverSocketC
   : public CanDriverC
  {
  public:
    CanDriverSocketC();

    //! Closes the socket.
    virtual ~CanDriverSocketC();

    //! Open an interface such as 'can0' or 'vcan0'
    virtual bool Open(const std::string &name,bool canFd) override;

    //! Close the socket.
    virtual void Close() override;

    //! Is the socket open ?
    virtual bool IsReady() const override;

    //! Write a frame to the socket.
    virtual bool Transmit(const CanMessageC &msg) override;

    //! Read all frames that are available within the timeout.
    virtual bool Receive(std::vector<CanMessageC> &frames,int timeoutMs) override;

  protected:
    int m_fd = -1;
    std::mutex m_accessTx;
  };

}

#endif
