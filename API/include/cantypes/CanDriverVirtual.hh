#ifndef CANTYPES_CANDRIVERVIRTUAL_HEADER
#define CANTYPES_CANDRIVERVIRTUAL_HEADER 1

#include <deque>
#include <mutex>
#include <condition_variable>
#include "cantypes/CanDriver.hh"

namespace CanTypesN {

  class CanDriverVirtualC;

  //! In process CAN bus.
  //! Every frame transmitted by one attached driver is delivered to all the others.

  class VirtualBusC
  {
  public:
    VirtualBusC(const std::string &name);

    //! Find or create the bus with the given name.
    //! A bus exists as long as some driver holds it.
    static std::shared_ptr<VirtualBusC> Get(const std::string &name);

    //! Name of the bus.
    const std::string &Name() const
    { return m_name; }

    //! Attach a driver to the bus.
    void Attach(CanDriverVirtualC *driver);

    //! Detach a driver from the bus.
    void Detach(CanDriverVirtualC *driver);

    //! Deliver a frame to every driver except the sender.
    //! Returns the number of drivers it was delivered to.
    int Broadcast(const CanDriverVirtualC *sender,const CanMessageC &msg);

    //! Number of attached drivers.
    size_t DriverCount();

  protected:
    std::string m_name;
    std::mutex m_mutexDrivers;
    std::vector<CanDriverVirtualC *> m_drivers;
  };

  //! Driver attached to a virtual bus, the bus is selected by the name passed to Open().

  class CanDriverVirtualC
   : public CanDriverC
  {
  public:
    CanDriverVirtualC();

    //! Detaches from the bus.
    virtual ~CanDriverVirtualC();

    //! Attach to the named bus.
    virtual bool Open(const std::string &name,bool canFd) override;

    //! Detach from the bus, any pending frames are dropped.
    virtual void Close() override;

    //! Is the driver attached to a bus ?
    virtual bool IsReady() const override;

    //! Put a frame on the bus.
    virtual bool Transmit(const CanMessageC &msg) override;

    //! Collect frames delivered by the bus.
    virtual bool Receive(std::vector<CanMessageC> &frames,int timeoutMs) override;

    //! Called by the bus to queue an incoming frame.
    void Deliver(const CanMessageC &msg);

  protected:
    std::shared_ptr<VirtualBusC> m_bus;
    mutable std::mutex m_mutexRx;
    std::condition_variable m_rxReady;
    std::deque<CanMessageC> m_rxQueue;
  };

}

#endif
