#ifndef CANTYPES_SYNCCANDEVICE_HEADER
#define CANTYPES_SYNCCANDEVICE_HEADER 1

#include <thread>
#include "cantypes/CanDevice.hh"

namespace CanTypesN {

  //! Device serviced by a transmit thread and a receive thread.

  class SyncCanDeviceC
   : public CanDeviceC
  {
  public:
    //! Construct with a driver, the driver should already be open.
    SyncCanDeviceC(const std::shared_ptr<CanDriverC> &driver);

    //! Stops the threads and closes the driver.
    virtual ~SyncCanDeviceC();

    //! Start the transmit and receive threads.
    //! intervalMs is the longest either loop waits before checking for termination.
    bool SyncStart(int intervalMs = 10);

    //! Stop the threads and close the driver.
    void Close();

  protected:
    std::mutex m_mutexStartStop;
    std::thread m_threadTransmit;
    std::thread m_threadReceive;
  };

}

#endif
