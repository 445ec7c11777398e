#ifndef CANTYPES_ASYNCCANDEVICE_HEADER
#define CANTYPES_ASYNCCANDEVICE_HEADER 1

#include <future>
#include "cantypes/CanDevice.hh"

namespace CanTypesN {

  //! Device serviced by asynchronous tasks.

  class AsyncCanDeviceC
   : public CanDeviceC
  {
  public:
    //! Construct with a driver, the driver should already be open.
    AsyncCanDeviceC(const std::shared_ptr<CanDriverC> &driver);

    //! Waits for any pending close to complete.
    virtual ~AsyncCanDeviceC();

    //! Launch the transmit and receive tasks.
    bool AsyncStart(int intervalMs = 10);

    //! Stop the tasks and close the driver.
    //! The returned future is ready once both tasks have exited and the driver is closed.
    std::future<void> Close();

  protected:
    //! Wait for the tasks to exit and shut down the driver.
    void StopTasks();

    std::mutex m_mutexStartStop;
    std::mutex m_mutexClose;
    std::future<void> m_taskTransmit;
    std::future<void> m_taskReceive;
    std::shared_future<void> m_closing;
  };

}

#endif
