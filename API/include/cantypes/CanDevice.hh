#ifndef CANTYPES_CANDEVICE_HEADER
#define CANTYPES_CANDEVICE_HEADER 1

#include <map>
#include <deque>
#include <mutex>
#include <atomic>
#include <condition_variable>
#include "cantypes/CanDriver.hh"

namespace CanTypesN {

  //! Interface for objects interested in traffic on a device.

  class CanListenerC
  {
  public:
    //! virtual destructor to keep the compiler happy.
    virtual ~CanListenerC();

    //! Called after a frame has been transmitted successfully.
    virtual void OnFrameTransmitted(const IdC &id,const std::string &channel) = 0;

    //! Called with a batch of frames received on a channel.
    virtual void OnFrameReceived(const std::vector<CanMessageC> &frames,const std::string &channel) = 0;
  };

  //! Queue of frames waiting to be transmitted.

  class CanTxQueueC
  {
  public:
    CanTxQueueC()
    {}

    //! Add a frame, fails once the queue is closed.
    bool Push(const CanMessageC &msg);

    //! Move all queued frames into 'frames'.
    void PopAll(std::vector<CanMessageC> &frames);

    //! Wait until a frame is queued, the queue is closed or the timeout expires.
    void Wait(int timeoutMs);

    //! Wake up anything waiting on the queue.
    void Notify();

    //! Reject all further frames.
    void Close();

    //! Accept frames again.
    void Reopen();

    //! Has the queue been closed ?
    bool IsClosed() const;

  protected:
    mutable std::mutex m_mutexQueue;
    std::condition_variable m_ready;
    std::deque<CanMessageC> m_queue;
    bool m_closed = false;
  };

  //! Handle used to queue frames for transmission on a device.
  //! Copies share the same queue.

  class CanSenderC
  {
  public:
    //! Create an unconnected sender, Send() will always fail.
    CanSenderC()
    {}

    //! Create from a queue.
    explicit CanSenderC(const std::shared_ptr<CanTxQueueC> &queue)
      : m_queue(queue)
    {}

    //! Queue a frame, returns false if the device has been closed.
    bool Send(const CanMessageC &msg) const;

    //! Is the sender connected to a device ?
    bool IsValid() const
    { return (bool) m_queue; }

  protected:
    std::shared_ptr<CanTxQueueC> m_queue;
  };

  //! Base class for devices, manages listeners and the transmit queue.

  class CanDeviceC
  {
  public:
    //! Construct with a driver, the driver should already be open.
    CanDeviceC(const std::shared_ptr<CanDriverC> &driver);

    //! Destructor
    virtual ~CanDeviceC();

    //! Access the driver.
    const std::shared_ptr<CanDriverC> &Driver() const
    { return m_driver; }

    //! Set the logger to use
    virtual void SetLogger(const std::shared_ptr<spdlog::logger> &log);

    //! Get a sender for transmitting frames.
    CanSenderC Sender() const
    { return CanSenderC(m_txQueue); }

    //! Register a listener.
    //! Returns false if the name is already in use or the listener is empty.
    bool RegisterListener(const std::string &name,const std::shared_ptr<CanListenerC> &listener);

    //! Unregister a listener, returns false if the name isn't known.
    bool UnregisterListener(const std::string &name);

    //! Unregister all listeners.
    bool UnregisterAll();

    //! Names of registered listeners in sorted order.
    std::vector<std::string> ListenerNames() const;

    //! Transmit all queued frames.
    //! Returns the number of frames sent successfully.
    int TransmitOnce();

    //! Wait up to timeoutMs for frames and pass them to the listeners.
    //! Returns false if the driver reported an error.
    bool ReceiveOnce(int timeoutMs);

    //! Are the transmit and receive loops running ?
    bool IsRunning() const
    { return m_running; }

  protected:
    //! Body of the transmit loop.
    void RunTransmit(int intervalMs);

    //! Body of the receive loop.
    void RunReceive(int intervalMs);

    //! Close the queue and driver once the loops have exited.
    void ShutdownDriver();

    //! Get a copy of the listeners so they can be called without holding the lock.
    std::vector<std::shared_ptr<CanListenerC> > Listeners() const;

    std::shared_ptr<CanDriverC> m_driver;
    std::shared_ptr<CanTxQueueC> m_txQueue;

    mutable std::mutex m_mutexListeners;
    std::map<std::string,std::shared_ptr<CanListenerC> > m_listeners;

    std::atomic<bool> m_terminate;
    std::atomic<bool> m_running;

    std::shared_ptr<spdlog::logger> m_log = DefaultLogger();
  };

}

#endif
