#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include <atomic>

#include "cantypes/SyncCanDevice.hh"
#include "cantypes/AsyncCanDevice.hh"
#include "cantypes/CanDriverVirtual.hh"

namespace {

using namespace CanTypesN;

//! Keeps everything it sees so tests can check it.

class CollectListenerC
 : public CanListenerC
{
public:
  virtual void OnFrameTransmitted(const IdC &id,const std::string &channel) override
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_transmitted.push_back(id);
    m_changed.notify_all();
  }

  virtual void OnFrameReceived(const std::vector<CanMessageC> &frames,const std::string &channel) override
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    for(auto &a : frames)
      m_received.push_back(a);
    m_lastChannel = channel;
    m_changed.notify_all();
  }

  //! Wait until at least 'count' frames have been received.
  bool WaitForReceived(size_t count,int timeoutMs = 2000)
  {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_changed.wait_for(lock,std::chrono::milliseconds(timeoutMs),[this,count]{ return m_received.size() >= count; });
  }

  std::vector<CanMessageC> Received()
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_received;
  }

  std::vector<IdC> Transmitted()
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_transmitted;
  }

  std::string LastChannel()
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastChannel;
  }

protected:
  std::mutex m_mutex;
  std::condition_variable m_changed;
  std::vector<CanMessageC> m_received;
  std::vector<IdC> m_transmitted;
  std::string m_lastChannel;
};

std::shared_ptr<CanDriverC> OpenVirtual(const std::string &bus,bool canFd = false)
{
  std::shared_ptr<CanDriverC> driver = MakeDriver("virtual");
  if(!driver || !driver->Open(bus,canFd))
    return std::shared_ptr<CanDriverC>();
  return driver;
}

CanMessageC MakeFrame(uint32_t id,const ByteArrayT &data)
{
  CanMessageC msg;
  EXPECT_TRUE(CanMessageC::Create(IdC::FromBits(id),data,msg));
  return msg;
}

TEST(CanDriver, MakeDriver) {
  EXPECT_TRUE((bool) MakeDriver("socketcan"));
  EXPECT_TRUE((bool) MakeDriver("virtual"));
  EXPECT_FALSE((bool) MakeDriver("serial"));
}

TEST(CanDriver, VirtualBusDelivery) {
  std::shared_ptr<CanDriverC> a = OpenVirtual("vbus-delivery");
  std::shared_ptr<CanDriverC> b = OpenVirtual("vbus-delivery");
  std::shared_ptr<CanDriverC> other = OpenVirtual("vbus-delivery-other");
  ASSERT_TRUE(a && b && other);
  EXPECT_EQ(VirtualBusC::Get("vbus-delivery")->DriverCount(), 2u);

  ASSERT_TRUE(a->Transmit(MakeFrame(0x123, ByteArrayT{1, 2, 3})));

  std::vector<CanMessageC> frames;
  ASSERT_TRUE(b->Receive(frames, 100));
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0].Id().AsRaw(), 0x123u);
  EXPECT_EQ(frames[0].Channel(), "vbus-delivery");
  EXPECT_EQ(frames[0].Direct(), D_Receive);

  // The sender and other buses don't see the frame.
  frames.clear();
  ASSERT_TRUE(a->Receive(frames, 0));
  EXPECT_TRUE(frames.empty());
  ASSERT_TRUE(other->Receive(frames, 0));
  EXPECT_TRUE(frames.empty());
}

TEST(CanDriver, VirtualRejectsCanFdWhenDisabled) {
  std::shared_ptr<CanDriverC> classic = OpenVirtual("vbus-fd");
  std::shared_ptr<CanDriverC> fd = OpenVirtual("vbus-fd", true);
  ASSERT_TRUE(classic && fd);
  CanMessageC msg = MakeFrame(0x10, ByteArrayT(16, 0x01));
  EXPECT_FALSE(classic->Transmit(msg));
  EXPECT_TRUE(fd->Transmit(msg));

  classic->Close();
  EXPECT_FALSE(classic->IsReady());
  EXPECT_FALSE(classic->Transmit(MakeFrame(0x10, ByteArrayT{1})));
  std::vector<CanMessageC> frames;
  EXPECT_FALSE(classic->Receive(frames, 0));
}

TEST(CanDevice, Listeners) {
  CanDeviceC device(OpenVirtual("vbus-listeners"));
  std::shared_ptr<CollectListenerC> listener = std::make_shared<CollectListenerC>();
  EXPECT_TRUE(device.RegisterListener("b", listener));
  EXPECT_TRUE(device.RegisterListener("a", std::make_shared<CollectListenerC>()));
  EXPECT_FALSE(device.RegisterListener("a", listener));
  EXPECT_FALSE(device.RegisterListener("c", std::shared_ptr<CanListenerC>()));
  EXPECT_EQ(device.ListenerNames(), (std::vector<std::string>{"a", "b"}));

  EXPECT_TRUE(device.UnregisterListener("a"));
  EXPECT_FALSE(device.UnregisterListener("a"));
  EXPECT_TRUE(device.UnregisterAll());
  EXPECT_TRUE(device.ListenerNames().empty());
}

TEST(CanDevice, TransmitAndReceiveOnce) {
  CanDeviceC sender(OpenVirtual("vbus-once"));
  CanDeviceC receiver(OpenVirtual("vbus-once"));
  std::shared_ptr<CollectListenerC> txListener = std::make_shared<CollectListenerC>();
  std::shared_ptr<CollectListenerC> rxListener = std::make_shared<CollectListenerC>();
  ASSERT_TRUE(sender.RegisterListener("tx", txListener));
  ASSERT_TRUE(receiver.RegisterListener("rx", rxListener));

  EXPECT_EQ(sender.TransmitOnce(), 0);
  ASSERT_TRUE(sender.Sender().Send(MakeFrame(0x100, ByteArrayT{1})));
  ASSERT_TRUE(sender.Sender().Send(MakeFrame(0x18DA10F1, ByteArrayT{2})));
  EXPECT_EQ(sender.TransmitOnce(), 2);

  std::vector<IdC> transmitted = txListener->Transmitted();
  ASSERT_EQ(transmitted.size(), 2u);
  EXPECT_EQ(transmitted[1].AsRaw(), 0x18DA10F1u);

  ASSERT_TRUE(receiver.ReceiveOnce(100));
  std::vector<CanMessageC> received = rxListener->Received();
  ASSERT_EQ(received.size(), 2u);
  EXPECT_EQ(received[0].Data()[0], 1);
  EXPECT_TRUE(received[1].IsExtended());
  EXPECT_EQ(rxListener->LastChannel(), "vbus-once");
}

TEST(CanDevice, NoDriver) {
  CanDeviceC device((std::shared_ptr<CanDriverC>()));
  EXPECT_FALSE(device.Sender().Send(MakeFrame(0x1, ByteArrayT{1})));
  EXPECT_FALSE(device.ReceiveOnce(0));
  EXPECT_FALSE(CanSenderC().Send(MakeFrame(0x1, ByteArrayT{1})));
}

TEST(SyncCanDevice, ThreadsDeliverFrames) {
  std::shared_ptr<SyncCanDeviceC> a = std::make_shared<SyncCanDeviceC>(OpenVirtual("vbus-sync"));
  std::shared_ptr<SyncCanDeviceC> b = std::make_shared<SyncCanDeviceC>(OpenVirtual("vbus-sync"));
  std::shared_ptr<CollectListenerC> listener = std::make_shared<CollectListenerC>();
  ASSERT_TRUE(b->RegisterListener("collect", listener));
  ASSERT_TRUE(a->SyncStart(5));
  ASSERT_TRUE(b->SyncStart(5));
  EXPECT_FALSE(a->SyncStart(5));
  EXPECT_TRUE(a->IsRunning());

  for(int i = 0;i < 5;i++)
    ASSERT_TRUE(a->Sender().Send(MakeFrame(0x200 + i, ByteArrayT{(uint8_t) i})));
  ASSERT_TRUE(listener->WaitForReceived(5));
  std::vector<CanMessageC> received = listener->Received();
  EXPECT_EQ(received[4].Id().AsRaw(), 0x204u);

  a->Close();
  EXPECT_FALSE(a->IsRunning());
  EXPECT_FALSE(a->Driver()->IsReady());
  EXPECT_FALSE(a->Sender().Send(MakeFrame(0x300, ByteArrayT{1})));
  b->Close();
}

TEST(AsyncCanDevice, TasksDeliverFrames) {
  std::shared_ptr<AsyncCanDeviceC> a = std::make_shared<AsyncCanDeviceC>(OpenVirtual("vbus-async"));
  std::shared_ptr<AsyncCanDeviceC> b = std::make_shared<AsyncCanDeviceC>(OpenVirtual("vbus-async"));
  std::shared_ptr<CollectListenerC> listener = std::make_shared<CollectListenerC>();
  ASSERT_TRUE(b->RegisterListener("collect", listener));
  ASSERT_TRUE(a->AsyncStart(5));
  ASSERT_TRUE(b->AsyncStart(5));

  ASSERT_TRUE(a->Sender().Send(MakeFrame(0x7DF, ByteArrayT{0x02, 0x01, 0x00})));
  ASSERT_TRUE(listener->WaitForReceived(1));

  std::future<void> closeA = a->Close();
  std::future<void> closeB = b->Close();
  ASSERT_EQ(closeA.wait_for(std::chrono::seconds(2)), std::future_status::ready);
  ASSERT_EQ(closeB.wait_for(std::chrono::seconds(2)), std::future_status::ready);
  EXPECT_FALSE(a->IsRunning());
  EXPECT_FALSE(b->IsRunning());
  EXPECT_FALSE(a->Driver()->IsReady());
  EXPECT_FALSE(b->Driver()->IsReady());
}

//! Virtual driver that takes a while to close.

class SlowCloseDriverC
 : public CanDriverVirtualC
{
public:
  virtual void Close() override
  {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    CanDriverVirtualC::Close();
    m_closed = true;
  }

  bool IsClosed() const
  { return m_closed; }

protected:
  std::atomic<bool> m_closed { false };
};

TEST(AsyncCanDevice, CloseCompletesAfterDriverShutdown) {
  std::shared_ptr<SlowCloseDriverC> driver = std::make_shared<SlowCloseDriverC>();
  ASSERT_TRUE(driver->Open("vbus-async-close", false));
  std::shared_ptr<AsyncCanDeviceC> device = std::make_shared<AsyncCanDeviceC>(driver);
  ASSERT_TRUE(device->AsyncStart(5));

  std::future<void> closing = device->Close();
  ASSERT_EQ(closing.wait_for(std::chrono::seconds(2)), std::future_status::ready);
  EXPECT_TRUE(driver->IsClosed());
  EXPECT_FALSE(driver->IsReady());
  EXPECT_FALSE(device->IsRunning());
  EXPECT_FALSE(device->Sender().Send(MakeFrame(0x100, ByteArrayT{1})));
}

TEST(SyncCanDevice, StartFailsWithoutDriver) {
  SyncCanDeviceC device((std::shared_ptr<CanDriverC>()));
  EXPECT_FALSE(device.SyncStart(5));
}

}  // namespace
