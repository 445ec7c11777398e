#include <iostream>
#include <thread>
#include <chrono>
#include <spdlog/sinks/stdout_sinks.h>

#include "cantypes/CanConfig.hh"
#include "cantypes/CanIsoTpClient.hh"
#include "cantypes/Strings.hh"
#include "cxxopts.hpp"

// Command line access to CAN devices and ISO-TP channels.

namespace {

  //! Print frames as ASC log lines.

  class DumpListenerC
   : public CanTypesN::CanListenerC
  {
  public:
    virtual void OnFrameTransmitted(const CanTypesN::IdC &,const std::string &) override
    {}

    virtual void OnFrameReceived(const std::vector<CanTypesN::CanMessageC> &frames,const std::string &) override
    {
      std::lock_guard<std::mutex> lock(m_mutexOutput);
      for(auto &a : frames)
        std::cout << a.ToString() << std::endl;
    }

  protected:
    std::mutex m_mutexOutput;
  };

  //! Parse a frame in the form 'id#hexdata', ids longer than 3 digits are extended.
  bool ParseFrame(const std::string &text,CanTypesN::CanMessageC &msg)
  {
    size_t at = text.find('#');
    if(at == std::string::npos)
      return false;
    std::string idStr = text.substr(0,at);
    CanTypesN::IdC id;
    if(!CanTypesN::IdC::TryFromHex(idStr,idStr.size() > 3,id))
      return false;
    CanTypesN::ByteArrayT data;
    if(!CanTypesN::ParseHexBytes(text.substr(at+1),data))
      return false;
    return CanTypesN::CanMessageC::Create(id,data,msg);
  }

  //! Parse an ISO-TP address in the form 'tx,rx' or 'tx,rx,fid'.
  bool ParseAddress(const std::string &text,CanTypesN::IsoTpAddressC &address)
  {
    std::vector<uint32_t> ids;
    size_t start = 0;
    while(start <= text.size()) {
      size_t end = text.find(',',start);
      if(end == std::string::npos)
        end = text.size();
      uint64_t value = 0;
      if(!CanTypesN::ParseHex(text.substr(start,end - start),CanTypesN::EFF_MASK,value))
        return false;
      ids.push_back((uint32_t) value);
      start = end + 1;
    }
    if(ids.size() < 2 || ids.size() > 3)
      return false;
    address = CanTypesN::IsoTpAddressC(ids[0],ids[1],ids.size() > 2 ? ids[2] : ids[0]);
    return true;
  }

}

int main(int argc,char **argv)
{
  auto logger = spdlog::stdout_logger_mt("console");

  std::string configFile = CanTypesN::CanConfigC::DefaultConfigFile();
  std::string deviceName = "vcan0";
  std::string sendFrame;
  std::string isoTpAddress;
  std::string payload;
  bool useVirtual = false;
  bool canFd = false;
  bool dump = false;
  bool functional = false;
  bool verbose = false;
  int runTime = 1000;

  try
  {
    cxxopts::Options options(argv[0], "CAN bus tool");
    options
      .positional_help("[optional args]")
      .show_positional_help();

    options.add_options()
      ("c,config", "Configuration file", cxxopts::value<std::string>(configFile))
      ("d,device", "Device name from the configuration, or an interface such as 'can0' ", cxxopts::value<std::string>(deviceName))
      ("v,virtual", "Use a virtual bus instead of SocketCAN", cxxopts::value<bool>(useVirtual))
      ("f,canfd", "Enable CAN-FD", cxxopts::value<bool>(canFd))
      ("u,dump", "Print received frames", cxxopts::value<bool>(dump))
      ("s,send", "Send a frame, 'id#hexdata' ", cxxopts::value<std::string>(sendFrame))
      ("i,isotp", "ISO-TP address 'tx,rx[,fid]' in hex, or 'config' to use the configuration ", cxxopts::value<std::string>(isoTpAddress))
      ("p,payload", "ISO-TP payload in hex", cxxopts::value<std::string>(payload))
      ("g,functional", "Send the ISO-TP payload to the functional address", cxxopts::value<bool>(functional))
      ("t,time", "Time to run in milliseconds, default is 1000", cxxopts::value<int>(runTime))
      ("x,verbose", "Log debug messages", cxxopts::value<bool>(verbose))
      ("h,help", "Print help")
    ;

    auto result = options.parse(argc, argv);

    if (result.count("help"))
    {
      std::cout << options.help({""}) << std::endl;
      exit(0);
    }

  } catch (const cxxopts::OptionException& e)
  {
    std::cout << "error parsing options: " << e.what() << std::endl;
    exit(1);
  }

  if(verbose)
    logger->set_level(spdlog::level::debug);

  CanTypesN::CanConfigC config;
  if(!configFile.empty()) {
    logger->info("Using config file: '{}'",configFile);
    try {
      if(!config.LoadConfig(configFile))
        return 1;
    } catch(CanTypesN::ExceptionBadConfigC &ex) {
      logger->error("Invalid configuration: {} ",ex.what());
      return 1;
    }
  }

  CanTypesN::CanDeviceConfigC deviceConfig;
  if(!config.FindDevice(deviceName,deviceConfig))
    deviceConfig = CanTypesN::CanDeviceConfigC(deviceName,useVirtual ? "virtual" : "socketcan",deviceName,canFd);

  logger->info("Opening '{}' on interface '{}' with driver '{}' ",deviceConfig.Name(),deviceConfig.Interface(),deviceConfig.Driver());
  std::shared_ptr<CanTypesN::CanDriverC> driver = deviceConfig.OpenDriver();
  if(!driver) {
    logger->error("Failed to open '{}' ",deviceConfig.Interface());
    return 1;
  }

  std::shared_ptr<CanTypesN::SyncCanDeviceC> device = std::make_shared<CanTypesN::SyncCanDeviceC>(driver);
  if(dump)
    device->RegisterListener("dump",std::make_shared<DumpListenerC>());
  if(!device->SyncStart(deviceConfig.IntervalMs())) {
    logger->error("Failed to start device. ");
    return 1;
  }

  int ret = 0;
  if(!sendFrame.empty()) {
    CanTypesN::CanMessageC msg;
    if(!ParseFrame(sendFrame,msg)) {
      logger->error("Invalid frame '{}', expected 'id#hexdata' ",sendFrame);
      ret = 1;
    } else if(!device->Sender().Send(msg)) {
      logger->error("Failed to queue frame. ");
      ret = 1;
    }
  }

  if(ret == 0 && !isoTpAddress.empty()) {
    CanTypesN::IsoTpAddressC address;
    CanTypesN::IsoTpChannelConfigC channelConfig;
    const std::string &channel = driver->Name();
    bool haveChannelConfig = config.FindIsoTpChannel(channel,channelConfig);
    if(haveChannelConfig && isoTpAddress == "config") {
      address = channelConfig.Address();
    } else if(!ParseAddress(isoTpAddress,address)) {
      logger->error("Invalid ISO-TP address '{}' ",isoTpAddress);
      device->Close();
      return 1;
    }
    CanTypesN::IsoTpConfigC isoTpConfig = channelConfig.Config();
    if(!haveChannelConfig || !channelConfig.HasCanFd())
      isoTpConfig.SetCanFd(deviceConfig.IsCanFd());
    else if(isoTpConfig.IsCanFd() != deviceConfig.IsCanFd())
      logger->warn("ISO-TP channel '{}' canfd={} differs from device canfd={} ",channel,isoTpConfig.IsCanFd(),deviceConfig.IsCanFd());

    CanTypesN::CanIsoTpClientC client(device);
    client.SetLogger(logger);
    if(!client.AddChannel(channel,address,isoTpConfig)) {
      logger->error("Failed to add ISO-TP channel '{}' ",channel);
      device->Close();
      return 1;
    }
    client.RegisterListener(channel,[logger](const CanTypesN::IsoTpEventC &event) {
      switch(event.Type()) {
      case CanTypesN::IET_DataReceived:
        logger->info("ISO-TP received: {}",CanTypesN::BytesToHex(event.Data()));
        break;
      case CanTypesN::IET_ErrorOccurred:
        logger->warn("ISO-TP error {}: {}",CanTypesN::IsoTpErrorToString(event.Error()),event.Message());
        break;
      default:
        logger->debug("ISO-TP event {}",CanTypesN::IsoTpEventTypeToString(event.Type()));
        break;
      }
    });

    if(!payload.empty()) {
      CanTypesN::ByteArrayT data;
      if(!CanTypesN::ParseHexBytes(payload,data)) {
        logger->error("Invalid payload '{}' ",payload);
        ret = 1;
      } else {
        try {
          client.Write(channel,functional,data);
          logger->info("Sent {} bytes. ",data.size());
        } catch(CanTypesN::ExceptionIsoTpC &ex) {
          logger->error("ISO-TP write failed, {}: {} ",CanTypesN::IsoTpErrorToString(ex.Code()),ex.what());
          ret = 1;
        }
      }
    }
    if(ret == 0 && runTime > 0)
      std::this_thread::sleep_for(std::chrono::milliseconds(runTime));
  } else if(ret == 0 && runTime > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(runTime));
  }

  device->Close();
  return ret;
}
