
#include <fstream>
#include <cstdlib>
#include <sys/stat.h>
#include "cantypes/CanConfig.hh"
#include <spdlog/fmt/fmt.h>

namespace CanTypesN {

  static bool FileExists(const std::string &filename)
  {
    struct stat sb;
    return stat(filename.c_str(),&sb) == 0 && S_ISREG(sb.st_mode);
  }

  // -----------------------------------------------------

  std::shared_ptr<CanDriverC> CanDeviceConfigC::OpenDriver() const
  {
    std::shared_ptr<CanDriverC> driver = MakeDriver(m_driver);
    if(!driver) {
      DefaultLogger()->error("Unknown driver type '{}' for device '{}' ",m_driver,m_name);
      return driver;
    }
    if(!driver->Open(m_interface,m_canFd))
      return std::shared_ptr<CanDriverC>();
    return driver;
  }

  void CanDeviceConfigC::ConfigAsJSON(Json::Value &value) const
  {
    value["name"] = m_name;
    value["driver"] = m_driver;
    value["interface"] = m_interface;
    value["canfd"] = m_canFd;
    value["interval_ms"] = m_intervalMs;
  }

  void CanDeviceConfigC::ConfigureFromJSON(const Json::Value &value)
  {
    if(!value.isObject())
      throw ExceptionBadConfigC("Device entry must be a JSON object");
    m_interface = ReadStringFromJSON(value,"interface","");
    if(m_interface.empty())
      throw ExceptionBadConfigC("Device requires an 'interface'");
    m_name = ReadStringFromJSON(value,"name",m_interface);
    m_driver = ReadStringFromJSON(value,"driver","socketcan");
    if(m_driver != "socketcan" && m_driver != "virtual")
      throw ExceptionBadConfigC(fmt::format("Unknown driver '{}' for device '{}'",m_driver,m_name));
    m_canFd = ReadBoolFromJSON(value,"canfd",false);
    m_intervalMs = ReadIntFromJSON(value,"interval_ms",10);
    if(m_intervalMs <= 0)
      throw ExceptionBadConfigC(fmt::format("Device '{}' 'interval_ms' must be positive",m_name));
  }

  // -----------------------------------------------------

  void IsoTpChannelConfigC::ConfigAsJSON(Json::Value &value) const
  {
    value["channel"] = m_channel;
    m_address.ConfigAsJSON(value);
    m_config.ConfigAsJSON(value);
  }

  void IsoTpChannelConfigC::ConfigureFromJSON(const Json::Value &value)
  {
    if(!value.isObject())
      throw ExceptionBadConfigC("ISO-TP entry must be a JSON object");
    m_channel = ReadStringFromJSON(value,"channel","");
    if(m_channel.empty())
      throw ExceptionBadConfigC("ISO-TP entry requires a 'channel'");
    m_address.ConfigureFromJSON(value);
    m_config = IsoTpConfigC();
    m_config.ConfigureFromJSON(value);
    m_hasCanFd = value.isMember("canfd");
  }

  // -----------------------------------------------------

  std::string CanConfigC::DefaultConfigFile()
  {
    const char *homeDir = getenv("HOME");
    if(homeDir == 0)
      return "";
    std::string defaultConfig = std::string(homeDir) + "/.config/cantypes/cantypes.json";
    if(!FileExists(defaultConfig)) {
      DefaultLogger()->debug("Default configuration file '{}' doesn't exist. ",defaultConfig);
      return "";
    }
    return defaultConfig;
  }

  bool CanConfigC::LoadConfig(const std::string &configFile)
  {
    if(configFile.empty())
      return false;
    std::ifstream confStrm(configFile,std::ifstream::binary);

    if(!confStrm) {
      m_log->error("Failed to open configuration file '{}' ",configFile);
      return false;
    }

    Json::Value rootConfig;
    try {
      confStrm >> rootConfig;
    } catch(Json::Exception &ex) {
      m_log->error("Failed to parse configuration file '{}': {} ",configFile,ex.what());
      return false;
    }

    ConfigureFromJSON(rootConfig);
    m_log->info("Loaded {} devices and {} ISO-TP channels from '{}' ",m_devices.size(),m_isoTpChannels.size(),configFile);
    return true;
  }

  bool CanConfigC::SaveConfig(const std::string &configFile) const
  {
    std::ofstream confStrm(configFile,std::ifstream::binary);

    if(!confStrm) {
      m_log->error("Failed to open configuration file '{}' ",configFile);
      return false;
    }
    Json::Value rootConfig;
    ConfigAsJSON(rootConfig);
    confStrm << rootConfig;
    return true;
  }

  void CanConfigC::ConfigureFromJSON(const Json::Value &rootConfig)
  {
    if(!rootConfig.isObject())
      throw ExceptionBadConfigC("Configuration must be a JSON object");

    std::vector<CanDeviceConfigC> devices;
    const Json::Value &deviceList = rootConfig["devices"];
    if(!deviceList.isNull()) {
      if(!deviceList.isArray())
        throw ExceptionBadConfigC("'devices' must be an array");
      for(Json::ArrayIndex i = 0;i < deviceList.size();i++) {
        CanDeviceConfigC device;
        device.ConfigureFromJSON(deviceList[i]);
        devices.push_back(device);
      }
    }

    std::vector<IsoTpChannelConfigC> channels;
    const Json::Value &isoTpList = rootConfig["isotp"];
    if(!isoTpList.isNull()) {
      if(!isoTpList.isArray())
        throw ExceptionBadConfigC("'isotp' must be an array");
      for(Json::ArrayIndex i = 0;i < isoTpList.size();i++) {
        IsoTpChannelConfigC channel;
        channel.ConfigureFromJSON(isoTpList[i]);
        channels.push_back(channel);
      }
    }

    m_devices = devices;
    m_isoTpChannels = channels;
  }

  void CanConfigC::ConfigAsJSON(Json::Value &rootConfig) const
  {
    Json::Value deviceList(Json::arrayValue);
    for(auto &a : m_devices) {
      Json::Value entry;
      a.ConfigAsJSON(entry);
      deviceList.append(entry);
    }
    rootConfig["devices"] = deviceList;

    Json::Value isoTpList(Json::arrayValue);
    for(auto &a : m_isoTpChannels) {
      Json::Value entry;
      a.ConfigAsJSON(entry);
      isoTpList.append(entry);
    }
    rootConfig["isotp"] = isoTpList;
  }

  void CanConfigC::AddDevice(const CanDeviceConfigC &device)
  {
    for(auto &a : m_devices) {
      if(a.Name() == device.Name()) {
        a = device;
        return;
      }
    }
    m_devices.push_back(device);
  }

  bool CanConfigC::FindDevice(const std::string &name,CanDeviceConfigC &device) const
  {
    for(auto &a : m_devices) {
      if(a.Name() == name) {
        device = a;
        return true;
      }
    }
    return false;
  }

  bool CanConfigC::FindIsoTpChannel(const std::string &channel,IsoTpChannelConfigC &config) const
  {
    for(auto &a : m_isoTpChannels) {
      if(a.Channel() == channel) {
        config = a;
        return true;
      }
    }
    return false;
  }

}
