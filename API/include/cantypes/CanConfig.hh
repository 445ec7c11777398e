#ifndef CANTYPES_CANCONFIG_HEADER
#define CANTYPES_CANCONFIG_HEADER 1

#include <string>
#include <vector>
#include <memory>
#include <jsoncpp/json/json.h>
#include "cantypes/CanDriver.hh"
#include "cantypes/IsoTpTypes.hh"

namespace CanTypesN {

  //! Settings for opening a device.

  class CanDeviceConfigC
  {
  public:
    CanDeviceConfigC()
    {}

    CanDeviceConfigC(const std::string &name,const std::string &driver,const std::string &interface,bool canFd = false)
      : m_name(name),
        m_driver(driver),
        m_interface(interface),
        m_canFd(canFd)
    {}

    //! Name used to refer to the device.
    const std::string &Name() const
    { return m_name; }

    //! Driver type, "socketcan" or "virtual".
    const std::string &Driver() const
    { return m_driver; }

    //! Interface to open, for example "can0".
    const std::string &Interface() const
    { return m_interface; }

    bool IsCanFd() const
    { return m_canFd; }

    //! Poll interval for the device loops.
    int IntervalMs() const
    { return m_intervalMs; }

    //! Create the driver and open the interface.
    //! Returns an empty pointer on failure.
    std::shared_ptr<CanDriverC> OpenDriver() const;

    //! Get the settings as JSON
    void ConfigAsJSON(Json::Value &value) const;

    //! Configure from JSON, throws ExceptionBadConfigC on errors.
    void ConfigureFromJSON(const Json::Value &value);

  protected:
    std::string m_name;
    std::string m_driver = "socketcan";
    std::string m_interface;
    bool m_canFd = false;
    int m_intervalMs = 10;
  };

  //! Settings for an ISO-TP channel.

  class IsoTpChannelConfigC
  {
  public:
    IsoTpChannelConfigC()
    {}

    IsoTpChannelConfigC(const std::string &channel,const IsoTpAddressC &address,const IsoTpConfigC &config = IsoTpConfigC())
      : m_channel(channel),
        m_address(address),
        m_config(config)
    {}

    const std::string &Channel() const
    { return m_channel; }

    const IsoTpAddressC &Address() const
    { return m_address; }

    const IsoTpConfigC &Config() const
    { return m_config; }

    //! False when the entry was loaded without a 'canfd' key,
    //! the setting should then follow the device.
    bool HasCanFd() const
    { return m_hasCanFd; }

    //! Get the settings as JSON
    void ConfigAsJSON(Json::Value &value) const;

    //! Configure from JSON, throws ExceptionBadConfigC on errors.
    void ConfigureFromJSON(const Json::Value &value);

  protected:
    std::string m_channel;
    IsoTpAddressC m_address;
    IsoTpConfigC m_config;
    bool m_hasCanFd = true;
  };

  //! Configuration file holding devices and ISO-TP channels.

  class CanConfigC
  {
  public:
    CanConfigC()
    {}

    //! Default location of the configuration file, empty if it doesn't exist.
    static std::string DefaultConfigFile();

    //! Set the logger to use
    void SetLogger(const std::shared_ptr<spdlog::logger> &log)
    { m_log = log; }

    //! Load a configuration file.
    //! Returns false if the file can't be read or parsed, throws ExceptionBadConfigC if the content is invalid.
    bool LoadConfig(const std::string &configFile);

    //! Save the configuration to a file.
    bool SaveConfig(const std::string &configFile) const;

    //! Configure from JSON, throws ExceptionBadConfigC on errors.
    void ConfigureFromJSON(const Json::Value &rootConfig);

    //! Get the configuration as JSON
    void ConfigAsJSON(Json::Value &rootConfig) const;

    const std::vector<CanDeviceConfigC> &Devices() const
    { return m_devices; }

    const std::vector<IsoTpChannelConfigC> &IsoTpChannels() const
    { return m_isoTpChannels; }

    //! Add a device, replacing any with the same name.
    void AddDevice(const CanDeviceConfigC &device);

    void AddIsoTpChannel(const IsoTpChannelConfigC &channel)
    { m_isoTpChannels.push_back(channel); }

    //! Find a device by name.
    bool FindDevice(const std::string &name,CanDeviceConfigC &device) const;

    //! Find the ISO-TP settings for a channel.
    bool FindIsoTpChannel(const std::string &channel,IsoTpChannelConfigC &config) const;

  protected:
    std::vector<CanDeviceConfigC> m_devices;
    std::vector<IsoTpChannelConfigC> m_isoTpChannels;
    std::shared_ptr<spdlog::logger> m_log = DefaultLogger();
  };

}

#endif
