#ifndef CANTYPES_J1939ADDRESS_HEADER
#define CANTYPES_J1939ADDRESS_HEADER 1

#include <cstdint>
#include <string>

namespace CanTypesN {

  //! Well known J1939 source addresses.
  //! Values not listed are represented by casting the byte, see AddressFromByte()

  enum J1939AddressT {
    JA_PrimaryEngineController = 0,
    JA_SecondaryEngineController = 1,
    JA_PrimaryTransmissionController = 3,
    JA_TransmissionShiftSelector = 5,
    JA_Brakes = 11,
    JA_Retarder = 15,
    JA_CruiseControl = 17,
    JA_FuelSystem = 18,
    JA_SteeringController = 19,
    JA_InstrumentCluster = 23,
    JA_ClimateControl1 = 25,
    JA_Compass = 28,
    JA_BodyController = 33,
    JA_OffVehicleGateway = 37,
    JA_DidVid = 40,
    JA_RetarderExhaustEngine1 = 41,
    JA_HeadwayController = 42,
    JA_Suspension = 47,
    JA_CabController = 49,
    JA_TirePressureController = 51,
    JA_LightingControlModule = 55,
    JA_ClimateControl2 = 58,
    JA_ExhaustEmissionController = 61,
    JA_AuxiliaryHeater = 69,
    JA_ChassisController = 71,
    JA_CommunicationsUnit = 74,
    JA_Radio = 76,
    JA_SafetyRestraintSystem = 83,
    JA_AftertreatmentControlModule = 85,
    JA_MultiPurposeCamera = 127,
    JA_SwitchExpansionModule = 128,
    JA_AuxiliaryGaugeSwitchPack = 132,
    JA_Iteris = 139,
    JA_QualcommPeopleNetTranslatorBox = 142,
    JA_StandAloneRealTimeClock = 150,
    JA_CenterPanel1 = 151,
    JA_CenterPanel2 = 152,
    JA_CenterPanel3 = 153,
    JA_CenterPanel4 = 154,
    JA_CenterPanel5 = 155,
    JA_WabcoOnGuardRadar = 160,
    JA_SecondaryInstrumentCluster = 167,
    JA_OffboardDiagnostics = 172,
    JA_Trailer3Bridge = 184,
    JA_Trailer2Bridge = 192,
    JA_Trailer1Bridge = 200,
    JA_SafetyDirectProcessor = 209,
    JA_ForwardRoadImageProcessor = 232,
    JA_LeftRearDoorPod = 233,
    JA_RightRearDoorPod = 234,
    JA_DoorController1 = 236,
    JA_DoorController2 = 237,
    JA_Tachograph = 238,
    JA_HybridSystem = 239,
    JA_AuxiliaryPowerUnit = 247,
    JA_ServiceTool = 249,
    JA_SourceAddressRequest0 = 254,
    JA_SourceAddressRequest1 = 255
  };

  //! Convert a byte to an address, every byte value is preserved.
  inline J1939AddressT AddressFromByte(uint8_t value)
  { return (J1939AddressT) value; }

  //! Convert an address back to its byte value.
  inline uint8_t AddressToByte(J1939AddressT address)
  { return (uint8_t) address; }

  //! Test if the address is one of the named entries.
  bool IsKnownAddress(J1939AddressT address);

  //! Descriptive name of the address, "Unknown(n)" for unnamed values.
  std::string AddressToString(J1939AddressT address);

  //! An optional address byte.

  class OptionalAddressC
  {
  public:
    //! Create an empty address.
    OptionalAddressC()
    {}

    //! Create with a value.
    explicit OptionalAddressC(uint8_t value)
      : m_value(value),
        m_isSet(true)
    {}

    //! Is there a value ?
    bool IsSet() const
    { return m_isSet; }

    //! Access raw value, only valid if IsSet() is true.
    uint8_t Value() const
    { return m_value; }

    //! Lookup the named address.
    //! Returns false if no value is set.
    bool Lookup(J1939AddressT &address) const
    {
      if(!m_isSet)
        return false;
      address = AddressFromByte(m_value);
      return true;
    }

    bool operator==(const OptionalAddressC &other) const
    { return m_isSet == other.m_isSet && (!m_isSet || m_value == other.m_value); }

    bool operator!=(const OptionalAddressC &other) const
    { return !operator==(other); }

  protected:
    uint8_t m_value = 0;
    bool m_isSet = false;
  };

  //! Address a J1939 message was sent from.
  class SourceAddressC
   : public OptionalAddressC
  {
  public:
    SourceAddressC()
    {}

    explicit SourceAddressC(uint8_t value)
      : OptionalAddressC(value)
    {}
  };

  //! Address a J1939 message is sent to.
  class DestinationAddressC
   : public OptionalAddressC
  {
  public:
    DestinationAddressC()
    {}

    explicit DestinationAddressC(uint8_t value)
      : OptionalAddressC(value)
    {}
  };

}

#endif
