
#include "cantypes/J1939Address.hh"

namespace CanTypesN {

  static const char *AddressName(J1939AddressT address)
  {
    switch(address) {
    case JA_PrimaryEngineController: return "Primary Engine Controller | (CPC, ECM)";
    case JA_SecondaryEngineController: return "Secondary Engine Controller | (MCM, ECM #2)";
    case JA_PrimaryTransmissionController: return "Primary Transmission Controller | (TCM)";
    case JA_TransmissionShiftSelector: return "Transmission Shift Selector | (TSS)";
    case JA_Brakes: return "Brakes | System Controller (ABS)";
    case JA_Retarder: return "Retarder";
    case JA_CruiseControl: return "Cruise Control | (IPM, PCC)";
    case JA_FuelSystem: return "Fuel System | Controller (CNG)";
    case JA_SteeringController: return "Steering Controller | (SAS)";
    case JA_InstrumentCluster: return "Instrument Gauge Cluster (EGC) | (ICU, RX)";
    case JA_ClimateControl1: return "Climate Control #1 | (FCU)";
    case JA_Compass: return "Compass";
    case JA_BodyController: return "Body Controller | (SSAM, SAM-CAB, BHM)";
    case JA_OffVehicleGateway: return "Off-Vehicle Gateway | (CGW)";
    case JA_DidVid: return "Vehicle Information Display | Driver Information Display";
    case JA_RetarderExhaustEngine1: return "Retarder, Exhaust, Engine #1";
    case JA_HeadwayController: return "Headway Controller | (RDF) | (OnGuard)";
    case JA_Suspension: return "Suspension | System Controller (ECAS)";
    case JA_CabController: return "Cab Controller | Primary (MSF, SHM, ECC)";
    case JA_TirePressureController: return "Tire Pressure Controller | (TPMS)";
    case JA_LightingControlModule: return "Lighting Control Module | (LCM)";
    case JA_ClimateControl2: return "Climate Control #2 | Rear HVAC | (ParkSmart)";
    case JA_ExhaustEmissionController: return "Exhaust Emission Controller | (ACM) | (DCU)";
    case JA_AuxiliaryHeater: return "Auxiliary Heater | (ACU)";
    case JA_ChassisController: return "Chassis Controller | (CHM, SAM-Chassis)";
    case JA_CommunicationsUnit: return "Communications Unit | Cellular (CTP, VT)";
    case JA_Radio: return "Radio";
    case JA_SafetyRestraintSystem: return "Safety Restraint System | Air Bag | (SRS)";
    case JA_AftertreatmentControlModule: return "Aftertreatment Control Module | (ACM)";
    case JA_MultiPurposeCamera: return "Multi-Purpose Camera | (MPC)";
    case JA_SwitchExpansionModule: return "Switch Expansion Module | (SEM #1)";
    case JA_AuxiliaryGaugeSwitchPack: return "Auxiliary Gauge Switch Pack | (AGSP3)";
    case JA_Iteris: return "Iteris";
    case JA_QualcommPeopleNetTranslatorBox: return "Qualcomm - PeopleNet Translator Box";
    case JA_StandAloneRealTimeClock: return "Stand-Alone Real Time Clock | (SART)";
    case JA_CenterPanel1: return "Center Panel MUX Switch Pack #1";
    case JA_CenterPanel2: return "Center Panel MUX Switch Pack #2";
    case JA_CenterPanel3: return "Center Panel MUX Switch Pack #3";
    case JA_CenterPanel4: return "Center Panel MUX Switch Pack #4";
    case JA_CenterPanel5: return "Center Panel MUX Switch Pack #5";
    case JA_WabcoOnGuardRadar: return "Wabco OnGuard Radar | OnGuard Display | Collision Mitigation System";
    case JA_SecondaryInstrumentCluster: return "Secondary Instrument Cluster | (SIC)";
    case JA_OffboardDiagnostics: return "Offboard Diagnostics";
    case JA_Trailer3Bridge: return "Trailer #3 Bridge";
    case JA_Trailer2Bridge: return "Trailer #2 Bridge";
    case JA_Trailer1Bridge: return "Trailer #1 Bridge";
    case JA_SafetyDirectProcessor: return "Bendix Camera | Safety Direct Processor (SDP) Module";
    case JA_ForwardRoadImageProcessor: return "Forward Road Image Processor | PAM Module | Lane Departure Warning (LDW) Module | (VRDU)";
    case JA_LeftRearDoorPod: return "Left Rear Door Pod";
    case JA_RightRearDoorPod: return "Right Rear Door Pod";
    case JA_DoorController1: return "Door Controller #1";
    case JA_DoorController2: return "Door Controller #2";
    case JA_Tachograph: return "Tachograph | (TCO)";
    case JA_HybridSystem: return "Hybrid System";
    case JA_AuxiliaryPowerUnit: return "Auxiliary Power Unit | (APU)";
    case JA_ServiceTool: return "Service Tool";
    case JA_SourceAddressRequest0: return "Source Address Request 0";
    case JA_SourceAddressRequest1: return "Source Address Request 1";
    }
    return 0;
  }

  bool IsKnownAddress(J1939AddressT address)
  {
    return AddressName(address) != 0;
  }

  std::string AddressToString(J1939AddressT address)
  {
    const char *name = AddressName(address);
    if(name != 0)
      return name;
    return "Unknown(" + std::to_string((int) AddressToByte(address)) + ")";
  }

}
