
#include "cantypes/Strings.hh"

namespace CanTypesN {

  const char *IdTypeToString(IdTypeT idType)
  {
    switch(idType) {
    case IT_Can2A: return "Can2A";
    case IT_Can2B: return "Can2B";
    case IT_J1939: return "J1939";
    }
    return "Unknown";
  }

  const char *IsoTpErrorToString(IsoTpErrorT errorCode)
  {
    switch(errorCode) {
    case IE_EmptyPdu: return "Empty PDU";
    case IE_InvalidPdu: return "Invalid PDU";
    case IE_InvalidDataLength: return "Invalid data length";
    case IE_LengthOutOfRange: return "Length out of range";
    case IE_InvalidSequence: return "Invalid sequence";
    case IE_MixFrames: return "Mixed frames";
    case IE_StateError: return "State error";
    case IE_ContextError: return "Context error";
    case IE_DeviceError: return "Device error";
    case IE_OverloadFlow: return "Overload flow";
    case IE_ConvertError: return "Convert error";
    case IE_Timeout: return "Timeout";
    case IE_InvalidStMin: return "Invalid st_min";
    case IE_InvalidParam: return "Invalid parameter";
    }
    return "Unknown";
  }

  const char *IsoTpEventTypeToString(IsoTpEventTypeT eventType)
  {
    switch(eventType) {
    case IET_Wait: return "Wait";
    case IET_FirstFrameReceived: return "FirstFrameReceived";
    case IET_DataReceived: return "DataReceived";
    case IET_ErrorOccurred: return "ErrorOccurred";
    }
    return "Unknown";
  }

  const char *IsoTpFrameTypeToString(IsoTpFrameTypeT frameType)
  {
    switch(frameType) {
    case FT_Single: return "Single";
    case FT_First: return "First";
    case FT_Consecutive: return "Consecutive";
    case FT_FlowControl: return "FlowControl";
    }
    return "Unknown";
  }

  const char *FlowControlStateToString(FlowControlStateT state)
  {
    switch(state) {
    case FCS_Continues: return "Continues";
    case FCS_Wait: return "Wait";
    case FCS_Overload: return "Overload";
    }
    return "Unknown";
  }

  const char *IsoTpStandardToString(IsoTpStandardT standard)
  {
    switch(standard) {
    case ITS_2004: return "2004";
    case ITS_2016: return "2016";
    }
    return "Unknown";
  }

  std::string IsoTpStateToString(IsoTpStateFlagsT state)
  {
    if(state == IS_Idle)
      return "Idle";
    static const struct {
      IsoTpStateT m_flag;
      const char *m_name;
    } names[] = {
      { IS_WaitSingle,"WaitSingle" },
      { IS_WaitFirst,"WaitFirst" },
      { IS_WaitFlowCtrl,"WaitFlowCtrl" },
      { IS_WaitData,"WaitData" },
      { IS_WaitBusy,"WaitBusy" },
      { IS_ResponsePending,"ResponsePending" },
      { IS_Sending,"Sending" },
      { IS_Error,"Error" }
    };
    std::string ret;
    for(auto &a : names) {
      if((state & a.m_flag) == 0)
        continue;
      if(!ret.empty())
        ret += "|";
      ret += a.m_name;
    }
    return ret;
  }

}
