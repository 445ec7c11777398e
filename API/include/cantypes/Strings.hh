#ifndef CANTYPES_STRINGS_HEADER
#define CANTYPES_STRINGS_HEADER 1

#include <string>
#include "cantypes/Identifier.hh"
#include "cantypes/IsoTpTypes.hh"

namespace CanTypesN {

  //! Convert an identifier type to a string
  const char *IdTypeToString(IdTypeT idType);

  //! Convert an ISO-TP error code to a string
  const char *IsoTpErrorToString(IsoTpErrorT errorCode);

  //! Convert an ISO-TP event type to a string
  const char *IsoTpEventTypeToString(IsoTpEventTypeT eventType);

  //! Convert an ISO-TP frame type to a string
  const char *IsoTpFrameTypeToString(IsoTpFrameTypeT frameType);

  //! Convert a flow control state to a string
  const char *FlowControlStateToString(FlowControlStateT state);

  //! Convert an ISO-TP standard to a string
  const char *IsoTpStandardToString(IsoTpStandardT standard);

  //! Convert a set of ISO-TP state flags to a string, such as "Sending|WaitFlowCtrl"
  std::string IsoTpStateToString(IsoTpStateFlagsT state);

}

#endif
