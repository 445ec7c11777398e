#ifndef CANTYPES_TYPES_HEADER
#define CANTYPES_TYPES_HEADER 1

#include <cstdint>
#include <cstddef>
#include <vector>
#include <chrono>

namespace CanTypesN {

  class CanMessageC;
  class CanDriverC;
  class CanListenerC;

  // Identifier masks.
  const uint32_t SFF_MASK = 0x000007FF;
  const uint32_t EFF_MASK = 0x1FFFFFFF;

  // Frame payload sizes.
  const size_t CAN_FRAME_MAX_SIZE = 8;
  const size_t CANFD_FRAME_MAX_SIZE = 64;

  const uint8_t CAN_DEFAULT_PADDING = 0xAA;

  // ISO-TP limits.
  const uint32_t ISOTP_MAX_LENGTH_2004 = 0xFFF;
  const uint32_t ISOTP_MAX_LENGTH_2016 = 0xFFFFFFFF;
  const uint8_t ISOTP_CONSECUTIVE_SEQUENCE_START = 0x01;

  //! Direction of a frame relative to the local node.
  enum DirectT {
    D_Transmit = 0,
    D_Receive  = 1
  };

  //! Protocol used to interpret an identifier.
  enum ProtocolT {
    P_Can   = 0,
    P_J1939 = 1
  };

  typedef std::vector<uint8_t> ByteArrayT;

  //! Milliseconds since the epoch, used for frame timestamps.
  typedef uint64_t TimestampT;

  //! Current time in milliseconds.
  TimestampT TimestampNow();

}

#endif
