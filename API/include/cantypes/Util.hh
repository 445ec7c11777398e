#ifndef CANTYPES_UTIL_HEADER
#define CANTYPES_UTIL_HEADER 1

#include <string>
#include <memory>
#include <spdlog/spdlog.h>
#include "cantypes/Types.hh"

namespace CanTypesN {

  //! Parse a base-16 string, an optional '0x' prefix is accepted.
  //! Returns false if the string is empty, contains a non hex digit or the value exceeds maxValue.
  bool ParseHex(const std::string &hexStr,uint64_t maxValue,uint64_t &value);

  //! Parse a string of hex byte pairs such as "0102ff" or "01 02 ff".
  bool ParseHexBytes(const std::string &hexStr,ByteArrayT &data);

  //! Format bytes as lower case hex, each byte followed by a space.
  std::string BytesToHex(const uint8_t *data,size_t len);

  //! Format bytes as lower case hex, each byte followed by a space.
  inline std::string BytesToHex(const ByteArrayT &data)
  { return BytesToHex(data.data(),data.size()); }

  //! Get the 'console' logger, creating it if it doesn't exist yet.
  std::shared_ptr<spdlog::logger> DefaultLogger();

  //! Return the minimum of two values.
  template<typename ValueT>
  inline ValueT Min(ValueT v1,ValueT v2)
  { return v1 > v2 ? v2 : v1; }

  //! Return the maximum of two values.
  template<typename ValueT>
  inline ValueT Max(ValueT v1,ValueT v2)
  { return v1 > v2 ? v1 : v2; }

}

#endif
