
#include "cantypes/Util.hh"

#include <mutex>
#include <chrono>
#include <ctype.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace CanTypesN {

  static int HexDigitValue(char c)
  {
    if(c >= '0' && c <= '9')
      return c - '0';
    if(c >= 'a' && c <= 'f')
      return c - 'a' + 10;
    if(c >= 'A' && c <= 'F')
      return c - 'A' + 10;
    return -1;
  }

  bool ParseHex(const std::string &hexStr,uint64_t maxValue,uint64_t &value)
  {
    size_t at = 0;
    if(hexStr.size() > 2 && hexStr[0] == '0' && (hexStr[1] == 'x' || hexStr[1] == 'X'))
      at = 2;
    if(at >= hexStr.size())
      return false;
    uint64_t result = 0;
    for(;at < hexStr.size();at++) {
      int digit = HexDigitValue(hexStr[at]);
      if(digit < 0)
        return false;
      // Check for overflow before shifting.
      if(result > (maxValue >> 4))
        return false;
      result = (result << 4) | (uint64_t) digit;
      if(result > maxValue)
        return false;
    }
    value = result;
    return true;
  }

  bool ParseHexBytes(const std::string &hexStr,ByteArrayT &data)
  {
    data.clear();
    int high = -1;
    for(auto c : hexStr) {
      if(isspace(c) || c == ':' || c == '.')
        continue;
      int digit = HexDigitValue(c);
      if(digit < 0)
        return false;
      if(high < 0) {
        high = digit;
      } else {
        data.push_back((uint8_t) ((high << 4) | digit));
        high = -1;
      }
    }
    // Odd number of digits.
    return high < 0;
  }

  std::string BytesToHex(const uint8_t *data,size_t len)
  {
    static const char *digits = "0123456789abcdef";
    std::string ret;
    ret.reserve(len * 3);
    for(size_t i = 0;i < len;i++) {
      ret += digits[data[i] >> 4];
      ret += digits[data[i] & 0xf];
      ret += ' ';
    }
    return ret;
  }

  std::shared_ptr<spdlog::logger> DefaultLogger()
  {
    static std::mutex mutexCreate;
    std::lock_guard<std::mutex> lock(mutexCreate);
    std::shared_ptr<spdlog::logger> log = spdlog::get("console");
    if(!log)
      log = spdlog::stdout_logger_mt("console");
    return log;
  }

  TimestampT TimestampNow()
  {
    return (TimestampT) std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
  }

}
