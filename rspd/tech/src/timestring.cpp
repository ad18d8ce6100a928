#include "rspd/timestring.hpp"

#include <string>

#include "rspd/timedef.hpp"

namespace rspd {

std::string TimeToStringLog(SysTimePoint timePoint) {
  std::string out(kLogTimeStrLen, '\0');
  TimeToStringLog(timePoint, out.data());
  return out;
}

std::string TimeToStringRFC7231(SysTimePoint timePoint) {
  std::string out(kRFC7231DateStrLen, '\0');
  TimeToStringRFC7231(timePoint, out.data());
  return out;
}

}  // namespace rspd
