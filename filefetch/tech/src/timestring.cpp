#include "filefetch/timestring.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

#include "filefetch/cctype.hpp"
#include "filefetch/simple-charconv.hpp"
#include "filefetch/timedef.hpp"

namespace filefetch {

std::string FormatHttpDate(SysTimePoint tp) {
  std::string ret(kRFC7231DateStrLen, '\0');
  TimeToStringRFC7231(tp, ret.data());
  return ret;
}

std::string FormatHttpDate(std::int64_t epochMillis) {
  return FormatHttpDate(SysTimePoint(std::chrono::milliseconds{epochMillis}));
}

SysTimePoint TryParseTimeRFC7231(const char* begPtr, const char* endPtr) {
  SysTimePoint ret = kInvalidTimePoint;
  while (begPtr < endPtr && isspace(*begPtr)) {
    ++begPtr;
  }
  while (endPtr > begPtr && isspace(*(endPtr - 1))) {
    --endPtr;
  }

  if (begPtr >= endPtr) {
    return ret;
  }

  const auto len = endPtr - begPtr;
  if (std::cmp_not_equal(len, kRFC7231DateStrLen)) {
    return ret;  // Expect strict IMF-fixdate form
  }

  const char* ptr = begPtr;
  if (ptr[3] != ',' || ptr[4] != ' ' || ptr[7] != ' ' || ptr[11] != ' ' || ptr[16] != ' ' || ptr[19] != ':' ||
      ptr[22] != ':' || ptr[25] != ' ') {
    return ret;
  }

  if (!isdigit(ptr[5]) || !isdigit(ptr[6]) || !isdigit(ptr[12]) || !isdigit(ptr[13]) || !isdigit(ptr[14]) ||
      !isdigit(ptr[15]) || !isdigit(ptr[17]) || !isdigit(ptr[18]) || !isdigit(ptr[20]) || !isdigit(ptr[21]) ||
      !isdigit(ptr[23]) || !isdigit(ptr[24])) {
    return ret;
  }

  if (std::string_view(ptr + 26, 3) != "GMT") {
    return ret;
  }

  static constexpr std::array<std::string_view, 12> kMonths{"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                                            "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

  const auto monthIt = std::ranges::find(kMonths, std::string_view(ptr + 8, 3));
  if (monthIt == kMonths.end()) {
    return ret;
  }

  const int dayValue = read2(ptr + 5);
  const int yearValue = read4(ptr + 12);
  const int hourValue = read2(ptr + 17);
  const int minuteValue = read2(ptr + 20);
  const int secondValue = read2(ptr + 23);

  if (dayValue == 0 || hourValue > 23 || minuteValue > 59 || secondValue > 60) {
    return ret;
  }

  const std::chrono::year yearField{yearValue};
  // monthIt is a 0-based index into kMonths (0 == Jan). std::chrono::month is 1-based, so add 1.
  const std::chrono::month monthField{static_cast<unsigned>(std::distance(kMonths.begin(), monthIt)) + 1};
  const std::chrono::day dayField{static_cast<unsigned>(dayValue)};
  const std::chrono::year_month_day ymd{yearField, monthField, dayField};
  if (!ymd.ok()) {
    return ret;
  }

  // Verify the weekday token (e.g. "Sun") matches the resolved date
  static constexpr std::array<std::string_view, 7> kWeekdays{"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
  const auto weekdayIt = std::ranges::find(kWeekdays, std::string_view(ptr, 3));
  if (weekdayIt == kWeekdays.end()) {
    return ret;
  }

  const std::chrono::sys_days dayPoint{ymd};
  const std::chrono::weekday wd{dayPoint};
  if (static_cast<unsigned>(std::distance(kWeekdays.begin(), weekdayIt)) != wd.c_encoding()) {
    return ret;
  }

  ret =
      dayPoint + std::chrono::hours{hourValue} + std::chrono::minutes{minuteValue} + std::chrono::seconds{secondValue};
  return ret;
}

}  // namespace filefetch
