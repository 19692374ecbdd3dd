// 표준 라이브러리
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

// 파일 헤더
#include "Engines/TimeUtils.hpp"

// 네임 스페이스
using namespace std::chrono;

namespace technical_analysis::time_utils {

string GetCurrentLocalDatetime() {
  const time_t now_time_t = system_clock::to_time_t(system_clock::now());

  tm local_time{};
  localtime_r(&now_time_t, &local_time);

  ostringstream ss;
  ss << put_time(&local_time, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

string UtcTimestampToUtcDatetime(const int64_t timestamp_ms) {
  if (timestamp_ms < 0) {
    return "";
  }

  // timestamp ms를 time_t로 변환
  const auto timestamp_s = seconds(timestamp_ms / kSecond);
  const system_clock::time_point tp(timestamp_s);
  const time_t timestamp_time_t = system_clock::to_time_t(tp);

  // UTC 시간으로 변환
  tm utc_time{};
  gmtime_r(&timestamp_time_t, &utc_time);

  ostringstream ss;
  ss << put_time(&utc_time, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

}  // namespace technical_analysis::time_utils
