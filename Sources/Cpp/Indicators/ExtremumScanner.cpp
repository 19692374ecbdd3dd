// 표준 라이브러리
#include <format>

// 파일 헤더
#include "Indicators/ExtremumScanner.hpp"

// 내부 헤더
#include "Engines/DataUtils.hpp"
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"

// 네임 스페이스
namespace technical_analysis {
using namespace exception;
using namespace logger;
using namespace utils;
}  // namespace technical_analysis

namespace technical_analysis::indicator {

size_t ExtremumScanner::GetLeft(const int legs) {
  return static_cast<size_t>(legs / 2);
}

size_t ExtremumScanner::GetRight(const int legs) { return GetLeft(legs) + 1; }

bool ExtremumScanner::IsFlat(const vector<double>& values) {
  for (size_t i = 1; i < values.size(); i++) {
    if (!IsEqual(values[i], values[0])) {
      return false;
    }
  }

  return true;
}

optional<vector<Extremum>> ExtremumScanner::Scan(const vector<double>& high,
                                                 const vector<double>& low,
                                                 const int legs) {
  if (legs <= 0) {
    Logger::LogAndThrow<InvalidParameter>(
        format("ExtremumScanner의 Legs [{}]은(는) 0보다 커야 합니다.", legs),
        __FILE__, __LINE__);
  }

  if (high.size() != low.size()) {
    Logger::LogAndThrow<InvalidValue>(
        format("High의 길이 [{}]와 Low의 길이 [{}]가 다릅니다.", high.size(),
               low.size()),
        __FILE__, __LINE__);
  }

  const size_t size = high.size();
  const size_t left = GetLeft(legs);
  const size_t right = GetRight(legs);

  // 중심 위치가 하나도 없으면 데이터 부족
  if (size < left + right + 1) {
    return nullopt;
  }

  vector<Extremum> extrema;

  // 분산이 없는 시계열은 모든 위치가 동률 극값이 되므로 스윙이 없음
  if (IsFlat(high) && IsFlat(low)) {
    return extrema;
  }

  for (size_t center = left; center < size - right; center++) {
    const double low_center = low[center];
    const double high_center = high[center];

    bool is_low = true;
    bool is_high = true;

    // 윈도우 [center - left, center + right) 전체와 비교
    for (size_t i = center - left; i < center + right; i++) {
      if (is_low && !IsLessOrEqual(low_center, low[i])) {
        is_low = false;
      }

      if (is_high && !IsGreaterOrEqual(high_center, high[i])) {
        is_high = false;
      }

      if (!is_low && !is_high) {
        break;
      }
    }

    if (is_low) {
      extrema.push_back({center, SwingDirection::LOW, low_center});
    }

    if (is_high) {
      extrema.push_back({center, SwingDirection::HIGH, high_center});
    }
  }

  return extrema;
}

}  // namespace technical_analysis::indicator
