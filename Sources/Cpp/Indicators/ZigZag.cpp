// 표준 라이브러리
#include <algorithm>
#include <format>

// 파일 헤더
#include "Indicators/ZigZag.hpp"

// 내부 헤더
#include "Engines/Config.hpp"
#include "Engines/DataUtils.hpp"
#include "Engines/Logger.hpp"
#include "Engines/SeriesUtils.hpp"

// 네임 스페이스
namespace technical_analysis {
using namespace engine;
using namespace logger;
using namespace utils;
}  // namespace technical_analysis

namespace technical_analysis::indicator {

ZigZag::ZigZag(const optional<int>& legs, const optional<double>& deviation,
               const optional<int64_t>& offset, FillOptions fill_options)
    : Indicator("zigzag", offset, move(fill_options)),
      legs_(ValidatePositive("ZigZag Legs", legs,
                             Config::GetConfig().GetDefaultLegs())),
      deviation_(ValidatePositive("ZigZag Deviation", deviation,
                                  Config::GetConfig().GetDefaultDeviation())),
      properties_(format("_{}%_{}", FormatParameter(deviation_), legs_)) {
  SetName("ZIGZAG" + properties_);
}

int ZigZag::GetLegs() const { return legs_; }
double ZigZag::GetDeviation() const { return deviation_; }
size_t ZigZag::GetMinLength() const { return static_cast<size_t>(legs_) + 1; }

string ZigZag::GetSwingColumnName() const { return "ZIGZAGs" + properties_; }
string ZigZag::GetValueColumnName() const { return "ZIGZAGv" + properties_; }
string ZigZag::GetDeviationColumnName() const {
  return "ZIGZAGd" + properties_;
}

optional<Frame> ZigZag::Calculate(const Series& high, const Series& low,
                                  const optional<Series>& close) const {
  const auto& logger = Logger::GetLogger();

  // 입력 검증
  const size_t min_length = GetMinLength();
  const auto& valid_high = ValidateSeries(high, min_length);
  const auto& valid_low = ValidateSeries(low, min_length);

  if (!valid_high || !valid_low) {
    logger->Log(WARN_L,
                format("[{}] 지표 계산에는 최소 [{}]개의 바가 필요하지만 "
                       "[{}]개만 주어졌습니다.",
                       GetName(), min_length, min(high.Size(), low.Size())),
                __FILE__, __LINE__);
    return nullopt;
  }

  ValidateAligned(*valid_high, *valid_low);

  if (close) {
    if (!ValidateSeries(*close, min_length)) {
      logger->Log(WARN_L,
                  format("[{}] 지표의 Close 시계열 길이 [{}]가 최소 길이 [{}]"
                         "보다 짧습니다.",
                         GetName(), close->Size(), min_length),
                  __FILE__, __LINE__);
      return nullopt;
    }

    ValidateAligned(*valid_high, *close);
  }

  // 계산
  const auto& extrema = ExtremumScanner::Scan(
      valid_high->GetValues(), valid_low->GetValues(), legs_);

  if (!extrema) {
    logger->Log(WARN_L,
                format("[{}] 지표의 윈도우를 채울 수 있는 데이터가 "
                       "없습니다. (길이 [{}])",
                       GetName(), valid_high->Size()),
                __FILE__, __LINE__);
    return nullopt;
  }

  SwingReducer reducer(deviation_);
  const auto& swings = reducer.Reduce(*extrema);
  auto [direction, value, deviation] =
      OutputDensifier::Densify(swings, valid_high->Size());

  logger->Log(DEBUG_L,
              format("[{}] 극값 후보 [{}]개 → 확정 스윙 [{}]개", GetName(),
                     extrema->size(), swings.size()),
              __FILE__, __LINE__);

  // 결과 Frame 생성
  const auto& index = valid_high->GetIndex();
  Frame frame(GetName(), GetCategory(), index);
  frame.AddColumn(Series(index, move(direction), GetSwingColumnName()));
  frame.AddColumn(Series(index, move(value), GetValueColumnName()));
  frame.AddColumn(Series(index, move(deviation), GetDeviationColumnName()));

  // Offset 및 결측값 채우기
  Finalize(frame);

  return frame;
}

}  // namespace technical_analysis::indicator
