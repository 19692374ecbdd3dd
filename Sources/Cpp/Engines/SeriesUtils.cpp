// 표준 라이브러리
#include <cmath>
#include <format>

// 파일 헤더
#include "Engines/SeriesUtils.hpp"

// 내부 헤더
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"

// 네임 스페이스
namespace technical_analysis {
using namespace exception;
using namespace logger;
}  // namespace technical_analysis

namespace technical_analysis::utils {

FillMethod ParseFillMethod(const string& method) {
  if (method == "ffill" || method == "pad") {
    return FillMethod::FFILL;
  }

  if (method == "bfill" || method == "backfill") {
    return FillMethod::BFILL;
  }

  Logger::LogAndThrow<InvalidParameter>(
      format("결측값 채우기 방법 [{}]은(는) ffill 또는 bfill이어야 합니다.",
             method),
      __FILE__, __LINE__);
}

optional<Series> ValidateSeries(const Series& series,
                                const size_t min_length) {
  if (series.Size() < min_length) {
    return nullopt;
  }

  return series;
}

void ValidateAligned(const Series& lhs, const Series& rhs) {
  if (lhs.Size() != rhs.Size()) {
    Logger::LogAndThrow<InvalidValue>(
        format("[{}] 시계열의 길이 [{}]와 [{}] 시계열의 길이 [{}]가 다릅니다.",
               lhs.GetName(), lhs.Size(), rhs.GetName(), rhs.Size()),
        __FILE__, __LINE__);
  }

  // 같은 인덱스를 공유하면 비교 생략
  if (lhs.GetIndex() == rhs.GetIndex()) {
    return;
  }

  if (*lhs.GetIndex() != *rhs.GetIndex()) {
    Logger::LogAndThrow<InvalidValue>(
        format("[{}] 시계열과 [{}] 시계열의 인덱스가 일치하지 않습니다.",
               lhs.GetName(), rhs.GetName()),
        __FILE__, __LINE__);
  }
}

int ValidatePositive(const string& name, const optional<int>& value,
                     const int default_value) {
  if (!value) {
    return default_value;
  }

  if (*value <= 0) {
    Logger::LogAndThrow<InvalidParameter>(
        format("[{}] 파라미터 [{}]은(는) 0보다 커야 합니다.", name, *value),
        __FILE__, __LINE__);
  }

  return *value;
}

double ValidatePositive(const string& name, const optional<double>& value,
                        const double default_value) {
  if (!value) {
    return default_value;
  }

  if (!isfinite(*value) || *value <= 0) {
    Logger::LogAndThrow<InvalidParameter>(
        format("[{}] 파라미터 [{}]은(는) 0보다 큰 유한한 값이어야 합니다.",
               name, *value),
        __FILE__, __LINE__);
  }

  return *value;
}

int64_t ValidateOffset(const optional<int64_t>& offset,
                       const int64_t default_value) {
  if (!offset) {
    return default_value;
  }

  if (*offset < 0) {
    Logger::LogAndThrow<InvalidParameter>(
        format("Offset [{}]은(는) 미래 데이터를 참조하게 되므로 0 이상이어야 "
               "합니다.",
               *offset),
        __FILE__, __LINE__);
  }

  return *offset;
}

Series ApplyOffset(const Series& series, const int64_t offset) {
  if (offset == 0) {
    return series;
  }

  return series.Shift(offset);
}

void ApplyFill(Series& series, const FillOptions& fill_options) {
  if (fill_options.fill_value) {
    series.FillNa(*fill_options.fill_value);
  }

  if (fill_options.fill_method) {
    switch (*fill_options.fill_method) {
      case FillMethod::FFILL: {
        series.FillForward();
        break;
      }

      case FillMethod::BFILL: {
        series.FillBackward();
        break;
      }
    }
  }
}

void ApplyOffsetAndFill(Frame& frame, const int64_t offset,
                        const FillOptions& fill_options) {
  for (Series& column : frame.GetColumns()) {
    column = ApplyOffset(column, offset);
    ApplyFill(column, fill_options);
  }
}

}  // namespace technical_analysis::utils
