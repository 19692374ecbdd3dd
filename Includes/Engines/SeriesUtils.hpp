#pragma once

// 표준 라이브러리
#include <cstdint>
#include <optional>
#include <string>

// 내부 헤더
#include "Engines/Series.hpp"

// 네임 스페이스
using namespace std;

/// 지표 입력 검증과 결과 후처리를 위한 유틸리티 네임스페이스
namespace technical_analysis::utils {

using series::Frame;
using series::Series;

/// 결측값을 직전 또는 직후의 유효한 값으로 채우는 방법
enum class FillMethod { FFILL, BFILL };

/// 지표 계산 후 결측값을 채우는 방법을 지정하는 구조체
struct FillOptions {
  optional<double> fill_value;       // 결측값을 대체할 값
  optional<FillMethod> fill_method;  // 결측값을 전파할 방법
};

/// "ffill", "bfill" 문자열을 FillMethod로 변환하는 함수.
/// 그 외의 문자열은 InvalidParameter를 던짐
[[nodiscard]] FillMethod ParseFillMethod(const string& method);

/**
 * 시계열이 최소 길이 이상인지 검증하는 함수
 *
 * 데이터 부족은 오류가 아니라 결과 없음으로 취급하므로 예외 대신
 * 빈 optional을 반환함
 *
 * @param series 검증할 시계열
 * @param min_length 계산에 필요한 최소 길이
 * @return 검증된 시계열. 길이가 부족하면 nullopt
 */
[[nodiscard]] optional<Series> ValidateSeries(const Series& series,
                                              size_t min_length);

/// 두 시계열이 같은 길이와 같은 인덱스를 가지는지 검증하는 함수.
/// 정렬되지 않았다면 InvalidValue를 던짐
void ValidateAligned(const Series& lhs, const Series& rhs);

/// 양수 정수 파라미터를 검증하는 함수.
/// 값이 없으면 기본값을, 0 이하면 InvalidParameter를 던짐
[[nodiscard]] int ValidatePositive(const string& name,
                                   const optional<int>& value,
                                   int default_value);

/// 양수 실수 파라미터를 검증하는 함수.
/// 값이 없으면 기본값을, 0 이하거나 유한하지 않으면 InvalidParameter를 던짐
[[nodiscard]] double ValidatePositive(const string& name,
                                      const optional<double>& value,
                                      double default_value);

/// Offset 파라미터를 검증하는 함수.
/// 값이 없으면 기본값을, 음수면 미래 정보 누출이므로 InvalidParameter를 던짐
[[nodiscard]] int64_t ValidateOffset(const optional<int64_t>& offset,
                                     int64_t default_value);

/// 0 이상의 offset만큼 시계열을 미래 방향으로 이동하는 함수
[[nodiscard]] Series ApplyOffset(const Series& series, int64_t offset);

/// 값 채우기 후 전파 채우기 순서로 결측값을 채우는 함수
void ApplyFill(Series& series, const FillOptions& fill_options);

/// 프레임의 모든 열에 offset과 결측값 채우기를 순서대로 적용하는 함수
void ApplyOffsetAndFill(Frame& frame, int64_t offset,
                        const FillOptions& fill_options);

}  // namespace technical_analysis::utils
