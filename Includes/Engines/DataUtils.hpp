#pragma once

// 표준 라이브러리
#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

// 외부 라이브러리
#include <nlohmann/json_fwd.hpp>

// 전방 선언
namespace arrow {
class Table;
}  // namespace arrow

// 네임스페이스
using namespace std;
using namespace nlohmann;

/// 데이터 핸들링을 위한 유틸리티 네임스페이스
namespace technical_analysis::utils {

/**
 * 지정된 경로의 Parquet 파일에서 특정 컬럼만 읽어오는 함수
 *
 * @param file_path 읽을 Parquet 파일의 경로
 * @param column_indices 읽을 컬럼의 인덱스 목록 (빈 벡터면 모든 컬럼 읽기)
 * @return 읽어온 테이블을 포함하는 shared_ptr 객체
 */
[[nodiscard]] shared_ptr<arrow::Table> ReadParquet(
    const string& file_path, const vector<int>& column_indices = {});

/**
 * 주어진 테이블을 Parquet 파일 형식으로 지정된 파일 경로에 저장하는 함수
 *
 * @param table 저장할 데이터를 포함하는 Table 객체에 대한 shared_ptr
 * @param file_path 저장할 파일의 경로
 */
void TableToParquet(const shared_ptr<arrow::Table>& table,
                    const string& file_path);

/// Json을 지정된 경로에 파일로 저장하는 함수
void JsonToFile(const ordered_json& data, const string& file_path);

/// 지정된 경로의 Json 파일을 읽어 반환하는 함수
[[nodiscard]] json JsonFromFile(const string& file_path);

/**
 * 실수 파라미터를 지표 이름에 사용하는 형식으로 포맷하는 함수
 *
 * 가장 짧은 유효 숫자를 사용하며 정수 값이어도 소수점을 유지함
 * (5 → "5.0", 2.5 → "2.5", 100000 → "100000.0").
 * 절댓값이 1e-4 미만이거나 1e16 이상이면 지수 표기 (0.00005 → "5e-05",
 * 1e16 → "1e+16")
 */
[[nodiscard]] string FormatParameter(double value);

/// 부동 소수점 같은 값 비교를 위한 함수.
/// 왼쪽 값이 오른쪽 값과 같으면 true를 반환함.
template <typename T, typename U>
[[nodiscard]] inline bool IsEqual(T a, U b) noexcept {
  using CommonType = common_type_t<T, U>;

  const auto ca = static_cast<CommonType>(a);
  const auto cb = static_cast<CommonType>(b);

  // NaN 체크
  if (std::isnan(ca) | std::isnan(cb)) [[unlikely]] {
    return false;
  }

  // 절대적 오차 (매우 작은 값들을 위해) - double precision 기준
  constexpr CommonType abs_tolerance =
      numeric_limits<CommonType>::epsilon() * 100;

  // 상대적 오차
  constexpr CommonType rel_tolerance = CommonType(1e-12);

  const CommonType diff = ca > cb ? ca - cb : cb - ca;

  // 절대적 오차 체크 (0에 가까운 값들)
  if (diff <= abs_tolerance) {
    return true;
  }

  // 상대적 오차 체크 (큰 값들)
  const CommonType abs_ca = ca < 0 ? -ca : ca;
  const CommonType abs_cb = cb < 0 ? -cb : cb;
  const CommonType max_val = abs_ca > abs_cb ? abs_ca : abs_cb;
  return diff <= rel_tolerance * max_val;
}

/// 부동 소수점 크기 비교를 위한 함수.
/// 왼쪽 값이 오른쪽 값보다 크면 true를 반환함.
template <typename T, typename U>
[[nodiscard]] inline bool IsGreater(T a, U b) noexcept {
  using CommonType = common_type_t<T, U>;

  const auto ca = static_cast<CommonType>(a);
  const auto cb = static_cast<CommonType>(b);

  // NaN 체크
  if (std::isnan(ca) | std::isnan(cb)) [[unlikely]] {
    return false;
  }

  return !IsEqual(ca, cb) && ca > cb;
}

/// 부동 소수점 크기 비교를 위한 함수.
/// 왼쪽 값이 오른쪽 값보다 크거나 같으면 true를 반환함.
template <typename T, typename U>
[[nodiscard]] inline bool IsGreaterOrEqual(T a, U b) noexcept {
  using CommonType = common_type_t<T, U>;

  const auto ca = static_cast<CommonType>(a);
  const auto cb = static_cast<CommonType>(b);

  // NaN 체크
  if (std::isnan(ca) | std::isnan(cb)) [[unlikely]] {
    return false;
  }

  return IsEqual(ca, cb) || ca > cb;
}

/// 부동 소수점 크기 비교를 위한 함수.
/// 왼쪽 값이 오른쪽 값보다 작으면 true를 반환함.
template <typename T, typename U>
[[nodiscard]] inline bool IsLess(T a, U b) noexcept {
  using CommonType = common_type_t<T, U>;

  const auto ca = static_cast<CommonType>(a);
  const auto cb = static_cast<CommonType>(b);

  // NaN 체크
  if (std::isnan(ca) | std::isnan(cb)) [[unlikely]] {
    return false;
  }

  return !IsEqual(ca, cb) && ca < cb;
}

/// 부동 소수점 크기 비교를 위한 함수.
/// 왼쪽 값이 오른쪽 값보다 작거나 같으면 true를 반환함.
template <typename T, typename U>
[[nodiscard]] inline bool IsLessOrEqual(T a, U b) noexcept {
  using CommonType = common_type_t<T, U>;

  const auto ca = static_cast<CommonType>(a);
  const auto cb = static_cast<CommonType>(b);

  // NaN 체크
  if (std::isnan(ca) | std::isnan(cb)) [[unlikely]] {
    return false;
  }

  return IsEqual(ca, cb) || ca < cb;
}

}  // namespace technical_analysis::utils
