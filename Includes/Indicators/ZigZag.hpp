#pragma once

// 표준 라이브러리
#include <cstdint>
#include <optional>
#include <string>

// 내부 헤더
#include "Engines/Indicator.hpp"
#include "Indicators/ExtremumScanner.hpp"
#include "Indicators/OutputDensifier.hpp"
#include "Indicators/SwingReducer.hpp"

// 네임 스페이스
using namespace std;

namespace technical_analysis::indicator {

/**
 * Zigzag (ZIGZAG)
 *
 * 고정 중심 윈도우로 찾은 국소 고점/저점 중, 최소 변동률 이상 움직인 추세
 * 전환점만 남겨 원래 시간축에 표시하는 지표.
 *
 * 스윙은 이후 데이터로만 확정되므로 본질적으로 미래 정보를 사용하는 지표임.
 * 결과를 과거로 옮기는 음수 offset은 허용하지 않음.
 *
 * 결과 Frame의 열 (접미사는 "_<deviation>%_<legs>")\n
 * - ZIGZAGs: 스윙 방향 (+1 고점, -1 저점)\n
 * - ZIGZAGv: 스윙 가격\n
 * - ZIGZAGd: 직전 스윙에서의 변동률 (%)
 */
class ZigZag final : public Indicator {
 public:
  /**
   * @param legs 윈도우 크기. 없으면 Config 기본값(10), 0 이하면 오류
   * @param deviation 최소 변동률 (%). 없으면 Config 기본값(5.0), 0 이하면
   *                  오류
   * @param offset 결과를 미래 방향으로 이동할 바 개수. 음수면 오류
   * @param fill_options 결과의 결측값 채우기 방법
   */
  explicit ZigZag(const optional<int>& legs = nullopt,
                  const optional<double>& deviation = nullopt,
                  const optional<int64_t>& offset = nullopt,
                  FillOptions fill_options = {});

  /**
   * 스캔 → 축약 → 펼치기 순서로 지표를 계산하는 함수
   *
   * @param high 고가 시계열
   * @param low 저가 시계열. high와 같은 인덱스여야 함
   * @param close 종가 시계열. 계산에는 사용하지 않으며 검증만 함
   * @return 결과 Frame. 데이터가 legs + 1개보다 적거나 윈도우를 채울 수
   *         없으면 nullopt.
   *         데이터 부족 판정이 평탄 시계열 판정보다 우선함. 윈도우는
   *         legs / 2 * 2 + 2개의 바가 필요하므로 짝수 legs에서 legs + 1개의
   *         평탄 시계열은 결측 Frame이 아니라 nullopt를 반환함
   */
  [[nodiscard]] optional<Frame> Calculate(
      const Series& high, const Series& low,
      const optional<Series>& close = nullopt) const;

  [[nodiscard]] int GetLegs() const;
  [[nodiscard]] double GetDeviation() const;

  /// 계산에 필요한 최소 데이터 길이를 반환하는 함수
  [[nodiscard]] size_t GetMinLength() const;

  [[nodiscard]] string GetSwingColumnName() const;
  [[nodiscard]] string GetValueColumnName() const;
  [[nodiscard]] string GetDeviationColumnName() const;

 private:
  int legs_;
  double deviation_;
  string properties_;  // 이름 접미사 "_<deviation>%_<legs>"
};

}  // namespace technical_analysis::indicator
