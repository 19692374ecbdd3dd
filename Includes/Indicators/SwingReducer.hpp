#pragma once

// 표준 라이브러리
#include <cstddef>
#include <vector>

// 내부 헤더
#include "Indicators/ExtremumScanner.hpp"

// 네임 스페이스
using namespace std;

namespace technical_analysis::indicator {

/// 편차 필터링을 통과하여 확정된 추세 전환점
struct Swing {
  size_t position;           // 입력 시계열에서의 위치
  SwingDirection direction;  // 고점 또는 저점
  double value;              // 스윙 가격
  double deviation;  // 직전(시간상 이전) 스윙에서 이 스윙까지의 변동률 (%)
};

/**
 * 극값 후보를 최신 → 과거 순서로 훑으며 편차 임계값을 넘는 전환만 남겨
 * 고점과 저점이 번갈아 나오는 스윙 목록으로 축약하는 클래스
 *
 * 상태는 확정된 스윙 목록과 진행 중인 스윙 하나로 구성됨.\n
 * - 같은 방향의 더 극단적인 후보: 진행 중인 스윙의 위치와 값을 수정 (Amend)\n
 * - 반대 방향 후보의 변동률이 임계값 초과: 진행 중인 스윙을 확정하고
 *   후보에서 새 스윙을 시작 (CommitAndStart)\n
 * - 그 외: 후보 무시
 *
 * Reduce 호출마다 상태를 초기화하므로 객체 하나를 여러 번 사용할 수 있으나,
 * 동시에 여러 스레드에서 같은 객체를 사용할 수는 없음
 */
class SwingReducer final {
 public:
  /// @param deviation 스윙 확정에 필요한 최소 변동률 (퍼센트, 0보다 커야 함)
  explicit SwingReducer(double deviation);

  /**
   * 위치 오름차순의 극값 후보 목록을 시간순의 확정 스윙 목록으로 축약하는
   * 함수
   *
   * 가장 오래된 스윙은 비교할 이전 스윙이 없으므로 변동률이 0으로 기록됨
   */
  [[nodiscard]] vector<Swing> Reduce(const vector<Extremum>& extrema);

  [[nodiscard]] double GetDeviation() const;

 private:
  double deviation_;  // 퍼센트 단위 임계값
  double threshold_;  // 비율 단위 임계값 (deviation / 100)

  vector<Swing> finalized_;  // 확정된 스윙. 최신 스윙부터 과거 순서
  Swing pending_;            // 진행 중인 스윙

  /// 후보 하나를 처리하는 상태 전이 함수
  void Process(const Extremum& candidate);

  /// 진행 중인 스윙을 같은 방향의 더 극단적인 후보로 수정하는 함수.
  /// 직전에 확정된 스윙의 변동률도 새 값 기준으로 다시 계산됨
  void Amend(const Extremum& candidate);

  /// 진행 중인 스윙을 변동률과 함께 확정하고 후보에서 새 스윙을 시작하는
  /// 함수
  void CommitAndStart(const Extremum& candidate, double deviation_ratio);

  /// 후보가 진행 중인 스윙보다 같은 방향으로 더 극단적인지 확인하는 함수
  [[nodiscard]] bool IsMoreExtreme(const Extremum& candidate) const;

  /**
   * 시간상 나중인 기준 스윙과 이전 후보 사이의 방향성 변동률을 계산하는 함수
   *
   * 고점과 저점의 차이를 후보 값으로 나눔. 기준이 저점이면
   * (후보 - 기준) / 후보, 기준이 고점이면 (기준 - 후보) / 후보이며,
   * 반대 방향 움직임은 음수가 됨
   */
  [[nodiscard]] static double CalculateDeviation(SwingDirection reference_direction,
                                                 double reference_value,
                                                 double candidate_value);
};

}  // namespace technical_analysis::indicator
