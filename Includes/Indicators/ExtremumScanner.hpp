#pragma once

// 표준 라이브러리
#include <cstddef>
#include <optional>
#include <vector>

// 네임 스페이스
using namespace std;

namespace technical_analysis::indicator {

/// 스윙의 방향. 값은 결과 시계열에 기록되는 방향 코드
enum class SwingDirection : int { LOW = -1, HIGH = 1 };

/// 고정 윈도우 스캔으로 찾은 국소 극값 후보
struct Extremum {
  size_t position;           // 입력 시계열에서의 위치
  SwingDirection direction;  // 고점 또는 저점
  double value;              // 고점이면 high, 저점이면 low 값
};

/**
 * 중심 윈도우로 high/low 시계열 전체를 스캔하여 국소 극값 후보를 찾는
 * 클래스
 *
 * 윈도우는 중심 왼쪽 legs / 2개 바와 중심을 포함한 오른쪽 legs / 2 + 1개
 * 바로 구성됨. 윈도우 내 모든 값보다 작거나 같은 low는 저점, 크거나 같은
 * high는 고점이 되며, 같은 위치에서 저점이 고점보다 먼저 기록됨
 */
class ExtremumScanner final {
 public:
  ExtremumScanner() = delete;

  /**
   * 극값 후보를 위치 오름차순으로 반환하는 함수
   *
   * @param high 고가 배열
   * @param low 저가 배열. high와 길이가 같아야 함
   * @param legs 윈도우 크기 파라미터 (1 이상)
   * @return 극값 후보 목록. 윈도우를 한 번도 채울 수 없으면 nullopt,
   *         high와 low가 모두 상수인 시계열이면 빈 목록
   */
  [[nodiscard]] static optional<vector<Extremum>> Scan(
      const vector<double>& high, const vector<double>& low, int legs);

  /// 중심 왼쪽에서 비교하는 바의 개수를 반환하는 함수
  [[nodiscard]] static size_t GetLeft(int legs);

  /// 중심을 포함하여 오른쪽에서 비교하는 바의 개수를 반환하는 함수
  [[nodiscard]] static size_t GetRight(int legs);

 private:
  /// 모든 값이 같은 시계열인지 확인하는 함수
  [[nodiscard]] static bool IsFlat(const vector<double>& values);
};

}  // namespace technical_analysis::indicator
