#pragma once

// 표준 라이브러리
#include <cstddef>
#include <vector>

// 내부 헤더
#include "Indicators/SwingReducer.hpp"

// 네임 스페이스
using namespace std;

namespace technical_analysis::indicator {

/// 입력 시계열 길이로 펼쳐진 스윙 결과. 스윙이 아닌 위치는 NaN
struct DenseSwings {
  vector<double> direction;  // +1 고점, -1 저점
  vector<double> value;
  vector<double> deviation;
};

/// 희소한 스윙 목록을 원래 시간축의 세 개 배열로 펼치는 클래스
class OutputDensifier final {
 public:
  OutputDensifier() = delete;

  /**
   * @param swings 확정된 스윙 목록
   * @param size 입력 시계열의 길이
   * @return 길이 size의 방향, 값, 변동률 배열.
   *         스윙 위치가 size 이상이면 IndexOutOfRange를 던짐
   */
  [[nodiscard]] static DenseSwings Densify(const vector<Swing>& swings,
                                           size_t size);
};

}  // namespace technical_analysis::indicator
