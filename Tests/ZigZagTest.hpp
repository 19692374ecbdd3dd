#pragma once
// 표준 라이브러리
#include <vector>

// 외부 라이브러리
#include <gtest/gtest.h>

// 내부 헤더
#include "Engines/Series.hpp"
#include "Indicators/ZigZag.hpp"

using namespace std;
using namespace technical_analysis::indicator;
using namespace technical_analysis::series;

class ZigZagTest : public testing::Test {
 public:
  // 손으로 계산 가능한 7개 바
  Series high;
  Series low;

  // 두 개의 사인파를 겹친 200개 바
  Series generated_high;
  Series generated_low;

 protected:
  void SetUp() override;
  void TearDown() override;

  /// 결과 Frame에서 확정된 스윙만 (위치, 방향, 값, 변동률) 순서로 추출하는
  /// 함수
  static vector<Swing> CollectSwings(const Frame& frame, const ZigZag& zigzag);
};
