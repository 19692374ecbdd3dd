// 표준 라이브러리
#include <cmath>

// 내부 헤더
#include "Engines/Config.hpp"
#include "Engines/Exception.hpp"

// 파일 헤더
#include "ZigZagTest.hpp"

using namespace technical_analysis::engine;
using namespace technical_analysis::exception;
using namespace technical_analysis::utils;

void ZigZagTest::SetUp() {
  Config::SetConfig().ResetDefaults();

  high = Series({1, 3, 2, 5, 1, 6, 2}, "high");
  low = Series({0, 2, 1, 3, 0, 4, 1}, "low");

  vector<double> high_values;
  vector<double> low_values;
  for (int i = 0; i < 200; i++) {
    const double base = 100 + 10 * sin(i * 0.3) + 5 * sin(i * 0.07);
    high_values.push_back(base + 1 + (i % 3) * 0.5);
    low_values.push_back(base - 1 - (i % 5) * 0.3);
  }

  generated_high = Series(move(high_values), "high");
  generated_low = Series(move(low_values), "low");
}

void ZigZagTest::TearDown() { Config::SetConfig().ResetDefaults(); }

vector<Swing> ZigZagTest::CollectSwings(const Frame& frame,
                                        const ZigZag& zigzag) {
  const auto& direction = frame.GetColumn(zigzag.GetSwingColumnName());
  const auto& value = frame.GetColumn(zigzag.GetValueColumnName());
  const auto& deviation = frame.GetColumn(zigzag.GetDeviationColumnName());

  vector<Swing> swings;
  for (size_t i = 0; i < frame.NumRows(); i++) {
    if (isnan(direction[i])) {
      continue;
    }

    swings.push_back({i,
                      direction[i] > 0 ? SwingDirection::HIGH
                                       : SwingDirection::LOW,
                      value[i], deviation[i]});
  }

  return swings;
}

TEST_F(ZigZagTest, NamingTest) {
  const ZigZag zigzag(1, 10.0);

  EXPECT_EQ(zigzag.GetName(), "ZIGZAG_10.0%_1");
  EXPECT_EQ(zigzag.GetClassName(), "zigzag");
  EXPECT_EQ(zigzag.GetCategory(), "trend");
  EXPECT_EQ(zigzag.GetSwingColumnName(), "ZIGZAGs_10.0%_1");
  EXPECT_EQ(zigzag.GetValueColumnName(), "ZIGZAGv_10.0%_1");
  EXPECT_EQ(zigzag.GetDeviationColumnName(), "ZIGZAGd_10.0%_1");

  EXPECT_EQ(ZigZag(3, 2.5).GetName(), "ZIGZAG_2.5%_3");

  // 1e-4 이상 1e16 미만은 소수로, 그 외는 지수로 표시됨
  EXPECT_EQ(ZigZag(2, 100000.0).GetName(), "ZIGZAG_100000.0%_2");
  EXPECT_EQ(ZigZag(2, 0.0005).GetName(), "ZIGZAG_0.0005%_2");
  EXPECT_EQ(ZigZag(2, 0.00005).GetValueColumnName(), "ZIGZAGv_5e-05%_2");
}

TEST_F(ZigZagTest, DefaultParameterTest) {
  const ZigZag zigzag;

  EXPECT_EQ(zigzag.GetLegs(), 10);
  EXPECT_DOUBLE_EQ(zigzag.GetDeviation(), 5.0);
  EXPECT_EQ(zigzag.GetOffset(), 0);
  EXPECT_EQ(zigzag.GetMinLength(), 11);
  EXPECT_EQ(zigzag.GetName(), "ZIGZAG_5.0%_10");

  // Config 기본값 변경은 이후 생성되는 지표에 반영됨
  Config::SetConfig().SetDefaultLegs(4).SetDefaultDeviation(3);
  EXPECT_EQ(ZigZag().GetName(), "ZIGZAG_3.0%_4");
}

TEST_F(ZigZagTest, HandComputedSwingsTest) {
  const ZigZag zigzag(1, 10.0);

  const auto& result = zigzag.Calculate(high, low);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->GetName(), "ZIGZAG_10.0%_1");
  EXPECT_EQ(result->GetCategory(), "trend");
  EXPECT_EQ(result->NumRows(), 7);
  EXPECT_EQ(result->GetColumnNames(),
            vector<string>({"ZIGZAGs_10.0%_1", "ZIGZAGv_10.0%_1",
                            "ZIGZAGd_10.0%_1"}));

  const auto& swings = CollectSwings(*result, zigzag);
  ASSERT_EQ(swings.size(), 2);

  EXPECT_EQ(swings[0].position, 3);
  EXPECT_EQ(swings[0].direction, SwingDirection::LOW);
  EXPECT_DOUBLE_EQ(swings[0].value, 3);
  EXPECT_DOUBLE_EQ(swings[0].deviation, 0);

  EXPECT_EQ(swings[1].position, 5);
  EXPECT_EQ(swings[1].direction, SwingDirection::HIGH);
  EXPECT_DOUBLE_EQ(swings[1].value, 6);
  EXPECT_DOUBLE_EQ(swings[1].deviation, 100);

  // 결과는 입력 인덱스를 그대로 사용함
  EXPECT_EQ(*result->GetIndex(), *high.GetIndex());
}

TEST_F(ZigZagTest, InsufficientDataTest) {
  // 최소 길이 legs + 1 미만
  const Series short_high({1, 2, 3, 2, 1});
  const Series short_low({0, 1, 2, 1, 0});
  EXPECT_FALSE(ZigZag(10).Calculate(short_high, short_low).has_value());

  // 최소 길이는 만족하지만 윈도우 left + right + 1 = 12를 채우지 못함
  vector<double> values(11);
  for (size_t i = 0; i < values.size(); i++) {
    values[i] = static_cast<double>(i % 4) + 1;
  }
  EXPECT_FALSE(
      ZigZag(10).Calculate(Series(values), Series(values)).has_value());
}

TEST_F(ZigZagTest, ShortCloseTest) {
  // legs 4 → 최소 길이 5
  const Series close({1, 2, 3});
  EXPECT_FALSE(ZigZag(4, 10.0).Calculate(high, low, close).has_value());

  const Series full_close({1, 2, 2, 4, 1, 5, 2});
  EXPECT_TRUE(ZigZag(1, 10.0).Calculate(high, low, full_close).has_value());
}

TEST_F(ZigZagTest, FlatSeriesTest) {
  const Series flat_high(vector<double>(30, 10.0));
  const Series flat_low(vector<double>(30, 9.0));

  const ZigZag zigzag(4);
  const auto& result = zigzag.Calculate(flat_high, flat_low);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->NumRows(), 30);

  for (const auto& column : result->GetColumns()) {
    EXPECT_EQ(column.CountValid(), 0);
  }
}

TEST_F(ZigZagTest, FlatSeriesMinimumLengthTest) {
  // 홀수 legs는 legs + 1개로 윈도우를 채울 수 있으므로 결측 결과
  const Series flat_high(vector<double>(10, 10.0));
  const Series flat_low(vector<double>(10, 9.0));
  const auto& result = ZigZag(9).Calculate(flat_high, flat_low);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->GetColumns().front().CountValid(), 0);

  // 짝수 legs는 legs + 2개가 필요하므로 legs + 1개면 평탄해도 결과 없음
  const Series short_flat_high(vector<double>(11, 10.0));
  const Series short_flat_low(vector<double>(11, 9.0));
  EXPECT_FALSE(
      ZigZag(10).Calculate(short_flat_high, short_flat_low).has_value());

  const Series long_flat_high(vector<double>(12, 10.0));
  const Series long_flat_low(vector<double>(12, 9.0));
  EXPECT_TRUE(ZigZag(10).Calculate(long_flat_high, long_flat_low).has_value());
}

TEST_F(ZigZagTest, OffsetTest) {
  const ZigZag zigzag(1, 10.0, 2);
  const auto& result = zigzag.Calculate(high, low);
  ASSERT_TRUE(result.has_value());

  const auto& direction = result->GetColumn(zigzag.GetSwingColumnName());
  const auto& value = result->GetColumn(zigzag.GetValueColumnName());
  ASSERT_EQ(direction.Size(), 7);

  // 위치 3의 저점은 5로 이동하고, 위치 5의 고점은 범위를 벗어나 버려짐
  EXPECT_EQ(direction.CountValid(), 1);
  EXPECT_DOUBLE_EQ(direction[5], -1);
  EXPECT_DOUBLE_EQ(value[5], 3);

  for (size_t i = 0; i < 2; i++) {
    EXPECT_TRUE(isnan(direction[i]));
  }
}

TEST_F(ZigZagTest, OffsetShiftLawTest) {
  const ZigZag base_zigzag(4, 3.0);
  const auto& base = base_zigzag.Calculate(generated_high, generated_low);
  ASSERT_TRUE(base.has_value());

  const size_t size = generated_high.Size();

  for (const int64_t offset : {1, 3, 17, 199, 200, 250}) {
    const ZigZag zigzag(4, 3.0, offset);
    const auto& shifted = zigzag.Calculate(generated_high, generated_low);
    ASSERT_TRUE(shifted.has_value());
    ASSERT_EQ(shifted->NumRows(), size);

    // offset k 결과는 offset 0 결과를 k만큼 미래로 이동한 것과 같음
    for (size_t column = 0; column < 3; column++) {
      const auto& expected = base->GetColumns()[column];
      const auto& actual = shifted->GetColumns()[column];

      for (size_t i = 0; i < size; i++) {
        if (i < static_cast<size_t>(offset)) {
          EXPECT_TRUE(isnan(actual[i]));
          continue;
        }

        const double source = expected[i - offset];
        if (isnan(source)) {
          EXPECT_TRUE(isnan(actual[i]));
        } else {
          EXPECT_DOUBLE_EQ(actual[i], source);
        }
      }
    }
  }
}

TEST_F(ZigZagTest, FillValueTest) {
  const ZigZag zigzag(1, 10.0, nullopt, FillOptions{.fill_value = 0});
  const auto& result = zigzag.Calculate(high, low);
  ASSERT_TRUE(result.has_value());

  const auto& direction = result->GetColumn(zigzag.GetSwingColumnName());
  EXPECT_EQ(direction.CountValid(), 7);

  const vector<double> expected = {0, 0, 0, -1, 0, 1, 0};
  for (size_t i = 0; i < expected.size(); i++) {
    EXPECT_DOUBLE_EQ(direction[i], expected[i]);
  }
}

TEST_F(ZigZagTest, FillMethodTest) {
  const ZigZag zigzag(1, 10.0, nullopt,
                      FillOptions{.fill_method = FillMethod::FFILL});
  EXPECT_EQ(zigzag.GetFillOptions().fill_method,
            optional<FillMethod>(FillMethod::FFILL));
  const auto& result = zigzag.Calculate(high, low);
  ASSERT_TRUE(result.has_value());

  const auto& value = result->GetColumn(zigzag.GetValueColumnName());

  // 첫 스윙 이전은 전파할 값이 없으므로 결측으로 남음
  for (size_t i = 0; i < 3; i++) {
    EXPECT_TRUE(isnan(value[i]));
  }

  const vector<double> expected = {3, 3, 6, 6};
  for (size_t i = 0; i < expected.size(); i++) {
    EXPECT_DOUBLE_EQ(value[i + 3], expected[i]);
  }
}

TEST_F(ZigZagTest, GeneratedSeriesPropertiesTest) {
  for (const auto& [legs, deviation] :
       vector<pair<int, double>>{{4, 3.0}, {10, 5.0}, {3, 1.5}, {1, 2.0}}) {
    const ZigZag zigzag(legs, deviation);
    const auto& result = zigzag.Calculate(generated_high, generated_low);
    ASSERT_TRUE(result.has_value());

    const auto& swings = CollectSwings(*result, zigzag);
    ASSERT_GT(swings.size(), 2);

    // 가장 오래된 스윙은 변동률 0
    EXPECT_DOUBLE_EQ(swings.front().deviation, 0);

    for (size_t i = 1; i < swings.size(); i++) {
      const auto& previous = swings[i - 1];
      const auto& current = swings[i];

      // 방향이 번갈아 나타남
      EXPECT_NE(previous.direction, current.direction);

      // 변동률은 직전 스윙 대비 움직임이며 임계값을 초과함
      EXPECT_NEAR(current.deviation,
                  100 * abs(current.value - previous.value) / previous.value,
                  1e-9);
      EXPECT_GT(current.deviation, deviation);

      // 고점은 high, 저점은 low 값
      const double expected_value =
          current.direction == SwingDirection::HIGH
              ? generated_high[current.position]
              : generated_low[current.position];
      EXPECT_DOUBLE_EQ(current.value, expected_value);
    }

    // 확정된 고점(저점)은 다음 반대 방향 스윙까지의 어떤 high(low)보다
    // 낮지(높지) 않음. 가장 최근 두 스윙은 확정 스윙이 하나뿐일 때
    // 수정되지 않으므로 제외함
    for (size_t i = 0; i + 2 < swings.size(); i++) {
      const auto& swing = swings[i];
      const auto& next = swings[i + 1];

      for (size_t position = swing.position + 1; position < next.position;
           position++) {
        if (swing.direction == SwingDirection::HIGH) {
          EXPECT_LE(generated_high[position], swing.value);
        } else {
          EXPECT_GE(generated_low[position], swing.value);
        }
      }
    }
  }
}

TEST_F(ZigZagTest, DeterministicTest) {
  const ZigZag zigzag(4, 3.0);
  const auto& first = zigzag.Calculate(generated_high, generated_low);
  const auto& second = zigzag.Calculate(generated_high, generated_low);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());

  const auto& first_swings = CollectSwings(*first, zigzag);
  const auto& second_swings = CollectSwings(*second, zigzag);
  ASSERT_EQ(first_swings.size(), second_swings.size());

  for (size_t i = 0; i < first_swings.size(); i++) {
    EXPECT_EQ(first_swings[i].position, second_swings[i].position);
    EXPECT_DOUBLE_EQ(first_swings[i].deviation, second_swings[i].deviation);
  }
}

TEST_F(ZigZagTest, InvalidParameterTest) {
  EXPECT_THROW(ZigZag(0), InvalidParameter);
  EXPECT_THROW(ZigZag(-1), InvalidParameter);
  EXPECT_THROW(ZigZag(10, 0.0), InvalidParameter);
  EXPECT_THROW(ZigZag(10, -5.0), InvalidParameter);
  EXPECT_THROW(ZigZag(10, 5.0, -1), InvalidParameter);
}

TEST_F(ZigZagTest, MisalignedInputTest) {
  const Series longer_low({0, 2, 1, 3, 0, 4, 1, 2});
  EXPECT_THROW(static_cast<void>(ZigZag(1, 10.0).Calculate(high, longer_low)),
               InvalidValue);
}
