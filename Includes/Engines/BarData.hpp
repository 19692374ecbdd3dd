#pragma once

// 표준 라이브러리
#include <memory>
#include <optional>
#include <string>

// 외부 라이브러리
#include <nlohmann/json_fwd.hpp>

// 내부 헤더
#include "Engines/Config.hpp"
#include "Engines/Series.hpp"

// 전방 선언
namespace arrow {
class Table;
}

// 네임 스페이스
using namespace std;
using namespace nlohmann;

namespace technical_analysis::bar {

using engine::ColumnNames;
using series::Frame;
using series::Series;

/// 하나의 심볼에서 읽은, 같은 시간 인덱스를 공유하는 가격 시계열 묶음
struct BarSeries {
  Series high;
  Series low;
  optional<Series> close;
};

/// 바 데이터 테이블을 지표 입력 시계열로 변환하고, 지표 결과를 파일로
/// 내보내는 클래스
class BarData final {
 public:
  BarData() = delete;

  /**
   * Parquet 파일에서 지정된 열을 읽어 시계열로 변환하는 함수
   *
   * @param file_path 바 데이터 Parquet 파일 경로
   * @param columns 시간, 고가, 저가, (선택) 종가 열 이름
   * @return 시간 열을 인덱스로 공유하는 시계열 묶음
   */
  [[nodiscard]] static BarSeries FromParquet(const string& file_path,
                                             const ColumnNames& columns);

  /**
   * Arrow 테이블에서 지정된 열을 읽어 시계열로 변환하는 함수.
   * 시간 열은 Int64, 가격 열은 Double이어야 하며 Null은 NaN으로 읽음
   */
  [[nodiscard]] static BarSeries FromTable(
      const shared_ptr<arrow::Table>& table, const ColumnNames& columns);

  /// 결과 Frame을 Json 객체로 변환하는 함수. NaN은 null로 기록됨
  [[nodiscard]] static ordered_json FrameToJson(const Frame& frame);

  /// 결과 Frame을 Arrow 테이블로 변환하는 함수. NaN은 Null로 기록됨
  [[nodiscard]] static shared_ptr<arrow::Table> FrameToTable(
      const Frame& frame);

  /// 결과 Frame을 지정된 경로에 Json 파일로 저장하는 함수
  static void FrameToJsonFile(const Frame& frame, const string& file_path);

  /// 결과 Frame을 지정된 경로에 Parquet 파일로 저장하는 함수
  static void FrameToParquet(const Frame& frame, const string& file_path);
};

}  // namespace technical_analysis::bar
