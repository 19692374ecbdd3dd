#pragma once

// 표준 라이브러리
#include <cstdint>
#include <optional>
#include <string>

// 외부 라이브러리
#include <nlohmann/json_fwd.hpp>

// 내부 헤더
#include "Engines/SeriesUtils.hpp"

// 네임 스페이스
using namespace std;
using namespace nlohmann;

namespace technical_analysis::engine {

/// 파라미터가 주어지지 않았을 때 사용하는 문서화된 기본값
constexpr int kDefaultLegs = 10;
constexpr double kDefaultDeviation = 5.0;
constexpr int64_t kDefaultOffset = 0;

/// 라이브러리의 사전 설정값을 담당하는 빌더 클래스
class Config final {
 public:
  /// 설정값을 변경하기 위해 싱글톤 설정을 반환하는 함수.
  ///
  /// 설정값 변경은 항상 이 함수를 통해야 함.
  static Config& SetConfig();

  /// 현재 설정값을 읽기 전용으로 반환하는 함수
  [[nodiscard]] static const Config& GetConfig();

  /// 로그 폴더를 설정하는 함수. 로거의 출력 폴더도 함께 변경됨
  Config& SetLogDirectory(const string& log_directory);

  /// 지표 윈도우 파라미터 legs의 기본값을 설정하는 함수
  Config& SetDefaultLegs(int legs);

  /// 편차 임계값의 기본값을 설정하는 함수
  /// (퍼센트로 지정: 5% -> O: 5 X: 0.05)
  Config& SetDefaultDeviation(double deviation);

  /// 결과 이동 offset의 기본값을 설정하는 함수
  Config& SetDefaultOffset(int64_t offset);

  /// 모든 기본값을 문서화된 초기값으로 되돌리는 함수
  Config& ResetDefaults();

  [[nodiscard]] const string& GetLogDirectory() const;
  [[nodiscard]] int GetDefaultLegs() const;
  [[nodiscard]] double GetDefaultDeviation() const;
  [[nodiscard]] int64_t GetDefaultOffset() const;

 private:
  Config();

  string log_directory_;  // 로그 파일 폴더. 비어있으면 현재 폴더
  int default_legs_;
  double default_deviation_;
  int64_t default_offset_;
};

/// 결과를 저장할 파일 형식
enum class OutputFormat { JSON, PARQUET };

/// 바 데이터 Parquet 파일에서 읽을 열 이름
struct ColumnNames {
  string time = "open_time";
  string high = "high";
  string low = "low";
  optional<string> close;  // 지정된 경우에만 검증용으로 읽음
};

/**
 * ZigZagRunner 실행 설정.
 *
 * Json 파일에서 읽으며, 지표 파라미터가 없으면 계산 시 Config의 기본값이
 * 사용됨
 */
struct RunConfig {
  string input_path;
  string output_path;
  OutputFormat output_format = OutputFormat::JSON;
  ColumnNames columns;

  optional<int> legs;
  optional<double> deviation;
  optional<int64_t> offset;
  utils::FillOptions fill_options;

  optional<string> log_directory;

  /// Json 객체에서 실행 설정을 파싱하는 함수.
  /// 필수 키가 없거나 타입이 잘못되면 InvalidParameter를 던짐
  [[nodiscard]] static RunConfig FromJson(const json& config_json);

  /// Json 파일에서 실행 설정을 읽는 함수
  [[nodiscard]] static RunConfig FromFile(const string& file_path);
};

}  // namespace technical_analysis::engine
