// 표준 라이브러리
#include <exception>
#include <format>
#include <string>

// 내부 헤더
#include "Engines/BarData.hpp"
#include "Engines/Config.hpp"
#include "Engines/Logger.hpp"
#include "Indicators/Indicators.hpp"

// 네임 스페이스
using namespace std;
using namespace technical_analysis;
using namespace bar;
using namespace engine;
using namespace indicator;
using namespace logger;

namespace {

/// 실행 설정에 따라 바 데이터를 읽고 ZigZag를 계산해 저장하는 함수.
/// 결과가 없으면 경고만 남기고 저장하지 않음
void Run(const string& config_path) {
  const auto& run_config = RunConfig::FromFile(config_path);

  if (run_config.log_directory) {
    Config::SetConfig().SetLogDirectory(*run_config.log_directory);
  }

  const auto& [high, low, close] =
      BarData::FromParquet(run_config.input_path, run_config.columns);

  const ZigZag zigzag(run_config.legs, run_config.deviation, run_config.offset,
                      run_config.fill_options);

  const auto& result = zigzag.Calculate(high, low, close);
  if (!result) {
    Logger::GetLogger()->Log(
        WARN_L,
        format("[{}] 결과가 없어 [{}] 경로에 저장하지 않았습니다.",
               zigzag.GetName(), run_config.output_path),
        __FILE__, __LINE__, true);
    return;
  }

  Logger::GetLogger()->Log(
      INFO_L,
      format("[{}] 계산 완료: 바 [{}]개, 스윙 열의 유효 값 [{}]개",
             zigzag.GetName(), result->NumRows(),
             result->GetColumn(zigzag.GetSwingColumnName()).CountValid()),
      __FILE__, __LINE__, true);

  switch (run_config.output_format) {
    case OutputFormat::JSON: {
      BarData::FrameToJsonFile(*result, run_config.output_path);
      break;
    }

    case OutputFormat::PARQUET: {
      BarData::FrameToParquet(*result, run_config.output_path);
      break;
    }
  }
}

}  // namespace

int main(const int argc, char** argv) {
  if (argc != 2) {
    Logger::GetLogger()->Log(
        ERROR_L, format("사용법: {} <실행 설정 Json 경로>", argv[0]),
        __FILE__, __LINE__, true);
    return 1;
  }

  try {
    Run(argv[1]);
  } catch (const std::exception& e) {
    // 실행 중 발생한 오류의 상세 원인 로그
    Logger::GetLogger()->Log(ERROR_L, e.what(), __FILE__, __LINE__, true);
    return 1;
  }

  return 0;
}
