// 표준 라이브러리
#include <cmath>
#include <format>

// 외부 라이브러리
#include "nlohmann/json.hpp"

// 파일 헤더
#include "Engines/Config.hpp"

// 내부 헤더
#include "Engines/DataUtils.hpp"
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"

// 네임 스페이스
namespace technical_analysis {
using namespace exception;
using namespace logger;
using namespace utils;
}  // namespace technical_analysis

namespace technical_analysis::engine {

Config::Config()
    : default_legs_(kDefaultLegs),
      default_deviation_(kDefaultDeviation),
      default_offset_(kDefaultOffset) {}

Config& Config::SetConfig() {
  // 함수 내 정적 변수의 초기화는 여러 스레드에서 동시에 호출되어도 한 번만
  // 수행됨
  static Config instance;
  return instance;
}

const Config& Config::GetConfig() { return SetConfig(); }

Config& Config::SetLogDirectory(const string& log_directory) {
  Logger::SetLogDirectory(log_directory);
  log_directory_ = log_directory;
  return *this;
}

Config& Config::SetDefaultLegs(const int legs) {
  if (legs <= 0) {
    Logger::LogAndThrow<InvalidParameter>(
        format("기본 Legs [{}]은(는) 0보다 커야 합니다.", legs), __FILE__,
        __LINE__);
  }

  default_legs_ = legs;
  return *this;
}

Config& Config::SetDefaultDeviation(const double deviation) {
  if (!isfinite(deviation) || deviation <= 0) {
    Logger::LogAndThrow<InvalidParameter>(
        format("기본 Deviation [{}]은(는) 0보다 커야 합니다.", deviation),
        __FILE__, __LINE__);
  }

  default_deviation_ = deviation;
  return *this;
}

Config& Config::SetDefaultOffset(const int64_t offset) {
  if (offset < 0) {
    Logger::LogAndThrow<InvalidParameter>(
        format("기본 Offset [{}]은(는) 0 이상이어야 합니다.", offset),
        __FILE__, __LINE__);
  }

  default_offset_ = offset;
  return *this;
}

Config& Config::ResetDefaults() {
  default_legs_ = kDefaultLegs;
  default_deviation_ = kDefaultDeviation;
  default_offset_ = kDefaultOffset;
  return *this;
}

const string& Config::GetLogDirectory() const { return log_directory_; }
int Config::GetDefaultLegs() const { return default_legs_; }
double Config::GetDefaultDeviation() const { return default_deviation_; }
int64_t Config::GetDefaultOffset() const { return default_offset_; }

RunConfig RunConfig::FromJson(const json& config_json) {
  if (!config_json.is_object()) {
    Logger::LogAndThrow<InvalidParameter>("실행 설정은 Json 객체여야 합니다.",
                                          __FILE__, __LINE__);
  }

  for (const auto& required_key : {"input", "output"}) {
    if (!config_json.contains(required_key)) {
      Logger::LogAndThrow<InvalidParameter>(
          format("실행 설정에 필수 키 [{}]이(가) 없습니다.", required_key),
          __FILE__, __LINE__);
    }
  }

  RunConfig run_config;

  try {
    run_config.input_path = config_json.at("input").get<string>();
    run_config.output_path = config_json.at("output").get<string>();

    if (const string& output_format = config_json.value("format", "json");
        output_format == "json") {
      run_config.output_format = OutputFormat::JSON;
    } else if (output_format == "parquet") {
      run_config.output_format = OutputFormat::PARQUET;
    } else {
      Logger::LogAndThrow<InvalidParameter>(
          format("출력 형식 [{}]은(는) json 또는 parquet이어야 합니다.",
                 output_format),
          __FILE__, __LINE__);
    }

    if (config_json.contains("columns")) {
      const auto& columns = config_json.at("columns");
      auto& [time, high, low, close] = run_config.columns;

      time = columns.value("time", time);
      high = columns.value("high", high);
      low = columns.value("low", low);

      if (columns.contains("close") && !columns.at("close").is_null()) {
        close = columns.at("close").get<string>();
      }
    }

    // 지표 파라미터는 존재할 때만 설정하여 기본값 대체를 계산 시점에 맡김
    if (config_json.contains("legs")) {
      run_config.legs = config_json.at("legs").get<int>();
    }

    if (config_json.contains("deviation")) {
      run_config.deviation = config_json.at("deviation").get<double>();
    }

    if (config_json.contains("offset")) {
      run_config.offset = config_json.at("offset").get<int64_t>();
    }

    if (config_json.contains("fillna") && !config_json.at("fillna").is_null()) {
      run_config.fill_options.fill_value =
          config_json.at("fillna").get<double>();
    }

    if (config_json.contains("fill_method") &&
        !config_json.at("fill_method").is_null()) {
      run_config.fill_options.fill_method =
          ParseFillMethod(config_json.at("fill_method").get<string>());
    }

    if (config_json.contains("log_directory")) {
      run_config.log_directory = config_json.at("log_directory").get<string>();
    }
  } catch (const json::exception& e) {
    Logger::LogAndThrow<InvalidParameter>(
        format("실행 설정을 파싱하는 중 오류가 발생했습니다: {}", e.what()),
        __FILE__, __LINE__);
  }

  return run_config;
}

RunConfig RunConfig::FromFile(const string& file_path) {
  return FromJson(JsonFromFile(file_path));
}

}  // namespace technical_analysis::engine
