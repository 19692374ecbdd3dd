// 표준 라이브러리
#include <thread>
#include <vector>

// 내부 헤더
#include "Engines/DataUtils.hpp"
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"
#include "Indicators/ZigZag.hpp"

// 파일 헤더
#include "ConfigTest.hpp"

using namespace technical_analysis::exception;
using namespace technical_analysis::indicator;
using namespace technical_analysis::logger;
using namespace technical_analysis::utils;

void ConfigTest::SetUp() {
  Config::SetConfig().ResetDefaults();

  minimal_config = {{"input", "bars.parquet"}, {"output", "zigzag.json"}};

  temp_directory = temp_directory_path() / "technical_analysis_config_test";
  create_directories(temp_directory);
}

void ConfigTest::TearDown() {
  Config::SetConfig().ResetDefaults();
  remove_all(temp_directory);
}

TEST_F(ConfigTest, DefaultsTest) {
  const auto& config = Config::GetConfig();
  EXPECT_EQ(config.GetDefaultLegs(), kDefaultLegs);
  EXPECT_DOUBLE_EQ(config.GetDefaultDeviation(), kDefaultDeviation);
  EXPECT_EQ(config.GetDefaultOffset(), kDefaultOffset);

  Config::SetConfig().SetDefaultLegs(6).SetDefaultDeviation(2.5).SetDefaultOffset(
      1);
  EXPECT_EQ(Config::GetConfig().GetDefaultLegs(), 6);
  EXPECT_DOUBLE_EQ(Config::GetConfig().GetDefaultDeviation(), 2.5);
  EXPECT_EQ(Config::GetConfig().GetDefaultOffset(), 1);

  EXPECT_THROW(Config::SetConfig().SetDefaultLegs(0), InvalidParameter);
  EXPECT_THROW(Config::SetConfig().SetDefaultDeviation(-1), InvalidParameter);
  EXPECT_THROW(Config::SetConfig().SetDefaultOffset(-1), InvalidParameter);

  // 실패한 설정은 기존 값을 유지함
  EXPECT_EQ(Config::GetConfig().GetDefaultLegs(), 6);
}

TEST_F(ConfigTest, MinimalRunConfigTest) {
  const auto& run_config = RunConfig::FromJson(minimal_config);

  EXPECT_EQ(run_config.input_path, "bars.parquet");
  EXPECT_EQ(run_config.output_path, "zigzag.json");
  EXPECT_EQ(run_config.output_format, OutputFormat::JSON);
  EXPECT_EQ(run_config.columns.time, "open_time");
  EXPECT_EQ(run_config.columns.high, "high");
  EXPECT_EQ(run_config.columns.low, "low");
  EXPECT_FALSE(run_config.columns.close.has_value());

  // 파라미터가 없으면 계산 시점의 기본값을 사용하도록 비워둠
  EXPECT_FALSE(run_config.legs.has_value());
  EXPECT_FALSE(run_config.deviation.has_value());
  EXPECT_FALSE(run_config.offset.has_value());
  EXPECT_FALSE(run_config.fill_options.fill_value.has_value());
  EXPECT_FALSE(run_config.fill_options.fill_method.has_value());
  EXPECT_FALSE(run_config.log_directory.has_value());
}

TEST_F(ConfigTest, FullRunConfigTest) {
  json config_json = minimal_config;
  config_json["format"] = "parquet";
  config_json["columns"] = {{"time", "timestamp"}, {"close", "close"}};
  config_json["legs"] = 4;
  config_json["deviation"] = 2.5;
  config_json["offset"] = 1;
  config_json["fillna"] = 0;
  config_json["fill_method"] = "bfill";
  config_json["log_directory"] = "Logs";

  const auto& run_config = RunConfig::FromJson(config_json);

  EXPECT_EQ(run_config.output_format, OutputFormat::PARQUET);
  EXPECT_EQ(run_config.columns.time, "timestamp");
  EXPECT_EQ(run_config.columns.high, "high");
  EXPECT_EQ(run_config.columns.close, optional<string>("close"));
  EXPECT_EQ(run_config.legs, optional<int>(4));
  EXPECT_EQ(run_config.deviation, optional<double>(2.5));
  EXPECT_EQ(run_config.offset, optional<int64_t>(1));
  EXPECT_EQ(run_config.fill_options.fill_value, optional<double>(0));
  EXPECT_EQ(run_config.fill_options.fill_method,
            optional<FillMethod>(FillMethod::BFILL));
  EXPECT_EQ(run_config.log_directory, optional<string>("Logs"));
}

TEST_F(ConfigTest, InvalidRunConfigTest) {
  EXPECT_THROW(static_cast<void>(RunConfig::FromJson(json::array())),
               InvalidParameter);
  EXPECT_THROW(static_cast<void>(
                   RunConfig::FromJson({{"input", "bars.parquet"}})),
               InvalidParameter);

  json config_json = minimal_config;
  config_json["format"] = "csv";
  EXPECT_THROW(static_cast<void>(RunConfig::FromJson(config_json)),
               InvalidParameter);

  config_json = minimal_config;
  config_json["legs"] = "ten";
  EXPECT_THROW(static_cast<void>(RunConfig::FromJson(config_json)),
               InvalidParameter);

  config_json = minimal_config;
  config_json["fill_method"] = "nearest";
  EXPECT_THROW(static_cast<void>(RunConfig::FromJson(config_json)),
               InvalidParameter);
}

TEST_F(ConfigTest, RunConfigFromFileTest) {
  const string file_path = (temp_directory / "run_config.json").string();

  const ordered_json config_json = {
      {"input", "bars.parquet"}, {"output", "zigzag.json"}, {"legs", 3}};
  JsonToFile(config_json, file_path);

  const auto& run_config = RunConfig::FromFile(file_path);
  EXPECT_EQ(run_config.input_path, "bars.parquet");
  EXPECT_EQ(run_config.legs, optional<int>(3));

  EXPECT_THROW(static_cast<void>(RunConfig::FromFile(
                   (temp_directory / "missing.json").string())),
               FileError);
}

TEST_F(ConfigTest, LogDirectoryTest) {
  const path log_directory = temp_directory / "Logs";
  Config::SetConfig().SetLogDirectory(log_directory.string());
  EXPECT_EQ(Config::GetConfig().GetLogDirectory(), log_directory.string());

  // 로그 폴더가 생성되고 통합 로그 파일이 새 폴더에 열림
  Logger::GetLogger()->Log(INFO_L, "로그 폴더 테스트", __FILE__, __LINE__);
  EXPECT_TRUE(exists(log_directory / "zigzag.log"));

  Config::SetConfig().SetLogDirectory(".");
}

TEST_F(ConfigTest, ConcurrentAccessTest) {
  constexpr size_t thread_count = 8;

  vector<const Config*> instances(thread_count, nullptr);
  vector<string> names(thread_count);
  vector<thread> threads;

  // 여러 스레드가 동시에 지표를 생성해도 같은 설정 인스턴스를 공유함
  for (size_t i = 0; i < thread_count; i++) {
    threads.emplace_back([&instances, &names, i] {
      instances[i] = &Config::GetConfig();
      names[i] = ZigZag().GetName();
    });
  }

  for (auto& worker : threads) {
    worker.join();
  }

  for (size_t i = 0; i < thread_count; i++) {
    EXPECT_EQ(instances[i], &Config::GetConfig());
    EXPECT_EQ(names[i], "ZIGZAG_5.0%_10");
  }
}
