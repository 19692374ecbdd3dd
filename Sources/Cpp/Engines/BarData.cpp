// 표준 라이브러리
#include <cmath>
#include <format>

// 외부 라이브러리
#include "arrow/api.h"
#include "nlohmann/json.hpp"
#include "parquet/exception.h"

// 파일 헤더
#include "Engines/BarData.hpp"

// 내부 헤더
#include "Engines/DataUtils.hpp"
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"
#include "Engines/TimeUtils.hpp"

// 네임 스페이스
namespace technical_analysis {
using namespace exception;
using namespace logger;
using namespace time_utils;
using namespace utils;
}  // namespace technical_analysis

namespace technical_analysis::bar {

namespace {

/// 이름에 해당하는 열을 찾고 타입을 검사하는 함수
shared_ptr<arrow::ChunkedArray> GetTypedColumn(
    const shared_ptr<arrow::Table>& table, const string& column_name,
    const arrow::Type::type expected_type, const string& expected_type_name) {
  const auto& column = table->GetColumnByName(column_name);

  if (column == nullptr) {
    Logger::LogAndThrow<InvalidValue>(
        format("바 데이터에 [{}] 열이 존재하지 않습니다.", column_name),
        __FILE__, __LINE__);
  }

  if (column->type()->id() != expected_type) {
    Logger::LogAndThrow<InvalidValue>(
        format("바 데이터의 [{}] 열은 {} 타입이어야 하지만 [{}] 타입입니다.",
               column_name, expected_type_name, column->type()->ToString()),
        __FILE__, __LINE__);
  }

  return column;
}

/// Double 열의 값을 벡터로 복사하는 함수. Null은 NaN으로 변환됨
vector<double> ReadDoubleColumn(const shared_ptr<arrow::Table>& table,
                                const string& column_name) {
  const auto& column =
      GetTypedColumn(table, column_name, arrow::Type::DOUBLE, "Double");

  vector<double> values;
  values.reserve(column->length());

  for (const auto& chunk : column->chunks()) {
    const auto& array = static_pointer_cast<arrow::DoubleArray>(chunk);

    for (int64_t i = 0; i < array->length(); i++) {
      values.push_back(array->IsNull(i) ? NAN : array->Value(i));
    }
  }

  return values;
}

}  // namespace

BarSeries BarData::FromParquet(const string& file_path,
                               const ColumnNames& columns) {
  auto bar_series = FromTable(ReadParquet(file_path), columns);

  const auto& index = bar_series.high.GetIndex();
  if (index->empty()) {
    Logger::GetLogger()->Log(
        INFO_L, format("[{}] 경로의 바 데이터가 비어있습니다.", file_path),
        __FILE__, __LINE__);
  } else {
    Logger::GetLogger()->Log(
        INFO_L,
        format("[{}] 경로에서 [{}]개의 바를 읽었습니다. ({} ~ {})", file_path,
               index->size(), UtcTimestampToUtcDatetime(index->front()),
               UtcTimestampToUtcDatetime(index->back())),
        __FILE__, __LINE__);
  }

  return bar_series;
}

BarSeries BarData::FromTable(const shared_ptr<arrow::Table>& table,
                             const ColumnNames& columns) {
  if (table == nullptr) {
    Logger::LogAndThrow<InvalidValue>("바 데이터 테이블이 비어있습니다.",
                                      __FILE__, __LINE__);
  }

  // 시간 열을 공유 인덱스로 변환
  const auto& time_column =
      GetTypedColumn(table, columns.time, arrow::Type::INT64, "Int64");

  auto index = make_shared<series::Index>();
  index->reserve(time_column->length());

  for (const auto& chunk : time_column->chunks()) {
    const auto& array = static_pointer_cast<arrow::Int64Array>(chunk);

    for (int64_t i = 0; i < array->length(); i++) {
      if (array->IsNull(i)) {
        Logger::LogAndThrow<InvalidValue>(
            format("바 데이터의 [{}] 열 [{}]번째 값이 Null입니다.",
                   columns.time, index->size()),
            __FILE__, __LINE__);
      }

      index->push_back(array->Value(i));
    }
  }

  shared_ptr<const series::Index> shared_index = move(index);

  BarSeries bar_series{
      .high = Series(shared_index, ReadDoubleColumn(table, columns.high),
                     columns.high),
      .low = Series(shared_index, ReadDoubleColumn(table, columns.low),
                    columns.low),
      .close = nullopt};

  if (columns.close) {
    bar_series.close = Series(
        shared_index, ReadDoubleColumn(table, *columns.close), *columns.close);
  }

  return bar_series;
}

ordered_json BarData::FrameToJson(const Frame& frame) {
  ordered_json frame_json;
  frame_json["name"] = frame.GetName();
  frame_json["category"] = frame.GetCategory();
  frame_json["index"] = *frame.GetIndex();

  ordered_json columns_json = ordered_json::object();
  for (const auto& column : frame.GetColumns()) {
    ordered_json values = ordered_json::array();

    for (const double value : column.GetValues()) {
      if (isnan(value)) {
        values.push_back(nullptr);
      } else {
        values.push_back(value);
      }
    }

    columns_json[column.GetName()] = move(values);
  }

  frame_json["columns"] = move(columns_json);

  return frame_json;
}

shared_ptr<arrow::Table> BarData::FrameToTable(const Frame& frame) {
  arrow::FieldVector fields;
  arrow::ArrayVector arrays;

  try {
    // 인덱스 열
    arrow::Int64Builder index_builder;
    PARQUET_THROW_NOT_OK(index_builder.AppendValues(*frame.GetIndex()));

    shared_ptr<arrow::Array> index_array;
    PARQUET_THROW_NOT_OK(index_builder.Finish(&index_array));

    fields.push_back(arrow::field("index", arrow::int64()));
    arrays.push_back(move(index_array));

    // 결과 열
    for (const auto& column : frame.GetColumns()) {
      arrow::DoubleBuilder builder;
      PARQUET_THROW_NOT_OK(builder.Reserve(column.Size()));

      for (const double value : column.GetValues()) {
        if (isnan(value)) {
          PARQUET_THROW_NOT_OK(builder.AppendNull());
        } else {
          PARQUET_THROW_NOT_OK(builder.Append(value));
        }
      }

      shared_ptr<arrow::Array> array;
      PARQUET_THROW_NOT_OK(builder.Finish(&array));

      fields.push_back(arrow::field(column.GetName(), arrow::float64()));
      arrays.push_back(move(array));
    }
  } catch (const parquet::ParquetException& e) {
    Logger::LogAndThrow<InvalidValue>(
        format("[{}] 결과를 Arrow 테이블로 변환할 수 없습니다: {}",
               frame.GetName(), e.what()),
        __FILE__, __LINE__);
  }

  return arrow::Table::Make(arrow::schema(fields), arrays);
}

void BarData::FrameToJsonFile(const Frame& frame, const string& file_path) {
  JsonToFile(FrameToJson(frame), file_path);

  Logger::GetLogger()->Log(
      INFO_L,
      format("[{}] 결과를 [{}] 경로에 Json으로 저장했습니다.", frame.GetName(),
             file_path),
      __FILE__, __LINE__);
}

void BarData::FrameToParquet(const Frame& frame, const string& file_path) {
  TableToParquet(FrameToTable(frame), file_path);

  Logger::GetLogger()->Log(
      INFO_L,
      format("[{}] 결과를 [{}] 경로에 Parquet으로 저장했습니다.",
             frame.GetName(), file_path),
      __FILE__, __LINE__);
}

}  // namespace technical_analysis::bar
