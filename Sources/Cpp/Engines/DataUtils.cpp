// 표준 라이브러리
#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <fstream>
#include <numeric>

// 외부 라이브러리
#include "arrow/io/file.h"
#include "arrow/memory_pool.h"
#include "arrow/table.h"
#include "nlohmann/json.hpp"
#include "parquet/arrow/reader.h"
#include "parquet/arrow/writer.h"
#include "parquet/exception.h"
#include "parquet/properties.h"

// 파일 헤더
#include "Engines/DataUtils.hpp"

// 내부 헤더
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"

// 네임 스페이스
namespace technical_analysis {
using namespace exception;
using namespace logger;
}  // namespace technical_analysis

namespace technical_analysis::utils {

shared_ptr<arrow::Table> ReadParquet(const string& file_path,
                                     const vector<int>& column_indices) {
  // 메모리 맵 파일 열기
  const auto& memory_mapped_result =
      arrow::io::MemoryMappedFile::Open(file_path, arrow::io::FileMode::READ);

  if (!memory_mapped_result.ok()) {
    Logger::LogAndThrow<FileError>(
        format("[{}] 경로의 Parquet 파일을 열 수 없습니다.", file_path),
        __FILE__, __LINE__);
  }

  const auto& random_access_file = memory_mapped_result.ValueOrDie();

  // Parquet Reader 속성
  parquet::ReaderProperties parquet_props =
      parquet::default_reader_properties();
  parquet_props.enable_buffered_stream();

  // Arrow Reader 속성
  parquet::ArrowReaderProperties arrow_props;
  arrow_props.set_pre_buffer(true);
  arrow_props.set_use_threads(true);

  shared_ptr<arrow::Table> table;

  try {
    auto parquet_reader =
        parquet::ParquetFileReader::Open(random_access_file, parquet_props);

    unique_ptr<parquet::arrow::FileReader> arrow_reader;
    PARQUET_THROW_NOT_OK(parquet::arrow::FileReader::Make(
        arrow::default_memory_pool(), move(parquet_reader), arrow_props,
        &arrow_reader));

    // Row Group 단위로 읽기
    vector<int> row_group_indices(arrow_reader->num_row_groups());
    iota(row_group_indices.begin(), row_group_indices.end(), 0);

    if (column_indices.empty()) {
      PARQUET_THROW_NOT_OK(
          arrow_reader->ReadRowGroups(row_group_indices, &table));
    } else {
      PARQUET_THROW_NOT_OK(arrow_reader->ReadRowGroups(
          row_group_indices, column_indices, &table));
    }

    // 여러 Row Group에 걸친 청크를 하나로 합쳐 인덱스 접근을 단순화
    PARQUET_ASSIGN_OR_THROW(table,
                            table->CombineChunks(arrow::default_memory_pool()));
  } catch (const parquet::ParquetException& e) {
    Logger::LogAndThrow<FileError>(
        format("[{}] 경로의 Parquet 파일을 읽는 중 오류가 발생했습니다: {}",
               file_path, e.what()),
        __FILE__, __LINE__);
  }

  return table;
}

void TableToParquet(const shared_ptr<arrow::Table>& table,
                    const string& file_path) {
  try {
    shared_ptr<arrow::io::FileOutputStream> out_file;
    PARQUET_ASSIGN_OR_THROW(out_file,
                            arrow::io::FileOutputStream::Open(file_path));

    PARQUET_THROW_NOT_OK(parquet::arrow::WriteTable(
        *table, arrow::default_memory_pool(), out_file,
        max<int64_t>(table->num_rows(), 1)));

    PARQUET_THROW_NOT_OK(out_file->Close());
  } catch (const parquet::ParquetException& e) {
    Logger::LogAndThrow<FileError>(
        format("[{}] 경로에 Parquet 파일을 저장할 수 없습니다: {}", file_path,
               e.what()),
        __FILE__, __LINE__);
  }
}

void JsonToFile(const ordered_json& data, const string& file_path) {
  ofstream file(file_path);

  if (!file.is_open()) {
    Logger::LogAndThrow<FileError>(
        format("[{}] 경로에 Json 파일을 저장할 수 없습니다.", file_path),
        __FILE__, __LINE__);
  }

  file << data.dump(2);
  file.close();
}

json JsonFromFile(const string& file_path) {
  ifstream file(file_path);

  if (!file.is_open()) {
    Logger::LogAndThrow<FileError>(
        format("[{}] 경로의 Json 파일을 열 수 없습니다.", file_path),
        __FILE__, __LINE__);
  }

  try {
    return json::parse(file);
  } catch (const json::parse_error& e) {
    Logger::LogAndThrow<FileError>(
        format("[{}] 경로의 Json 파일을 파싱할 수 없습니다: {}", file_path,
               e.what()),
        __FILE__, __LINE__);
  }
}

string FormatParameter(const double value) {
  if (!isfinite(value)) {
    return format("{}", value);
  }

  // 가장 짧게 왕복 가능한 유효 숫자와 지수를 구함 (예: "1.25e+05")
  char buffer[64];
  const auto [last, error] = to_chars(buffer, buffer + sizeof(buffer), value,
                                      chars_format::scientific);
  if (error != errc()) {
    return format("{}", value);
  }

  const string scientific(buffer, last);
  const size_t exponent_pos = scientific.find('e');
  const int exponent = stoi(scientific.substr(exponent_pos + 1));

  string digits;
  for (const char c : scientific.substr(0, exponent_pos)) {
    if (isdigit(static_cast<unsigned char>(c))) {
      digits += c;
    }
  }

  const string sign = signbit(value) ? "-" : "";

  // 1e-4 이상 1e16 미만은 고정 소수점, 그 외는 두 자리 이상의 지수 표기
  if (exponent < -4 || exponent >= 16) {
    string mantissa = digits.substr(0, 1);
    if (digits.size() > 1) {
      mantissa += "." + digits.substr(1);
    }

    return format("{}{}e{}{:02}", sign, mantissa, exponent < 0 ? '-' : '+',
                  abs(exponent));
  }

  if (exponent < 0) {
    return sign + "0." + string(-exponent - 1, '0') + digits;
  }

  const auto integer_length = static_cast<size_t>(exponent) + 1;
  if (digits.size() <= integer_length) {
    // 정수 값이어도 소수점을 유지함
    return sign + digits + string(integer_length - digits.size(), '0') + ".0";
  }

  return sign + digits.substr(0, integer_length) + "." +
         digits.substr(integer_length);
}

}  // namespace technical_analysis::utils
