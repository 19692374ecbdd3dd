#pragma once

// 표준 라이브러리
#include <stdexcept>
#include <string>

// 네임 스페이스
using namespace std;

namespace technical_analysis::exception {

/// 유효하지 않은 입력 데이터일 때 발생하는 에러
class InvalidValue final : public runtime_error {
 public:
  explicit InvalidValue(const string& message) : runtime_error(message) {}
};

/// 지표 파라미터가 허용 범위를 벗어났을 때 발생하는 에러
class InvalidParameter final : public runtime_error {
 public:
  explicit InvalidParameter(const string& message) : runtime_error(message) {}
};

/// 인덱스가 범위를 벗어났을 때 발생하는 에러
class IndexOutOfRange final : public runtime_error {
 public:
  explicit IndexOutOfRange(const string& message) : runtime_error(message) {}
};

/// 파일을 읽거나 쓸 수 없을 때 발생하는 에러
class FileError final : public runtime_error {
 public:
  explicit FileError(const string& message) : runtime_error(message) {}
};

}  // namespace technical_analysis::exception
