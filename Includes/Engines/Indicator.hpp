#pragma once

// 표준 라이브러리
#include <cstdint>
#include <optional>
#include <string>

// 내부 헤더
#include "Engines/Series.hpp"
#include "Engines/SeriesUtils.hpp"

// 네임 스페이스
using namespace std;

namespace technical_analysis::indicator {

using series::Frame;
using series::Series;
using utils::FillOptions;

/**
 * 시계열 지표를 구현하기 위한 추상 클래스
 *
 * ※ 지표 구현 시 유의 사항 ※\n
 * 1. Indicator 클래스를 Public 상속 후 생성자에서 파라미터를 검증하고,
 *    계산 함수에서 결과 Frame을 만든 뒤 Finalize를 호출해야 함\n
 *
 * 2. 지표의 클래스 이름은 분류 레지스트리에 등록된 이름이어야 함\n
 *
 * 3. 계산 함수는 입력 시계열의 복사본만 사용하며 호출 간에 상태를 남기지
 *    않아야 함. 서로 다른 심볼의 시계열은 독립적인 호출로 병렬 계산 가능
 */
class Indicator {
 public:
  // 지표 객체는 파라미터 묶음이므로 복사 대신 새로 생성해야 함
  Indicator(const Indicator&) = delete;
  Indicator& operator=(const Indicator&) = delete;

  virtual ~Indicator();

  /// 파라미터가 포함된 지표의 이름을 반환하는 함수
  [[nodiscard]] const string& GetName() const;

  /// 분류 레지스트리에 등록된 지표의 클래스 이름을 반환하는 함수
  [[nodiscard]] const string& GetClassName() const;

  /// 지표가 속한 분류를 반환하는 함수
  [[nodiscard]] const string& GetCategory() const;

  [[nodiscard]] int64_t GetOffset() const;
  [[nodiscard]] const FillOptions& GetFillOptions() const;

 protected:
  /**
   * @param class_name 분류 레지스트리에 등록된 클래스 이름
   * @param offset 결과를 미래 방향으로 이동할 바 개수.
   *               없으면 Config의 기본값, 음수면 InvalidParameter
   * @param fill_options 결과의 결측값 채우기 방법
   */
  Indicator(const string& class_name, const optional<int64_t>& offset,
            FillOptions fill_options);

  void SetName(const string& name);

  /// 계산된 결과 Frame에 offset 이동 후 결측값 채우기를 적용하는 함수
  void Finalize(Frame& frame) const;

 private:
  string name_;        // 파라미터가 포함된 지표의 이름
  string class_name_;  // 지표의 클래스 이름
  string category_;    // 지표의 분류

  int64_t offset_;
  FillOptions fill_options_;
};

}  // namespace technical_analysis::indicator
