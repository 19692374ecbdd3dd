#pragma once

// 표준 라이브러리
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// 네임 스페이스
using namespace std;

namespace technical_analysis::series {

/// 시계열 인덱스. 정수 위치 또는 밀리초 단위 타임스탬프의 정렬된 목록
using Index = vector<int64_t>;

/// 0부터 size - 1까지의 정수 위치 인덱스를 생성하는 함수
[[nodiscard]] shared_ptr<const Index> MakeRangeIndex(size_t size);

/**
 * 하나의 인덱스에 정렬된 실수 값의 시계열
 *
 * 결측값은 NaN으로 표시하며, 인덱스는 같은 시간축에 정렬된 여러 시계열이
 * 복사 없이 공유함
 */
class Series final {
 public:
  Series();

  /// 정수 위치 인덱스를 가지는 시계열을 생성하는 생성자
  explicit Series(vector<double> values, string name = "");

  /// 주어진 인덱스를 공유하는 시계열을 생성하는 생성자.
  /// 인덱스와 값의 길이가 다르면 InvalidValue를 던짐
  Series(shared_ptr<const Index> index, vector<double> values,
         string name = "");

  [[nodiscard]] size_t Size() const;
  [[nodiscard]] bool Empty() const;

  /// 범위 검사 후 위치에 해당되는 값을 반환하는 함수
  [[nodiscard]] double At(size_t position) const;

  /// 범위 검사 없이 위치에 해당되는 값을 반환하는 연산자
  [[nodiscard]] double operator[](size_t position) const;

  [[nodiscard]] const vector<double>& GetValues() const;
  [[nodiscard]] vector<double>& GetValues();
  [[nodiscard]] const shared_ptr<const Index>& GetIndex() const;
  [[nodiscard]] const string& GetName() const;
  void SetName(const string& name);

  /// 결측이 아닌 값의 개수를 반환하는 함수
  [[nodiscard]] size_t CountValid() const;

  /**
   * 값을 미래 방향으로 periods 바만큼 이동한 시계열을 반환하는 함수.
   * 앞쪽 periods 개의 값은 NaN이 되고 마지막 periods 개의 값은 버려짐.
   *
   * 음수 이동은 미래 정보를 과거로 가져오므로 허용하지 않음
   */
  [[nodiscard]] Series Shift(int64_t periods) const;

  /// 결측값을 주어진 값으로 채우는 함수
  Series& FillNa(double value);

  /// 결측값을 직전의 유효한 값으로 채우는 함수 (ffill)
  Series& FillForward();

  /// 결측값을 직후의 유효한 값으로 채우는 함수 (bfill)
  Series& FillBackward();

 private:
  shared_ptr<const Index> index_;
  vector<double> values_;
  string name_;
};

/**
 * 같은 인덱스를 공유하는 이름 있는 시계열들의 묶음.
 * 지표의 결과를 반환할 때 사용
 */
class Frame final {
 public:
  Frame(string name, string category, shared_ptr<const Index> index);

  /// 열을 추가하는 함수. 인덱스 길이가 다르면 InvalidValue를 던짐
  void AddColumn(Series column);

  /// 이름에 해당하는 열을 반환하는 함수. 없으면 InvalidValue를 던짐
  [[nodiscard]] const Series& GetColumn(const string& name) const;
  [[nodiscard]] Series& GetColumn(const string& name);

  [[nodiscard]] const vector<Series>& GetColumns() const;
  [[nodiscard]] vector<Series>& GetColumns();
  [[nodiscard]] vector<string> GetColumnNames() const;
  [[nodiscard]] const shared_ptr<const Index>& GetIndex() const;
  [[nodiscard]] size_t NumRows() const;
  [[nodiscard]] const string& GetName() const;
  [[nodiscard]] const string& GetCategory() const;

 private:
  string name_;
  string category_;
  shared_ptr<const Index> index_;
  vector<Series> columns_;
};

}  // namespace technical_analysis::series
