// 표준 라이브러리
#include <algorithm>
#include <cmath>
#include <format>
#include <numeric>

// 파일 헤더
#include "Engines/Series.hpp"

// 내부 헤더
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"

// 네임 스페이스
namespace technical_analysis {
using namespace exception;
using namespace logger;
}  // namespace technical_analysis

namespace technical_analysis::series {

shared_ptr<const Index> MakeRangeIndex(const size_t size) {
  auto index = make_shared<Index>(size);
  iota(index->begin(), index->end(), 0);
  return index;
}

Series::Series() : index_(make_shared<const Index>()) {}

Series::Series(vector<double> values, string name)
    : index_(MakeRangeIndex(values.size())),
      values_(move(values)),
      name_(move(name)) {}

Series::Series(shared_ptr<const Index> index, vector<double> values,
               string name)
    : index_(move(index)), values_(move(values)), name_(move(name)) {
  if (!index_) {
    Logger::LogAndThrow<InvalidValue>(
        format("[{}] 시계열의 인덱스가 비어있습니다.", name_), __FILE__,
        __LINE__);
  }

  if (index_->size() != values_.size()) {
    Logger::LogAndThrow<InvalidValue>(
        format("[{}] 시계열의 인덱스 길이 [{}]와 값의 길이 [{}]가 다릅니다.",
               name_, index_->size(), values_.size()),
        __FILE__, __LINE__);
  }
}

size_t Series::Size() const { return values_.size(); }
bool Series::Empty() const { return values_.empty(); }

double Series::At(const size_t position) const {
  if (position >= values_.size()) {
    Logger::LogAndThrow<IndexOutOfRange>(
        format("[{}] 시계열의 위치 [{}]는 길이 [{}]를 벗어났습니다.", name_,
               position, values_.size()),
        __FILE__, __LINE__);
  }

  return values_[position];
}

double Series::operator[](const size_t position) const {
  return values_[position];
}

const vector<double>& Series::GetValues() const { return values_; }
vector<double>& Series::GetValues() { return values_; }
const shared_ptr<const Index>& Series::GetIndex() const { return index_; }
const string& Series::GetName() const { return name_; }
void Series::SetName(const string& name) { name_ = name; }

size_t Series::CountValid() const {
  return static_cast<size_t>(ranges::count_if(
      values_, [](const double value) { return !isnan(value); }));
}

Series Series::Shift(const int64_t periods) const {
  if (periods < 0) {
    Logger::LogAndThrow<InvalidParameter>(
        format("[{}] 시계열의 이동 값 [{}]은(는) 0 이상이어야 합니다.", name_,
               periods),
        __FILE__, __LINE__);
  }

  const size_t size = values_.size();
  const size_t shift = min(static_cast<size_t>(periods), size);

  vector<double> shifted(size, NAN);
  copy(values_.begin(), values_.end() - static_cast<ptrdiff_t>(shift),
       shifted.begin() + static_cast<ptrdiff_t>(shift));

  return Series(index_, move(shifted), name_);
}

Series& Series::FillNa(const double value) {
  ranges::replace_if(
      values_, [](const double v) { return isnan(v); }, value);
  return *this;
}

Series& Series::FillForward() {
  double last_valid = NAN;
  for (double& value : values_) {
    if (isnan(value)) {
      value = last_valid;
    } else {
      last_valid = value;
    }
  }

  return *this;
}

Series& Series::FillBackward() {
  double next_valid = NAN;
  for (auto it = values_.rbegin(); it != values_.rend(); ++it) {
    if (isnan(*it)) {
      *it = next_valid;
    } else {
      next_valid = *it;
    }
  }

  return *this;
}

Frame::Frame(string name, string category, shared_ptr<const Index> index)
    : name_(move(name)), category_(move(category)), index_(move(index)) {}

void Frame::AddColumn(Series column) {
  if (column.Size() != index_->size()) {
    Logger::LogAndThrow<InvalidValue>(
        format("[{}] 열의 길이 [{}]가 [{}] 프레임의 길이 [{}]와 다릅니다.",
               column.GetName(), column.Size(), name_, index_->size()),
        __FILE__, __LINE__);
  }

  columns_.push_back(move(column));
}

const Series& Frame::GetColumn(const string& name) const {
  const auto it = ranges::find_if(columns_, [&name](const Series& column) {
    return column.GetName() == name;
  });

  if (it == columns_.end()) {
    Logger::LogAndThrow<InvalidValue>(
        format("[{}] 프레임에 [{}] 열이 없습니다.", name_, name), __FILE__,
        __LINE__);
  }

  return *it;
}

Series& Frame::GetColumn(const string& name) {
  return const_cast<Series&>(as_const(*this).GetColumn(name));
}

const vector<Series>& Frame::GetColumns() const { return columns_; }
vector<Series>& Frame::GetColumns() { return columns_; }

vector<string> Frame::GetColumnNames() const {
  vector<string> names;
  names.reserve(columns_.size());

  for (const auto& column : columns_) {
    names.push_back(column.GetName());
  }

  return names;
}

const shared_ptr<const Index>& Frame::GetIndex() const { return index_; }
size_t Frame::NumRows() const { return index_->size(); }
const string& Frame::GetName() const { return name_; }
const string& Frame::GetCategory() const { return category_; }

}  // namespace technical_analysis::series
