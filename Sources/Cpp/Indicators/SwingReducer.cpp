// 표준 라이브러리
#include <algorithm>
#include <cmath>
#include <format>

// 파일 헤더
#include "Indicators/SwingReducer.hpp"

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

namespace technical_analysis::indicator {

SwingReducer::SwingReducer(const double deviation)
    : deviation_(deviation), threshold_(deviation / 100), pending_() {
  if (!isfinite(deviation) || deviation <= 0) {
    Logger::LogAndThrow<InvalidParameter>(
        format("SwingReducer의 Deviation [{}]은(는) 0보다 커야 합니다.",
               deviation),
        __FILE__, __LINE__);
  }
}

double SwingReducer::GetDeviation() const { return deviation_; }

vector<Swing> SwingReducer::Reduce(const vector<Extremum>& extrema) {
  finalized_.clear();

  if (extrema.empty()) {
    return {};
  }

  // 확정 스윙의 개수는 후보 개수를 넘을 수 없음
  finalized_.reserve(extrema.size());

  // 가장 최근 후보가 첫 진행 중 스윙
  const Extremum& latest = extrema.back();
  pending_ = {latest.position, latest.direction, latest.value, 0};

  for (size_t i = extrema.size() - 1; i-- > 0;) {
    Process(extrema[i]);
  }

  // 더 이전의 스윙이 없으므로 변동률 0으로 확정
  finalized_.push_back(pending_);

  vector<Swing> swings(finalized_.rbegin(), finalized_.rend());
  finalized_.clear();

  return swings;
}

void SwingReducer::Process(const Extremum& candidate) {
  // 0 가격 기준으로는 변동률을 정의할 수 없음
  if (IsEqual(candidate.value, 0)) {
    return;
  }

  if (candidate.direction == pending_.direction) {
    // 같은 방향은 확정된 스윙이 둘 이상일 때만 수정
    if (IsMoreExtreme(candidate) && finalized_.size() > 1) {
      Amend(candidate);
    }

    return;
  }

  const double deviation_ratio = CalculateDeviation(
      pending_.direction, pending_.value, candidate.value);

  if (!IsGreater(deviation_ratio, threshold_)) {
    return;
  }

  // 고점이자 저점인 바에서 자기 자신으로 전환할 수 없음
  if (pending_.position == candidate.position) {
    return;
  }

  CommitAndStart(candidate, deviation_ratio);
}

void SwingReducer::Amend(const Extremum& candidate) {
  Swing& previous = finalized_.back();

  previous.deviation =
      100 * CalculateDeviation(previous.direction, previous.value,
                               candidate.value);

  pending_.position = candidate.position;
  pending_.value = candidate.value;
}

void SwingReducer::CommitAndStart(const Extremum& candidate,
                                  const double deviation_ratio) {
  pending_.deviation = 100 * deviation_ratio;
  finalized_.push_back(pending_);

  pending_ = {candidate.position, candidate.direction, candidate.value, 0};
}

bool SwingReducer::IsMoreExtreme(const Extremum& candidate) const {
  if (pending_.direction == SwingDirection::LOW) {
    return IsLess(candidate.value, pending_.value);
  }

  return IsGreater(candidate.value, pending_.value);
}

double SwingReducer::CalculateDeviation(const SwingDirection reference_direction,
                                        const double reference_value,
                                        const double candidate_value) {
  if (reference_direction == SwingDirection::LOW) {
    return (candidate_value - reference_value) / candidate_value;
  }

  return (reference_value - candidate_value) / candidate_value;
}

}  // namespace technical_analysis::indicator
