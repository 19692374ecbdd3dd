// 표준 라이브러리
#include <cmath>
#include <format>

// 파일 헤더
#include "Indicators/OutputDensifier.hpp"

// 내부 헤더
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"

// 네임 스페이스
namespace technical_analysis {
using namespace exception;
using namespace logger;
}  // namespace technical_analysis

namespace technical_analysis::indicator {

DenseSwings OutputDensifier::Densify(const vector<Swing>& swings,
                                     const size_t size) {
  DenseSwings dense{vector<double>(size, NAN), vector<double>(size, NAN),
                    vector<double>(size, NAN)};

  for (const auto& [position, direction, value, deviation] : swings) {
    if (position >= size) {
      Logger::LogAndThrow<IndexOutOfRange>(
          format("스윙 위치 [{}]는 시계열 길이 [{}]를 벗어났습니다.", position,
                 size),
          __FILE__, __LINE__);
    }

    dense.direction[position] =
        static_cast<double>(static_cast<int>(direction));
    dense.value[position] = value;
    dense.deviation[position] = deviation;
  }

  return dense;
}

}  // namespace technical_analysis::indicator
