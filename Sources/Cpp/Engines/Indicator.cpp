// 표준 라이브러리
#include <format>

// 파일 헤더
#include "Engines/Indicator.hpp"

// 내부 헤더
#include "Engines/Category.hpp"
#include "Engines/Config.hpp"
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"

// 네임 스페이스
namespace technical_analysis {
using namespace engine;
using namespace exception;
using namespace logger;
using namespace utils;
}  // namespace technical_analysis

namespace technical_analysis::indicator {

Indicator::Indicator(const string& class_name,
                     const optional<int64_t>& offset,
                     FillOptions fill_options)
    : name_(class_name),
      class_name_(class_name),
      offset_(ValidateOffset(offset, Config::GetConfig().GetDefaultOffset())),
      fill_options_(move(fill_options)) {
  const auto& registered_category = category::GetCategory(class_name);

  if (!registered_category) {
    Logger::LogAndThrow<InvalidValue>(
        format("[{}] 지표는 분류 레지스트리에 등록되지 않았습니다.",
               class_name),
        __FILE__, __LINE__);
  }

  category_ = *registered_category;
}
Indicator::~Indicator() = default;

const string& Indicator::GetName() const { return name_; }
const string& Indicator::GetClassName() const { return class_name_; }
const string& Indicator::GetCategory() const { return category_; }
int64_t Indicator::GetOffset() const { return offset_; }
const FillOptions& Indicator::GetFillOptions() const { return fill_options_; }

void Indicator::SetName(const string& name) { name_ = name; }

void Indicator::Finalize(Frame& frame) const {
  ApplyOffsetAndFill(frame, offset_, fill_options_);
}

}  // namespace technical_analysis::indicator
