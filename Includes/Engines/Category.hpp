#pragma once

// 표준 라이브러리
#include <optional>
#include <string>
#include <vector>

// 네임 스페이스
using namespace std;

/**
 * 지표 이름과 분류를 연결하는 읽기 전용 레지스트리.
 *
 * 테이블은 최초 조회 시 한 번만 생성되며 이후 변경되지 않음
 */
namespace technical_analysis::category {

/// 지표 이름에 해당하는 분류를 반환하는 함수. 등록되지 않았으면 nullopt
[[nodiscard]] optional<string> GetCategory(const string& indicator_name);

/// 분류에 속한 지표 이름 목록을 반환하는 함수. 없는 분류면 빈 목록
[[nodiscard]] vector<string> GetIndicators(const string& category);

/// 등록된 모든 분류 이름을 정렬된 순서로 반환하는 함수
[[nodiscard]] vector<string> GetCategories();

}  // namespace technical_analysis::category
