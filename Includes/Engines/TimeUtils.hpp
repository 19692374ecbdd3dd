#pragma once

// 표준 라이브러리
#include <cstdint>
#include <string>

// 네임 스페이스
using namespace std;

/**
 * 시간 핸들링을 위한 유틸리티 네임스페이스
 */
namespace technical_analysis::time_utils {

constexpr int64_t kSecond = 1000;  // 밀리초 단위 1초

/**
 * 현재 시스템의 로컬 시간대를 기준으로 현재 날짜와 시간을 반환하는 함수
 *
 * @return "YYYY-MM-DD HH:MM:SS" 형식의 현재 로컬 날짜와 시간
 */
[[nodiscard]] string GetCurrentLocalDatetime();

/**
 * 주어진 타임스탬프(밀리초 기준)를 UTC 날짜-시간 문자열로 변환하여
 * 반환하는 함수
 *
 * @param timestamp_ms 변환할 밀리초 단위의 타임스탬프
 * @return UTC 날짜와 시간의 문자열 표현. 음수 타임스탬프는 빈 문자열
 */
[[nodiscard]] string UtcTimestampToUtcDatetime(int64_t timestamp_ms);

}  // namespace technical_analysis::time_utils
