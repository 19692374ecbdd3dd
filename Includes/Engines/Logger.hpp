#pragma once

// 표준 라이브러리
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

// 내부 헤더
#include "Engines/Exception.hpp"

// 네임 스페이스
using namespace std;

namespace technical_analysis::logger {

/// 로그 레벨을 지정하는 열거형 클래스
enum class LogLevel { DEBUG_L, INFO_L, WARN_L, ERROR_L };
using enum LogLevel;

/**
 * 라이브러리 로깅을 담당하는 클래스
 *
 * 싱글톤 패턴을 사용하여 전역 로깅을 관리하며, 로그 레벨별 파일과
 * 모든 레벨이 기록되는 통합 로그 파일을 함께 관리함.\n
 * 서로 다른 시계열을 병렬로 계산할 수 있도록 모든 쓰기는 뮤텍스로 직렬화됨.
 */
class Logger final {
 public:
  // 싱글톤 특성 유지
  Logger(const Logger&) = delete;             // 복사 생성자 삭제
  Logger& operator=(const Logger&) = delete;  // 대입 연산자 삭제

  /**
   * 로그 파일이 저장될 폴더를 설정하는 함수
   *
   * 이미 열린 로그 파일이 있다면 닫고 새 폴더에서 다시 엶
   * @param log_directory 로그 파일들이 저장될 디렉터리 경로
   */
  static void SetLogDirectory(const string& log_directory);

  /**
   * Logger의 싱글톤 인스턴스를 반환하는 함수
   * @param debug_log_name 디버그 수준 로그를 저장할 파일 이름
   * @param info_log_name 정보 수준 로그를 저장할 파일 이름
   * @param warn_log_name 경고 수준 로그를 저장할 파일 이름
   * @param error_log_name 오류 수준 로그를 저장할 파일 이름
   * @param combined_log_name 모든 레벨의 로그를 저장할 파일 이름
   * @return 싱글톤 Logger 인스턴스에 대한 참조
   */
  static shared_ptr<Logger>& GetLogger(
      const string& debug_log_name = "debug.log",
      const string& info_log_name = "info.log",
      const string& warn_log_name = "warn.log",
      const string& error_log_name = "error.log",
      const string& combined_log_name = "zigzag.log");

  /**
   * 지정된 로그 레벨과 파일 및 라인 정보를 사용하여 메시지를 기록하는 함수
   * @param log_level 로그 메시지의 레벨
   * @param message 기록할 로그 메시지
   * @param file 로그가 생성된 파일의 이름. __FILE__로 지정
   * @param line 로그 명령문이 발생한 파일의 라인 번호. __LINE__으로 지정
   * @param log_to_console 콘솔에 로그를 출력할지 결정하는 플래그
   */
  void Log(const LogLevel& log_level, const string& message, const string& file,
           int line, bool log_to_console = false);

  /// 에러를 로깅하고 지정된 타입의 예외를 Throw하는 함수
  template <typename Error>
  [[noreturn]] static void LogAndThrow(const string& message,
                                       const string& file, const int line) {
    GetLogger()->Log(ERROR_L, message, file, line, true);
    throw Error(message);
  }

  ~Logger();

 private:
  Logger(const string& debug_log_name, const string& info_log_name,
         const string& warn_log_name, const string& error_log_name,
         const string& combined_log_name);

  /// 싱글톤 인스턴스 안전한 삭제를 위한 Deleter 클래스
  class Deleter {
   public:
    void operator()(const Logger* p) const;
  };

  // 싱글톤 관리 멤버
  static mutex instance_mutex_;
  static shared_ptr<Logger> instance_;
  static string log_directory_;  // 로그 파일이 저장되는 경로

  // 파일 이름
  string debug_log_name_;
  string info_log_name_;
  string warn_log_name_;
  string error_log_name_;
  string combined_log_name_;

  // 로그 파일 스트림
  mutex write_mutex_;
  ofstream debug_log_;
  ofstream info_log_;
  ofstream warn_log_;
  ofstream error_log_;
  ofstream combined_log_;

  /// 현재 로그 디렉토리에 로그 파일들을 여는 함수
  void OpenLogFiles();

  /// 열린 로그 파일들을 모두 닫는 함수
  void CloseLogFiles();

  /// 레벨에 해당하는 로그 파일 스트림을 반환하는 함수
  ofstream& GetLevelStream(LogLevel level);

  /**
   * 로그 메시지를 "[TIME] [LEVEL] [filename:line] | message" 형식으로
   * 포맷하는 함수
   */
  static string FormatMessage(LogLevel level, const string& file, int line,
                              const string& message);

  /// 로그 레벨을 문자열로 변환하는 함수
  static const char* GetLevelString(LogLevel level);

  /// 파일 경로에서 파일명만 추출하는 함수
  static const char* ExtractFilename(const char* filepath);

  /// 콘솔에 레벨별 색상으로 로그 메시지를 출력하는 함수
  static void ConsoleLog(LogLevel level, const string& message);
};

}  // namespace technical_analysis::logger
