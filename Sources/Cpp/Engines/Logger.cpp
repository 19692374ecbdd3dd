// 표준 라이브러리
#include <filesystem>
#include <format>
#include <iostream>

// 파일 헤더
#include "Engines/Logger.hpp"

// 내부 헤더
#include "Engines/TimeUtils.hpp"

// 네임 스페이스
using namespace technical_analysis::time_utils;

namespace technical_analysis::logger {

// 정적 멤버 변수 정의
mutex Logger::instance_mutex_;
shared_ptr<Logger> Logger::instance_;
string Logger::log_directory_;

Logger::Logger(const string& debug_log_name, const string& info_log_name,
               const string& warn_log_name, const string& error_log_name,
               const string& combined_log_name)
    : debug_log_name_(debug_log_name),
      info_log_name_(info_log_name),
      warn_log_name_(warn_log_name),
      error_log_name_(error_log_name),
      combined_log_name_(combined_log_name) {
  OpenLogFiles();
}

Logger::~Logger() { CloseLogFiles(); }

void Logger::Deleter::operator()(const Logger* p) const { delete p; }

void Logger::SetLogDirectory(const string& log_directory) {
  try {
    if (!filesystem::exists(log_directory)) {
      filesystem::create_directories(log_directory);
    }
  } catch (const filesystem::filesystem_error& e) {
    LogAndThrow<exception::FileError>(
        format("[{}] 로그 폴더를 생성할 수 없습니다: {}", log_directory,
               e.what()),
        __FILE__, __LINE__);
  }

  lock_guard instance_lock(instance_mutex_);
  log_directory_ = log_directory;

  // 이전에 생성된 로거 인스턴스가 있으면 새 폴더에서 파일을 다시 엶
  if (instance_) {
    lock_guard write_lock(instance_->write_mutex_);
    instance_->CloseLogFiles();
    instance_->OpenLogFiles();
  }
}

shared_ptr<Logger>& Logger::GetLogger(const string& debug_log_name,
                                      const string& info_log_name,
                                      const string& warn_log_name,
                                      const string& error_log_name,
                                      const string& combined_log_name) {
  lock_guard lock(instance_mutex_);
  if (!instance_) {
    instance_ = shared_ptr<Logger>(
        new Logger(debug_log_name, info_log_name, warn_log_name,
                   error_log_name, combined_log_name),
        Deleter());
  }

  return instance_;
}

void Logger::OpenLogFiles() {
  const string& log_path =
      log_directory_.empty() ? "./" : log_directory_ + "/";

  debug_log_.open(log_path + debug_log_name_, ios::app);
  info_log_.open(log_path + info_log_name_, ios::app);
  warn_log_.open(log_path + warn_log_name_, ios::app);
  error_log_.open(log_path + error_log_name_, ios::app);

  // 통합 로그는 프로그램 실행마다 새로 시작
  combined_log_.open(log_path + combined_log_name_, ios::out | ios::trunc);
}

void Logger::CloseLogFiles() {
  for (ofstream* stream :
       {&debug_log_, &info_log_, &warn_log_, &error_log_, &combined_log_}) {
    if (stream->is_open()) {
      stream->flush();
      stream->close();
    }
  }
}

ofstream& Logger::GetLevelStream(const LogLevel level) {
  switch (level) {
    case DEBUG_L: {
      return debug_log_;
    }

    case WARN_L: {
      return warn_log_;
    }

    case ERROR_L: {
      return error_log_;
    }

    default: {
      return info_log_;
    }
  }
}

const char* Logger::GetLevelString(const LogLevel level) {
  switch (level) {
    case DEBUG_L: {
      return "DEBUG";
    }

    case INFO_L: {
      return "INFO";
    }

    case WARN_L: {
      return "WARN";
    }

    case ERROR_L: {
      return "ERROR";
    }

    default: {
      return "UNKNOWN";
    }
  }
}

// 마지막 경로 구분자 이후를 파일명으로 사용
const char* Logger::ExtractFilename(const char* filepath) {
  if (!filepath) return "";

  const char* filename = filepath;
  for (const char* p = filepath; *p; ++p) {
    if (*p == '/' || *p == '\\') {
      filename = p + 1;
    }
  }

  return filename;
}

string Logger::FormatMessage(const LogLevel level, const string& file,
                             const int line, const string& message) {
  return format("[{}] [{}] [{}:{}] | {}", GetCurrentLocalDatetime(),
                GetLevelString(level), ExtractFilename(file.c_str()), line,
                message);
}

void Logger::Log(const LogLevel& log_level, const string& message,
                 const string& file, const int line,
                 const bool log_to_console) {
  const string& formatted = FormatMessage(log_level, file, line, message);

  lock_guard lock(write_mutex_);

  if (log_to_console) {
    ConsoleLog(log_level, formatted);
  }

  if (ofstream& level_stream = GetLevelStream(log_level);
      level_stream.is_open()) {
    level_stream << formatted << '\n';

    // 오류는 비정상 종료 전에 남아 있어야 하므로 즉시 플러시
    if (log_level == ERROR_L) {
      level_stream.flush();
    }
  }

  if (combined_log_.is_open()) {
    combined_log_ << formatted << '\n';
  }
}

void Logger::ConsoleLog(const LogLevel level, const string& message) {
  switch (level) {
    case DEBUG_L: {
      cout << "\033[90m" << message << "\033[0m" << endl;  // Gray
      break;
    }

    case INFO_L: {
      cout << "\033[38;2;200;200;200m" << message << "\033[0m"
           << endl;  // White
      break;
    }

    case WARN_L: {
      cout << "\033[33m" << message << "\033[0m" << endl;  // Yellow
      break;
    }

    case ERROR_L: {
      cerr << "\033[31m" << message << "\033[0m" << endl;  // Red
      break;
    }
  }
}

}  // namespace technical_analysis::logger
