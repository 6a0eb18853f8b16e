#pragma once
#include <string>
#include <string_view>

namespace logging {

enum class Type { SpdLog };
enum class Level { Trace, Debug, Info, Warn, Error, Fatal, Off };

// 모든 tag에 적용되는 설정 키 (log: "*": ...)
inline constexpr std::string_view GLOBAL_TAG = "*";

// 클래스 밖에서 tag 없이 로그를 남길 때 사용
inline constexpr const char* DEFAULT_TAG = "Default";

// 설정 파일의 level 문자열 -> Level. 알 수 없는 값은 Off
inline Level toLevel(std::string_view s) {
    if (s == "trace") return Level::Trace;
    if (s == "debug") return Level::Debug;
    if (s == "info")  return Level::Info;
    if (s == "warn")  return Level::Warn;
    if (s == "error") return Level::Error;
    if (s == "fatal") return Level::Fatal;
    return Level::Off;
}

} // namespace logging
