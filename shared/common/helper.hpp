#pragma once
#include <cxxabi.h>
#include <cstdlib>
#include <string>

// typeid(T).name() 을 사람이 읽을 수 있는 이름으로 변환한다.
inline std::string demangle(const char* name) {
    int status = 0;
    char* demangled = abi::__cxa_demangle(name, nullptr, nullptr, &status);
    std::string result = (status == 0 && demangled) ? demangled : name;
    std::free(demangled);
    return result;
}
