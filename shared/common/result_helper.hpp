// ============================================================================
// File: shared/common/result_helper.hpp
// Description: Result<T> helper macros
// Depends on: shared/common/result.h
// ============================================================================

#pragma once
#include "result.h"

#include <fmt/format.h>

// ----------------------------------------------------------------------------
// 1. RETURN_IF_ERR 매크로
// ----------------------------------------------------------------------------
// 사용 예시:
//   auto r = aliases.registerAlias("dataSource", "ds");
//   RETURN_IF_ERR(r);
// ----------------------------------------------------------------------------
#define RETURN_IF_ERR(res)                                     \
    do {                                                       \
        if (!(res)) {                                          \
            return Result<void>::Error((res).code(), (res).error()); \
        }                                                      \
    } while (0)

#define RETURN_IF_ERR_MSG(res, msg)                            \
    do {                                                       \
        if (!(res)) {                                          \
            auto err_str = (res).error().has_value()           \
                ? fmt::format("{}: {}", msg, *(res).error())   \
                : std::string(msg);                            \
            return Result<void>::Error((res).code(), err_str); \
        }                                                      \
    } while (0)

// ----------------------------------------------------------------------------
// 2. LOG_IF_ERR_TAG 매크로 (전역 함수용: tag 지정)
// ----------------------------------------------------------------------------
#define LOG_IF_ERR_TAG(tag, res)                               \
    do {                                                       \
        if (!(res)) {                                          \
            LOG_ERROR(tag, "{}", to_string(res));              \
        }                                                      \
    } while (0)
