// ============================================================================
// File: shared/common/result_helper.hpp
// Description: Result<T> helper macros
// Depends on: shared/common/result.h
// ============================================================================

#pragma once
#include "result.h"

// ----------------------------------------------------------------------------
// 1. RETURN_IF_ERR
// ----------------------------------------------------------------------------
// usage:
//   auto r = registry.add(type, name, cell);
//   RETURN_IF_ERR(r);
// ----------------------------------------------------------------------------
#define RETURN_IF_ERR(res)                                     \
    do {                                                       \
        if (!(res)) {                                          \
            return Result<void>::Error((res).code(), (res).error()); \
        }                                                      \
    } while (0)

// Same as RETURN_IF_ERR but for functions returning Result<Type>
//   RETURN_IF_ERR_AS(r, std::shared_ptr<T>);
#define RETURN_IF_ERR_AS(res, ...)                             \
    do {                                                       \
        if (!(res)) {                                          \
            return Result<__VA_ARGS__>::Error((res).code(), (res).error()); \
        }                                                      \
    } while (0)

// ----------------------------------------------------------------------------
// 2. LOG_IF_ERR (needs LOG_TAG in scope of the enclosing class)
// ----------------------------------------------------------------------------
#define LOG_IF_ERR(res)                                        \
    do {                                                       \
        if (!(res)) {                                          \
            if ((res).error().has_value())                     \
                LOGW("{}", *(res).error());                    \
            else                                               \
                LOGW("Error: {}", to_string((res).code()));    \
        }                                                      \
    } while (0)
