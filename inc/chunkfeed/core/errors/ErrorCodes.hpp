#pragma once

#include "Diagnostics.hpp"

namespace cfd
{
enum class ErrorCode {
    UnexpectedEof   = 1,
    ProducerFailed  = 2,
    InvalidArgument = 3,

    // Reserved for tests
    MockError1 = 254,
    MockError2 = 255,
};

inline const char* error_code_string(ErrorCode err)
{
    CFD_BEGIN_NO_DEFAULT_CASE();
    switch (err) {
        case ErrorCode::UnexpectedEof:
            return "UnexpectedEof";
        case ErrorCode::ProducerFailed:
            return "ProducerFailed";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::MockError1:
            return "MockError1";
        case ErrorCode::MockError2:
            return "MockError2";
    }
    CFD_END_NO_DEFAULT_CASE();
    return "";
}

}  // namespace cfd
