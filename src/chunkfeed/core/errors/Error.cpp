#include "chunkfeed/core/errors/Error.hpp"

namespace cfd
{

const char* ErrorBase::code_str() const
{
    return error_code_string(code());
}

}  // namespace cfd
