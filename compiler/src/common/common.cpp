//! # Common Definitions: out-of-line parts

#include "common.hpp"

#include "log/log.hpp"

namespace spark {

void internal_error(std::string_view module, const std::string& msg) {
    SPARK_LOG_FATAL(module, "internal compiler error: " << msg);
    throw InternalError(msg);
}

} // namespace spark
