#include "core/logging.h"

#include <iostream>

#ifdef ENABLE_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

void log_exception(const char *context, const std::exception &e) {
    std::cerr << context << ": " << e.what() << "\n";
#if defined(ENABLE_STACKTRACE) && !defined(NDEBUG)
    std::cerr << boost::stacktrace::stacktrace();
#endif
}

void log_trace(const std::string &message, bool enabled) {
    if (!enabled) {
        return;
    }
    std::cerr << "[trace] " << message << "\n";
}

void log_warning(const std::string &message) {
    std::cerr << "[warn] " << message << "\n";
}
