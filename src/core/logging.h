#pragma once

#include <exception>
#include <string>

void log_exception(const char *context, const std::exception &e);
void log_trace(const std::string &message, bool enabled);
void log_warning(const std::string &message);
