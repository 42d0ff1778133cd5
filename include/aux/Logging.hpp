#ifndef LOGGING_HPP
#define LOGGING_HPP

#include "core/Config.hpp"

// Installs the default spdlog logger: a rotating file under config.stateDir
// and, unless the curses UI owns the terminal, a colour console sink.
void initialiseLogging(const Config &config, bool interactive);

void shutdownLogging();

#endif
