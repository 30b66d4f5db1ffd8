#pragma once
#include "dsp/series.hpp"
#include <string>

namespace ts {
namespace log {

enum class Level { Debug = 0, Info, Warn, Error };

void init(Level level = Level::Info);
Level level_from_string(const std::string &name);
const char *level_to_string(Level level);
void log(Level level, const std::string &msg);
void debug(const std::string &msg);
void info(const std::string &msg);
void warn(const std::string &msg);
void error(const std::string &msg);

// Sink that reports advisory diagnostics from the analysis routines as
// warnings.
DiagnosticSink diagnostic_sink();

} // namespace log
} // namespace ts
