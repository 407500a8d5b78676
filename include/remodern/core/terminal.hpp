#pragma once

namespace remodern {

/// True if stderr is a terminal (colored log output).
bool IsStderrTty();

/// True if stdout is a terminal (colored tables in the CLI).
bool IsStdoutTty();

/// True if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

} // namespace remodern
