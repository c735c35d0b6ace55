#ifndef __DX_TERMINAL_OUTPUT_FILTER__
#define __DX_TERMINAL_OUTPUT_FILTER__

#include "Headers.hpp"

namespace dx {
/**
 * @brief Reduces raw shell output to plain printable text.
 *
 * Removes NUL bytes, runs of 10 or more identical characters, ANSI/VT escape
 * sequences (CSI, OSC and two-byte ESC forms) and every control byte except
 * '\n', then collapses 3+ newlines into 2.  The passes repeat until nothing
 * changes, so filtering twice gives the same result as filtering once.
 *
 * The run removal is a heuristic: legitimate output such as a row of dashes
 * is removed along with runaway repeats.
 */
string filterTerminalOutput(const string& data);

/** @brief Removes CSI, OSC and two-byte ESC sequences. */
string stripAnsiSequences(const string& data);

/** @brief Removes every run of at least @p minRun identical characters. */
string removeRepeatedRuns(const string& data, size_t minRun = 10);
}  // namespace dx

#endif  // __DX_TERMINAL_OUTPUT_FILTER__
