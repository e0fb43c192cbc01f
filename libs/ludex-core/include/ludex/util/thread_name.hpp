#pragma once

/**
@file
@brief Defines `util::SetCurrentThreadName`, used to label worker threads in debuggers and process monitors.
*/

namespace util {

/// @brief Changes the name of the current thread.
///
/// Linux truncates names to 15 characters.
///
/// @param[in] threadName the new thread name
void SetCurrentThreadName(const char *threadName);

} // namespace util
