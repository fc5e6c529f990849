#pragma once

namespace lxterm::exit_code {

inline constexpr int success = 0;
inline constexpr int failure = 1;

// The line never reached execution: parse, alias or dispatch error.
inline constexpr int not_executed = 2;

inline constexpr int cannot_start = 126;
inline constexpr int not_found = 127;
inline constexpr int signal_base = 128;

} // namespace lxterm::exit_code
