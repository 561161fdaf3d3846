#pragma once
#include <iostream>
#include <sstream>
#include <string>

namespace ewas {

// Stage narration on stderr, e.g. "[preprocess] Removing 2 missing case(s)."
inline void log(const char* tag, const std::string& s) {
  std::cerr << "[" << tag << "] " << s << '\n';
}

// Builds the message from any streamable pieces, separated by spaces.
template <typename... Args>
inline void msg(bool verbose, const char* tag, const Args&... args) {
  if (!verbose) return;
  std::ostringstream oss;
  const char* sep = "";
  ((oss << sep << args, sep = " "), ...);
  log(tag, oss.str());
}

inline void warn(const char* tag, const std::string& s) {
  std::cerr << "[" << tag << "] warning: " << s << '\n';
}

} // namespace ewas
