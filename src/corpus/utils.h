#ifndef _CORPUS_UTILS_H_
#define _CORPUS_UTILS_H_

#include <string>
#include <vector>
#include <iostream>
#include <chrono>

#include <boost/shared_ptr.hpp>
#include <boost/make_shared.hpp>

namespace lhrtree {

typedef std::string Word;
typedef int WordId;
typedef int WordIndex;
typedef std::vector<WordId> Words;
typedef std::vector<WordIndex> Indices;
typedef std::vector<Indices> IndicesList;

typedef double Real;
typedef std::vector<Real> Reals;

typedef std::chrono::high_resolution_clock Clock;
typedef Clock::time_point Time;

inline Time get_time() {
  return Clock::now();
}

inline Real get_duration(const Time& start_time, const Time& stop_time) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(stop_time - start_time).count() / 1000.0;
}

// Splits on a single delimiter character, keeping empty fields.
inline std::vector<std::string> split_string(const std::string& str, char delim) {
  std::vector<std::string> parts;
  size_t last = 0;
  size_t cur = str.find(delim);
  while (cur != std::string::npos) {
    parts.push_back(str.substr(last, cur - last));
    last = cur + 1;
    cur = str.find(delim, last);
  }
  parts.push_back(str.substr(last));

  return parts;
}

}  // namespace lhrtree

#endif
