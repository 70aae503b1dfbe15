#include "execution/transaction_submitter.hpp"
#include <algorithm>
#include <cctype>

// "already known" and "known transaction" are not transient: the node already
// holds the signed swap.
bool IsTransientSubmissionError(const std::string& message) {
  static const char* kTransient[] = {
    "nonce too low",
    "underpriced",              // also covers "replacement transaction underpriced"
  };
  std::string m = message;
  std::transform(m.begin(), m.end(), m.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  for (const char* needle : kTransient) {
    if (m.find(needle) != std::string::npos) return true;
  }
  return false;
}
