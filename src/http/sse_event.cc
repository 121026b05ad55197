#include "toolgate/http/sse_event.h"

#include <sstream>

namespace toolgate {
namespace http {

std::string SseEventBuilder::serialize() const {
  std::ostringstream oss;

  if (event_.id.has_value()) {
    oss << "id: " << event_.id.value() << "\n";
  }
  if (event_.event.has_value()) {
    oss << "event: " << event_.event.value() << "\n";
  }
  if (event_.retry.has_value()) {
    oss << "retry: " << event_.retry.value() << "\n";
  }

  // Split on newlines; an empty payload still produces one data line
  std::istringstream data_stream(event_.data);
  std::string line;
  bool wrote_data = false;
  while (std::getline(data_stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    oss << "data: " << line << "\n";
    wrote_data = true;
  }
  if (!wrote_data) {
    oss << "data: \n";
  }

  oss << "\n";
  return oss.str();
}

std::string formatSseComment(const std::string& comment) {
  return ": " + comment + "\n\n";
}

}  // namespace http
}  // namespace toolgate
