#pragma once

#include <memory>
#include <string>

#include "toolgate/logging/log_message.h"

namespace toolgate {
namespace logging {

class Formatter {
 public:
  virtual ~Formatter() = default;
  virtual std::string format(const LogMessage& msg) const = 0;
};

// [timestamp] [LEVEL] [T:thread] [Component.name] [logger] message {k=v}
class DefaultFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

// One JSON object per line for log shippers
class JsonFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

// "text" or "json"; anything else yields nullptr
std::unique_ptr<Formatter> createFormatter(const std::string& name);

}  // namespace logging
}  // namespace toolgate
