#include "heartbeat_watchdog/io_error.hpp"

#include <string>

namespace heartbeat_watchdog
{

namespace
{

class IoCategory : public std::error_category
{
public:
  const char * name() const noexcept override
  {
    return "heartbeat_io";
  }

  std::string message(int ev) const override
  {
    switch (static_cast<IoErrc>(ev)) {
      case IoErrc::INVALID_SYMBOL:   return "invalid edge symbol";
      case IoErrc::INVALID_DATAGRAM: return "heartbeat datagram must be exactly one byte";
      case IoErrc::NOT_OPEN:         return "transport is not open";
      case IoErrc::CANCELLED:        return "wait cancelled";
    }
    return "unknown error (" + std::to_string(ev) + ")";
  }
};

}  // namespace

const std::error_category & io_category()
{
  static const IoCategory category;
  return category;
}

std::error_code make_error_code(IoErrc e)
{
  return {static_cast<int>(e), io_category()};
}

}  // namespace heartbeat_watchdog
