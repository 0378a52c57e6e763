#ifndef HEARTBEAT_WATCHDOG__IO_ERROR_HPP_
#define HEARTBEAT_WATCHDOG__IO_ERROR_HPP_

#include <system_error>

namespace heartbeat_watchdog
{

/// Transport-level error conditions raised by this library.
///
/// OS failures are reported as std::system_category() codes instead.
/// None of these is ever reinterpreted as a detection fault.
enum class IoErrc
{
  INVALID_SYMBOL = 1,  // received byte is neither '+' nor '.'
  INVALID_DATAGRAM,    // datagram is not exactly one byte
  NOT_OPEN,            // transport used before open() / after close()
  CANCELLED,           // wait interrupted (shutdown)
};

const std::error_category & io_category();

std::error_code make_error_code(IoErrc e);

}  // namespace heartbeat_watchdog

namespace std
{
template<>
struct is_error_code_enum<heartbeat_watchdog::IoErrc>: true_type {};
}  // namespace std

#endif  // HEARTBEAT_WATCHDOG__IO_ERROR_HPP_
