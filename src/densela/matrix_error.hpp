#ifndef DENSELA_MATRIX_ERROR_HPP
#define DENSELA_MATRIX_ERROR_HPP

#include <functional>
#include <iostream>
#include <source_location>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace densela {

// ==============================================
// Core Error Types
// ==============================================

enum class ErrorCode {
  INVALID_DIMENSIONS,  // Wrong fixed size for the operation
  DIMENSION_MISMATCH,  // Operand shapes do not agree
  NOT_SQUARE,          // Operation requires square matrix
  OUT_OF_BOUNDS,       // Element index outside the matrix
  INVALID_VIEW,        // View index or range outside the owner
  INVALID_ARGUMENT     // Argument value rejected
};

inline const char* to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::INVALID_DIMENSIONS:
      return "invalid dimensions";
    case ErrorCode::DIMENSION_MISMATCH:
      return "dimension mismatch";
    case ErrorCode::NOT_SQUARE:
      return "not square";
    case ErrorCode::OUT_OF_BOUNDS:
      return "out of bounds";
    case ErrorCode::INVALID_VIEW:
      return "invalid view";
    case ErrorCode::INVALID_ARGUMENT:
      return "invalid argument";
  }
  return "unknown";
}

class MatrixException : public std::runtime_error {
 public:
  MatrixException(ErrorCode code, const std::string& msg,
                  std::source_location location)
      : std::runtime_error(format_msg(msg, code, location)),
        m_code(code),
        m_location(location) {}

  ErrorCode code() const noexcept { return m_code; }
  const std::source_location& location() const noexcept { return m_location; }

 private:
  static std::string format_msg(const std::string& msg, ErrorCode code,
                                const std::source_location& loc) {
    std::ostringstream oss;
    oss << "Error " << static_cast<int>(code) << " (" << to_string(code)
        << "): " << msg << "\n"
        << "Location: " << loc.file_name() << ":" << loc.line() << "\n"
        << "Function: " << loc.function_name();
    return oss.str();
  }

  ErrorCode m_code;
  std::source_location m_location;
};

struct bad_size : public MatrixException {
  bad_size(const std::string& msg, std::source_location loc)
      : MatrixException(ErrorCode::INVALID_DIMENSIONS, msg, loc) {}
};
struct incompatible_size : public MatrixException {
  incompatible_size(const std::string& msg, std::source_location loc)
      : MatrixException(ErrorCode::DIMENSION_MISMATCH, msg, loc) {}
};
struct not_square : public MatrixException {
  not_square(const std::string& msg, std::source_location loc)
      : MatrixException(ErrorCode::NOT_SQUARE, msg, loc) {}
};
struct out_of_range : public MatrixException {
  out_of_range(const std::string& msg, std::source_location loc)
      : MatrixException(ErrorCode::OUT_OF_BOUNDS, msg, loc) {}
};
struct row_outbound : public out_of_range {
  row_outbound(const std::string& msg, std::source_location loc)
      : out_of_range(msg, loc) {}
};
struct col_outbound : public out_of_range {
  col_outbound(const std::string& msg, std::source_location loc)
      : out_of_range(msg, loc) {}
};
struct bad_view : public MatrixException {
  bad_view(const std::string& msg, std::source_location loc)
      : MatrixException(ErrorCode::INVALID_VIEW, msg, loc) {}
};
struct bad_argument : public MatrixException {
  bad_argument(const std::string& msg, std::source_location loc)
      : MatrixException(ErrorCode::INVALID_ARGUMENT, msg, loc) {}
};

// ==============================================
// Error Handling System
// ==============================================

namespace error {

using Handler = std::function<void(ErrorCode, std::string_view)>;

namespace impl {
inline Handler& thread_handler() {
  thread_local Handler handler;
  return handler;
}
}  // namespace impl

// Installs a callback run right before any library exception is thrown.
inline void set_handler(Handler handler) {
  impl::thread_handler() = std::move(handler);
}

inline void clear_handler() {
  impl::thread_handler() = nullptr;
}

inline void stderr_handler(ErrorCode code, std::string_view msg) {
  std::cerr << "densela error " << static_cast<int>(code) << " ("
            << to_string(code) << "): " << msg << std::endl;
}

// RAII handler control
class ScopedHandler {
 public:
  explicit ScopedHandler(Handler handler)
      : m_prev(std::exchange(impl::thread_handler(), std::move(handler))) {}
  ~ScopedHandler() { impl::thread_handler() = std::move(m_prev); }

  ScopedHandler(const ScopedHandler&) = delete;
  ScopedHandler& operator=(const ScopedHandler&) = delete;

 private:
  Handler m_prev;
};

}  // namespace error

namespace detail {

template <typename Exception>
[[noreturn]] inline void raise(const std::string& msg,
                               const std::source_location& loc) {
  Exception exception(msg, loc);
  if (auto& handler = error::impl::thread_handler())
    handler(exception.code(), msg);
  throw exception;
}

}  // namespace detail

#define DENSELA_THROW(Exception, msg) \
  ::densela::detail::raise<::densela::Exception>( \
      (msg), std::source_location::current())

}  // namespace densela
#endif  // DENSELA_MATRIX_ERROR_HPP
