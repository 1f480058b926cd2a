#ifndef COMPACTFLOAT_CORE_STATUS_HPP
#define COMPACTFLOAT_CORE_STATUS_HPP

// Every conversion and codec entry point returns its value together with a
// Status. Nothing in the library throws.
//
// Rounded is the only soft condition: the returned value is the best-effort
// rounded result and callers decide whether losing digits matters.

namespace compactfloat {

enum class Status {
  Ok,
  Rounded,        // value usable, lower digits were rounded away
  Incomplete,     // input ended before a complete value
  ValueTooLarge,  // exponent does not fit the target representation
  Malformed,      // text is not a decimal literal or special keyword
  BufferTooSmall, // destination cannot hold the encoding
  NotWholeNumber, // integer conversion of a value with a fraction
  NotFinite,      // integer conversion of infinity or NaN
  OutOfRange,     // integer conversion overflows the target width
  IoError,        // byte sink refused the write
};

inline const char *statusMessage(Status S) {
  switch (S) {
  case Status::Ok:             return "ok";
  case Status::Rounded:        return "value was rounded";
  case Status::Incomplete:     return "compact float value is incomplete";
  case Status::ValueTooLarge:  return "exponent is too big";
  case Status::Malformed:      return "not a floating point value";
  case Status::BufferTooSmall: return "destination buffer is too small";
  case Status::NotWholeNumber: return "not a whole number";
  case Status::NotFinite:      return "not a finite number";
  case Status::OutOfRange:     return "value does not fit the target type";
  case Status::IoError:        return "write to byte sink failed";
  }
  return "???";
}

// Value plus status. For Status::BufferTooSmall on encode, Value holds the
// number of bytes the destination would have needed.
template <typename T> struct Result {
  T Value{};
  Status Code = Status::Ok;

  bool ok() const { return Code == Status::Ok || Code == Status::Rounded; }
  bool rounded() const { return Code == Status::Rounded; }
  explicit operator bool() const { return ok(); }
};

} // namespace compactfloat

#endif // COMPACTFLOAT_CORE_STATUS_HPP
