// include/shardio/errors.hpp
#pragma once
#include <stdexcept>
#include <string>

namespace shardio {

// Base of every error thrown by the library.
class Error : public std::runtime_error {
public:
  explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// open/read/write/sync failure at the OS boundary. Never retried internally.
class IoError : public Error {
public:
  IoError(const std::string& what, int err);
  explicit IoError(const std::string& what) : Error(what) {}

  int code() const noexcept { return errno_; }

private:
  int errno_ = 0;
};

// A chunk failed checksum or structural validation under the Error policy.
class CorruptDataError : public Error {
public:
  using Error::Error;
};

// Invalid construction parameters.
class ConfigError : public Error {
public:
  using Error::Error;
};

class UnsupportedCompressionError : public ConfigError {
public:
  explicit UnsupportedCompressionError(const std::string& name);
};

class WriterClosedError : public Error {
public:
  WriterClosedError() : Error("writer is closed") {}
};

class ReaderClosedError : public Error {
public:
  ReaderClosedError() : Error("reader is closed") {}
};

// A boundary value could not be turned into a path string.
class TypeConversionError : public Error {
public:
  using Error::Error;
};

// Ни один шард пула больше не принимает записи: max_bytes_per_writer при
// выключенном авто-шардировании или неудачная запись.
class ShardCapacityError : public Error {
public:
  using Error::Error;
};

} // namespace shardio
