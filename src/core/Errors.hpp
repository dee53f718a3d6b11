#pragma once
#include <stdexcept>
#include <string>

namespace sigdrift {

// Fatal conditions. Per-target failures are reported, not thrown.
struct Error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct UsageError : Error {
  using Error::Error;
};

struct StoreFormatError : Error {
  using Error::Error;
};

struct StoreWriteError : Error {
  using Error::Error;
};

struct TargetMissingError : Error {
  using Error::Error;
};

// The assessment tool broke its contract (success without an originator).
struct ContractError : Error {
  using Error::Error;
};

} // namespace sigdrift
