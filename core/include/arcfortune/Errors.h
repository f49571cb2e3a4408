#pragma once

#include <stdexcept>
#include <string>

namespace arcfortune {

// Input text for one work could not be read or is empty.
class IngestionError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// The sentiment classifier could not be loaded or failed unrecoverably.
class ClassifierError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// A classifier call failed in a way that may succeed when retried.
class TransientClassifierError : public ClassifierError {
  public:
    using ClassifierError::ClassifierError;
};

// Scoring a work could not produce an index-aligned score series.
class ScoringError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// No work produced a result, so no ranking exists.
class AggregationError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

}  // namespace arcfortune
