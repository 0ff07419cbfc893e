#pragma once

#include <stdexcept>
#include <string>

namespace streakguard {

// Base of every error the core raises on purpose. Anything else escaping a
// component is a bug.
class StreakError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Rejected input; no state was changed.
class ValidationError : public StreakError {
public:
    using StreakError::StreakError;
};

// The cached projection disagreed with a fresh fold of the event log.
class ConsistencyFault : public StreakError {
public:
    using StreakError::StreakError;
};

// A generated pattern failed to compile.
class PatternError : public StreakError {
public:
    using StreakError::StreakError;
};

// SQLite failure. Any open transaction has been rolled back.
class StoreError : public StreakError {
public:
    using StreakError::StreakError;
};

} // namespace streakguard
