#pragma once

#include <stdexcept>
#include <string>

namespace finance_analytics {

class AnalyticsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Data-integrity errors: the whole analysis is aborted
class InvalidLedgerError : public AnalyticsError {
public:
    using AnalyticsError::AnalyticsError;
};

class UnresolvedCategoryError : public InvalidLedgerError {
public:
    explicit UnresolvedCategoryError(const std::string& category)
        : InvalidLedgerError("Transaction references unknown category: " + category)
        , category_(category) {}

    const std::string& GetCategory() const { return category_; }

private:
    std::string category_;
};

class InvalidConfigError : public AnalyticsError {
public:
    using AnalyticsError::AnalyticsError;
};

// Raised by the projector for a single category; callers analysing many
// categories keep going with the others
class InsufficientHistoryError : public AnalyticsError {
public:
    InsufficientHistoryError(const std::string& category, int points, int required)
        : AnalyticsError("Insufficient history for category '" + category + "': " +
                         std::to_string(points) + " points, " + std::to_string(required) +
                         " required")
        , category_(category)
        , points_(points)
        , required_(required) {}

    const std::string& GetCategory() const { return category_; }
    int GetPoints() const { return points_; }
    int GetRequired() const { return required_; }

private:
    std::string category_;
    int points_;
    int required_;
};

}  // namespace finance_analytics
