#pragma once
#include <stdexcept>
#include <string>

enum class ErrorCode {
    NotFound,
    NoCardsDue,
    NoCardsDueWithTags,
    NoCardsMatchingTags,
    Validation,
    StorageIO
};

inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::NoCardsDue: return "no_cards_due";
    case ErrorCode::NoCardsDueWithTags: return "no_cards_due_with_tags";
    case ErrorCode::NoCardsMatchingTags: return "no_cards_matching_tags";
    case ErrorCode::Validation: return "validation_error";
    case ErrorCode::StorageIO: return "storage_io_error";
    }
    return "unknown";
}

// Base for every error the engine raises; carries the code the tool layer reports.
class FlashcardError : public std::runtime_error {
public:
    FlashcardError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), error_code(code) {}

    ErrorCode code() const { return error_code; }

private:
    ErrorCode error_code;
};

class NotFoundError : public FlashcardError {
public:
    explicit NotFoundError(const std::string& message)
        : FlashcardError(ErrorCode::NotFound, message) {}
};

class ValidationError : public FlashcardError {
public:
    explicit ValidationError(const std::string& message)
        : FlashcardError(ErrorCode::Validation, message) {}
};

class StorageError : public FlashcardError {
public:
    explicit StorageError(const std::string& message)
        : FlashcardError(ErrorCode::StorageIO, message) {}
};
