#include "mk/errors.h"

namespace mk {

std::string to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::NullNotAllowed:
            return "NullNotAllowed";
        case FailureKind::TypeMismatch:
            return "TypeMismatch";
        case FailureKind::OutOfBounds:
            return "OutOfBounds";
        case FailureKind::UnknownAttribute:
            return "UnknownAttribute";
        case FailureKind::UnexpectedKeyword:
            return "UnexpectedKeyword";
    }
    throw std::logic_error("Not a valid failure kind");
}

ValidationFailure::ValidationFailure(FailureKind kind, const std::string& field, const std::string& detail)
    : std::runtime_error("field '" + field + "': " + detail), m_kind(kind), m_field(field) {}

NullNotAllowed::NullNotAllowed(const std::string& field)
    : ValidationFailure(FailureKind::NullNotAllowed, field, "value cannot be null") {}

TypeMismatch::TypeMismatch(const std::string& field, const std::string& expected, const std::string& actual)
    : ValidationFailure(FailureKind::TypeMismatch, field, "expecting " + expected + ", got " + actual),
      m_expected(expected),
      m_actual(actual) {}

OutOfBounds::OutOfBounds(const std::string& field, const Dictionary& value, const Bounds& bounds)
    : ValidationFailure(FailureKind::OutOfBounds,
                        field,
                        "value " + value.dump() + " out of bounds " + bounds.to_string()),
      m_value(value),
      m_bounds(bounds) {}

UnknownAttribute::UnknownAttribute(const std::string& name)
    : ValidationFailure(FailureKind::UnknownAttribute, name, "unknown attribute not allowed") {}

UnexpectedKeyword::UnexpectedKeyword(const std::string& name, const std::string& model_name)
    : ValidationFailure(FailureKind::UnexpectedKeyword,
                        name,
                        "'" + name + "' is an invalid keyword argument for " + model_name) {}

}  // namespace mk
