#pragma once

#include <stdexcept>
#include <string>
#include "mk/dictionary.h"

namespace mk {

enum class FailureKind { NullNotAllowed, TypeMismatch, OutOfBounds, UnknownAttribute, UnexpectedKeyword };

std::string to_string(FailureKind kind);

// Inclusive numeric bounds; a null side is unbounded.
struct Bounds {
    Dictionary lower = Dictionary::null();
    Dictionary upper = Dictionary::null();

    bool isSet() const { return !lower.isNull() || !upper.isNull(); }
    std::string to_string() const { return "[" + lower.dump() + ", " + upper.dump() + "]"; }
};

// Base of every failure reported by field and model validation. Always
// carries the name of the field (or attribute) whose rule was violated.
class ValidationFailure : public std::runtime_error {
  public:
    ValidationFailure(FailureKind kind, const std::string& field, const std::string& detail);

    const std::string& field() const noexcept { return m_field; }
    FailureKind kind() const noexcept { return m_kind; }

  private:
    FailureKind m_kind;
    std::string m_field;
};

class NullNotAllowed : public ValidationFailure {
  public:
    explicit NullNotAllowed(const std::string& field);
};

class TypeMismatch : public ValidationFailure {
  public:
    TypeMismatch(const std::string& field, const std::string& expected, const std::string& actual);

    const std::string& expected() const noexcept { return m_expected; }
    const std::string& actual() const noexcept { return m_actual; }

  private:
    std::string m_expected;
    std::string m_actual;
};

class OutOfBounds : public ValidationFailure {
  public:
    OutOfBounds(const std::string& field, const Dictionary& value, const Bounds& bounds);

    const Dictionary& value() const noexcept { return m_value; }
    const Bounds& bounds() const noexcept { return m_bounds; }

  private:
    Dictionary m_value;
    Bounds m_bounds;
};

// An instance carries a name its schema does not declare while unknown data
// is forbidden.
class UnknownAttribute : public ValidationFailure {
  public:
    explicit UnknownAttribute(const std::string& name);
};

// Construction received a keyword that is not a declared field.
class UnexpectedKeyword : public ValidationFailure {
  public:
    UnexpectedKeyword(const std::string& name, const std::string& model_name);
};

}  // namespace mk
