#pragma once

#include <memory>
#include <string>
#include <utility>
#include "mk/dictionary.h"
#include "mk/errors.h"

namespace mk {

class ModelClass;
using ModelClassPtr = std::shared_ptr<const ModelClass>;

// A reusable validation rule for one named slot of a model. Fields are
// immutable once constructed, apart from the name the schema engine binds
// when a model class is built.
//
// Every variant finishes with the base rule in Field::validate: null is
// accepted only when the field is nullable, and a non-null value must be of
// an accepted type.
class Field {
  public:
    static const std::string unbound_name;

    explicit Field(bool nullable = false) : m_nullable(nullable) {}
    virtual ~Field() = default;

    // Throws a ValidationFailure subtype when `value` breaks the rule.
    virtual void validate(const Dictionary& value) const;

    virtual std::string kind() const { return "Field"; }

    // e.g. "ListField(of=IntegralField, nullable)"
    std::string describe() const;

    const std::string& name() const noexcept { return m_name; }
    bool isBound() const noexcept { return m_name != unbound_name; }
    bool nullable() const noexcept { return m_nullable; }

    // Sets the name used in failures, and derives names for unbound children.
    void bind(const std::string& name);

    // False when the field accepts values of any type.
    virtual bool hasExpectedType() const { return false; }
    virtual bool matchesType(const Dictionary& value) const;
    virtual std::string expectedType() const { return "any"; }

  protected:
    virtual void bindChildren() {}
    virtual std::string options() const { return ""; }

  private:
    std::string m_name = unbound_name;
    bool m_nullable;
};

using FieldPtr = std::shared_ptr<Field>;

class StringField : public Field {
  public:
    explicit StringField(bool nullable = false) : Field(nullable) {}

    std::string kind() const override { return "StringField"; }
    bool hasExpectedType() const override { return true; }
    bool matchesType(const Dictionary& value) const override { return value.isString(); }
    std::string expectedType() const override { return "string"; }
};

class BooleanField : public Field {
  public:
    explicit BooleanField(bool nullable = false) : Field(nullable) {}

    std::string kind() const override { return "BooleanField"; }
    bool hasExpectedType() const override { return true; }
    bool matchesType(const Dictionary& value) const override { return value.isBool(); }
    std::string expectedType() const override { return "boolean"; }
};

// Integers, doubles and booleans, optionally within inclusive bounds.
class NumericField : public Field {
  public:
    explicit NumericField(Bounds bounds = Bounds(), bool nullable = false);

    void validate(const Dictionary& value) const override;
    std::string kind() const override { return "NumericField"; }
    bool hasExpectedType() const override { return true; }
    bool matchesType(const Dictionary& value) const override { return value.isNumber(); }
    std::string expectedType() const override { return "number"; }

    const Bounds& bounds() const noexcept { return m_bounds; }

  protected:
    std::string options() const override;

  private:
    Bounds m_bounds;
};

// Numeric field that rejects doubles, even integral ones such as 3.0.
class IntegralField : public NumericField {
  public:
    explicit IntegralField(Bounds bounds = Bounds(), bool nullable = false)
        : NumericField(std::move(bounds), nullable) {}

    std::string kind() const override { return "IntegralField"; }
    bool matchesType(const Dictionary& value) const override { return value.isInt() || value.isBool(); }
    std::string expectedType() const override { return "integer"; }
};

class ListField : public Field {
  public:
    explicit ListField(FieldPtr of = nullptr, bool nullable = false)
        : Field(nullable), m_of(std::move(of)) {}

    void validate(const Dictionary& value) const override;
    std::string kind() const override { return "ListField"; }
    bool hasExpectedType() const override { return true; }
    bool matchesType(const Dictionary& value) const override { return value.isArrayObject(); }
    std::string expectedType() const override { return "array"; }

    const FieldPtr& of() const noexcept { return m_of; }

  protected:
    void bindChildren() override;
    std::string options() const override;

  private:
    FieldPtr m_of;
};

// A string-keyed mapping. Keys reach `of_key` as String values.
class DictField : public Field {
  public:
    explicit DictField(FieldPtr of_key = nullptr, FieldPtr of_value = nullptr, bool nullable = false)
        : Field(nullable), m_of_key(std::move(of_key)), m_of_value(std::move(of_value)) {}

    void validate(const Dictionary& value) const override;
    std::string kind() const override { return "DictField"; }
    bool hasExpectedType() const override { return true; }
    bool matchesType(const Dictionary& value) const override { return value.isMappedObject(); }
    std::string expectedType() const override { return "object"; }

    const FieldPtr& ofKey() const noexcept { return m_of_key; }
    const FieldPtr& ofValue() const noexcept { return m_of_value; }

  protected:
    void bindChildren() override;
    std::string options() const override;

  private:
    FieldPtr m_of_key;
    FieldPtr m_of_value;
};

// An instance of a model class (or of a class derived from it). A matching
// instance is then validated with its own validate().
class ModelField : public Field {
  public:
    explicit ModelField(ModelClassPtr model, bool nullable = false);

    void validate(const Dictionary& value) const override;
    std::string kind() const override { return "ModelField"; }
    bool hasExpectedType() const override { return true; }
    bool matchesType(const Dictionary& value) const override;
    std::string expectedType() const override;

    const ModelClassPtr& model() const noexcept { return m_model; }

  protected:
    std::string options() const override;

  private:
    ModelClassPtr m_model;
};

}  // namespace mk
