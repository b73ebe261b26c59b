#include "mk/fields.h"
#include "mk/model.h"

namespace mk {

const std::string Field::unbound_name = "<unbound>";

static std::string value_type_name(const Dictionary& d) {
    switch (d.type()) {
        case Dictionary::Object:
            return "object";
        case Dictionary::Array:
            return "array";
        case Dictionary::String:
            return "string";
        case Dictionary::Integer:
            return "integer";
        case Dictionary::Double:
            return "double";
        case Dictionary::Boolean:
            return "boolean";
        case Dictionary::Null:
            return "null";
        case Dictionary::ModelInstance:
            return d.asModel()->modelClass()->name();
    }
    return "unknown";
}

// -1, 0 or 1. Integers (and booleans) compare exactly, anything involving a
// double compares as doubles.
static int compare_numbers(const Dictionary& a, const Dictionary& b) {
    if (!a.isDouble() && !b.isDouble()) {
        int64_t x = a.asInt();
        int64_t y = b.asInt();
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    double x = a.asDouble();
    double y = b.asDouble();
    return x < y ? -1 : (x > y ? 1 : 0);
}

static std::string describe_child(const FieldPtr& f) { return f ? f->describe() : std::string("null"); }

void Field::validate(const Dictionary& value) const {
    if (value.isNull()) {
        if (!m_nullable) throw NullNotAllowed(m_name);
        return;
    }
    if (hasExpectedType() && !matchesType(value)) {
        throw TypeMismatch(m_name, expectedType(), value_type_name(value));
    }
}

bool Field::matchesType(const Dictionary&) const { return true; }

std::string Field::describe() const {
    std::string opts = options();
    if (m_nullable) opts += opts.empty() ? "nullable" : ", nullable";
    if (opts.empty()) return kind();
    return kind() + "(" + opts + ")";
}

void Field::bind(const std::string& name) {
    m_name = name;
    bindChildren();
}

NumericField::NumericField(Bounds bounds, bool nullable) : Field(nullable), m_bounds(std::move(bounds)) {
    if (!(m_bounds.lower.isNull() || m_bounds.lower.isNumber()))
        throw std::invalid_argument("lower bound must be a number or null, got " + m_bounds.lower.dump());
    if (!(m_bounds.upper.isNull() || m_bounds.upper.isNumber()))
        throw std::invalid_argument("upper bound must be a number or null, got " + m_bounds.upper.dump());
}

void NumericField::validate(const Dictionary& value) const {
    if (!value.isNull() && matchesType(value) && m_bounds.isSet()) {
        if (!m_bounds.lower.isNull() && compare_numbers(value, m_bounds.lower) < 0)
            throw OutOfBounds(name(), value, m_bounds);
        if (!m_bounds.upper.isNull() && compare_numbers(value, m_bounds.upper) > 0)
            throw OutOfBounds(name(), value, m_bounds);
    }
    Field::validate(value);
}

std::string NumericField::options() const {
    if (!m_bounds.isSet()) return "";
    return "bounds=" + m_bounds.to_string();
}

void ListField::validate(const Dictionary& value) const {
    if (m_of && value.isArrayObject()) {
        for (int i = 0; i < value.size(); ++i) m_of->validate(value.at(i));
    }
    Field::validate(value);
}

void ListField::bindChildren() {
    if (m_of && !m_of->isBound()) m_of->bind(name() + "[]");
}

std::string ListField::options() const {
    if (!m_of) return "";
    return "of=" + describe_child(m_of);
}

void DictField::validate(const Dictionary& value) const {
    if (value.isMappedObject()) {
        if (m_of_key) {
            for (auto const& k : value.keys()) m_of_key->validate(Dictionary(k));
        }
        if (m_of_value) {
            for (auto const& v : value.values()) m_of_value->validate(v);
        }
    }
    Field::validate(value);
}

void DictField::bindChildren() {
    if (m_of_key && !m_of_key->isBound()) m_of_key->bind(name() + "{key}");
    if (m_of_value && !m_of_value->isBound()) m_of_value->bind(name() + "{value}");
}

std::string DictField::options() const {
    std::string out;
    if (m_of_key) out += "of_key=" + describe_child(m_of_key);
    if (m_of_value) {
        if (!out.empty()) out += ", ";
        out += "of_value=" + describe_child(m_of_value);
    }
    return out;
}

ModelField::ModelField(ModelClassPtr model, bool nullable) : Field(nullable), m_model(std::move(model)) {
    if (!m_model) throw std::invalid_argument("ModelField requires a model class");
}

bool ModelField::matchesType(const Dictionary& value) const {
    return value.isModel() && value.asModel()->modelClass()->isSubclassOf(*m_model);
}

std::string ModelField::expectedType() const { return m_model->name(); }

void ModelField::validate(const Dictionary& value) const {
    Field::validate(value);
    if (!value.isNull()) value.asModel()->validate();
}

std::string ModelField::options() const { return m_model->name(); }

}  // namespace mk
