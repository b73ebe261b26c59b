#include "mk/model.h"
#include <cstdlib>
#include <iostream>
#include <sstream>

namespace mk {

std::string describeModel(const Model& m) { return m.repr(); }

bool sameModelData(const Model& lhs, const Model& rhs) {
    return lhs.modelClass() == rhs.modelClass() && lhs.toDict() == rhs.toDict();
}

Dictionary::Dictionary(const mk::Model& m) {
    my_type = TYPE::ModelInstance;
    scalar->m_model = std::make_shared<mk::Model>(m);
}

static std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (auto const& n : names) {
        if (!out.empty()) out += ",";
        out += n;
    }
    return out;
}

// ---------------------------------------------------------------------------
// ModelClass

std::vector<std::string> ModelClass::fieldNames() const {
    std::vector<std::string> out;
    out.reserve(m_fields.size());
    for (auto const& p : m_fields) out.push_back(p.first);
    return out;
}

const FieldPtr& ModelClass::field(const std::string& name) const {
    auto it = m_index.find(name);
    if (it != m_index.end()) return m_fields[it->second].second;
    std::ostringstream ss;
    ss << "Model " << m_name << " has no field <" << name << "> available options are: ";
    bool first = true;
    for (auto const& p : m_fields) {
        if (!first) ss << ",";
        first = false;
        ss << '"' << p.first << '"';
    }
    throw std::out_of_range(ss.str());
}

bool ModelClass::isSubclassOf(const ModelClass& other) const {
    if (this == &other) return true;
    for (auto const& a : m_ancestors) {
        if (a->isSubclassOf(other)) return true;
    }
    return false;
}

std::optional<Dictionary> ModelClass::attribute(const std::string& name) const {
    if (m_attributes.has(name)) return m_attributes.at(name);
    for (auto const& a : m_ancestors) {
        if (auto v = a->attribute(name)) return v;
    }
    return std::nullopt;
}

bool ModelClass::allowUnknownData() const {
    auto v = attribute("allow_unknown_data");
    if (v && v->isBool()) return v->asBool();
    return true;
}

Model ModelClass::construct(const Dictionary& kwargs) const { return Model(shared_from_this(), kwargs); }

Model ModelClass::fromDict(const Dictionary& mapping) const { return Model::fromDict(shared_from_this(), mapping); }

std::string ModelClass::describe() const {
    std::ostringstream ss;
    ss << m_name;
    if (!m_ancestors.empty()) {
        ss << "(";
        for (size_t i = 0; i < m_ancestors.size(); ++i) {
            if (i) ss << ", ";
            ss << m_ancestors[i]->name();
        }
        ss << ")";
    }
    ss << " {";
    for (size_t i = 0; i < m_fields.size(); ++i) {
        ss << (i ? ", " : " ") << m_fields[i].first << ": " << m_fields[i].second->describe();
    }
    ss << (m_fields.empty() ? "}" : " }");
    return ss.str();
}

void ModelClass::put(const std::string& name, const FieldPtr& field) {
    auto it = m_index.find(name);
    if (it != m_index.end()) {
        m_fields[it->second].second = field;
        return;
    }
    m_index.emplace(name, m_fields.size());
    m_fields.emplace_back(name, field);
}

// ---------------------------------------------------------------------------
// ModelBuilder

ModelBuilder::ModelBuilder(std::string name) : m_name(std::move(name)) {
    if (m_name.empty()) throw std::invalid_argument("model class name cannot be empty");
}

ModelBuilder& ModelBuilder::inherits(ModelClassPtr ancestor) {
    if (!ancestor) throw std::invalid_argument("model " + m_name + ": ancestor cannot be null");
    m_ancestors.push_back(std::move(ancestor));
    return *this;
}

ModelBuilder& ModelBuilder::field(const std::string& name, FieldPtr field) {
    if (name.empty()) throw std::invalid_argument("model " + m_name + ": field name cannot be empty");
    if (!field) throw std::invalid_argument("model " + m_name + ": field '" + name + "' cannot be null");
    for (auto& p : m_fields) {
        if (p.first == name) {
            p.second = std::move(field);
            return *this;
        }
    }
    m_fields.emplace_back(name, std::move(field));
    return *this;
}

ModelBuilder& ModelBuilder::attribute(const std::string& name, const Dictionary& value) {
    if (name == "allow_unknown_data" && !value.isBool())
        throw std::invalid_argument("model " + m_name + ": allow_unknown_data must be a boolean, got " +
                                    value.dump());
    m_attributes[name] = value;
    return *this;
}

ModelBuilder& ModelBuilder::allowUnknownData(bool allow) { return attribute("allow_unknown_data", allow); }

ModelClassPtr ModelBuilder::build() const {
    auto cls = std::make_shared<ModelClass>(ModelClass::Key());
    cls->m_name = m_name;
    cls->m_ancestors = m_ancestors;
    cls->m_attributes = m_attributes;

    // Rightmost ancestor first so that earlier ancestors overwrite it.
    for (auto it = m_ancestors.rbegin(); it != m_ancestors.rend(); ++it) {
        for (auto const& p : (*it)->fields()) cls->put(p.first, p.second);
    }
    // A field object reports a single name, so it cannot be declared under
    // two different ones.
    for (auto const& p : m_fields) {
        if (p.second->isBound() && p.second->name() != p.first)
            throw std::invalid_argument("model " + m_name + ": field '" + p.first + "' is already bound as '" +
                                        p.second->name() + "'");
    }
    // Inherited fields were bound under the same key by their own class.
    for (auto const& p : m_fields) {
        p.second->bind(p.first);
        cls->put(p.first, p.second);
    }

    if (std::getenv("MK_SCHEMA_DEBUG")) {
        std::vector<std::string> parents;
        for (auto const& a : m_ancestors) parents.push_back(a->name());
        std::cerr << "schema build: model='" << m_name << "' ancestors={" << join_names(parents)
                  << "} fields={" << join_names(cls->fieldNames()) << "} attributes=" << m_attributes.dump()
                  << "\n";
    }
    return cls;
}

// ---------------------------------------------------------------------------
// Model

Model::Model(ModelClassPtr cls, const Dictionary& kwargs) : m_class(std::move(cls)) {
    if (!m_class) throw std::invalid_argument("model instance requires a model class");
    if (!kwargs.isMappedObject())
        throw std::invalid_argument("keyword arguments must be an object, got " + kwargs.typeString());
    for (auto const& k : kwargs.keys()) {
        if (!m_class->hasField(k)) throw UnexpectedKeyword(k, m_class->name());
    }
    m_data = kwargs;
    initializeFields();
}

Model Model::fromDict(ModelClassPtr cls, const Dictionary& mapping) {
    Model instance(std::move(cls));
    instance.assign(mapping, true);
    return instance;
}

void Model::initializeFields() {
    for (auto const& p : m_class->fields()) {
        if (!m_data.has(p.first)) m_data[p.first] = Dictionary::null();
    }
}

void Model::assign(const Dictionary& mapping, std::optional<bool> allow_unknown_data) {
    if (!mapping.isMappedObject())
        throw std::invalid_argument("cannot assign a " + mapping.typeString() + " to model " + m_class->name());
    bool allow = allow_unknown_data.has_value() ? *allow_unknown_data : m_class->allowUnknownData();
    if (!allow) {
        for (auto const& k : mapping.keys()) {
            if (!m_class->hasField(k)) throw UnknownAttribute(k);
        }
    }
    for (auto const& p : mapping.items()) m_data[p.first] = p.second;
}

void Model::validate(std::optional<bool> allow_unknown_data) const {
    bool allow = allow_unknown_data.has_value() ? *allow_unknown_data : m_class->allowUnknownData();
    if (std::getenv("MK_VALIDATE_DEBUG")) {
        std::cerr << "validate: model='" << m_class->name() << "' allow_unknown_data=" << (allow ? "true" : "false")
                  << " data=" << m_data.dump() << "\n";
    }

    if (!allow) {
        for (auto const& k : m_data.keys()) {
            if (!m_class->hasField(k)) throw UnknownAttribute(k);
        }
    }

    for (auto const& p : m_class->fields()) {
        p.second->validate(m_data.at(p.first));
    }
}

std::string Model::repr() const {
    std::ostringstream ss;
    ss << m_class->name() << "(";
    bool first = true;
    for (auto const& p : m_class->fields()) {
        if (!first) ss << ", ";
        first = false;
        ss << p.first << " = " << m_data.at(p.first).dump();
    }
    ss << ")";
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const Model& m) {
    os << m.repr();
    return os;
}

}  // namespace mk
