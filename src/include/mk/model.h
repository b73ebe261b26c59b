#pragma once

#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include "mk/dictionary.h"
#include "mk/errors.h"
#include "mk/fields.h"

namespace mk {

class Model;

// The resolved, immutable schema of one model class: its field table,
// direct ancestors and pass-through class attributes. Built by ModelBuilder
// and shared read-only by every instance.
class ModelClass : public std::enable_shared_from_this<ModelClass> {
  public:
    // Only ModelBuilder can make one.
    class Key {
        friend class ModelBuilder;
        Key() {}
    };
    explicit ModelClass(Key) {}

    using FieldTable = std::vector<std::pair<std::string, FieldPtr> >;

    const std::string& name() const noexcept { return m_name; }

    // Fields in resolution order: inherited names first, then own names.
    const FieldTable& fields() const noexcept { return m_fields; }
    std::vector<std::string> fieldNames() const;
    bool hasField(const std::string& name) const { return m_index.count(name) == 1; }
    const FieldPtr& field(const std::string& name) const;

    const std::vector<ModelClassPtr>& ancestors() const noexcept { return m_ancestors; }
    bool isSubclassOf(const ModelClass& other) const;

    // Non-field class attributes, searched on this class and then on the
    // ancestors, left to right and depth first.
    std::optional<Dictionary> attribute(const std::string& name) const;

    // Default unknown-data policy: the `allow_unknown_data` attribute, or true.
    bool allowUnknownData() const;

    // Throws UnexpectedKeyword for a keyword that is not a declared field.
    Model construct(const Dictionary& kwargs = Dictionary()) const;

    // Copies every entry of `mapping`, declared or not. No validation.
    Model fromDict(const Dictionary& mapping) const;

    std::string describe() const;

  private:
    friend class ModelBuilder;

    void put(const std::string& name, const FieldPtr& field);

    std::string m_name;
    FieldTable m_fields;
    std::map<std::string, size_t> m_index;
    std::vector<ModelClassPtr> m_ancestors;
    Dictionary m_attributes;
};

// Declares a model class. Ancestors are merged so that the earlier-listed
// ancestor wins a name conflict, and the class's own fields override
// anything inherited.
//
//   auto Person = ModelBuilder("Person")
//                     .field("name", std::make_shared<StringField>())
//                     .field("age", std::make_shared<IntegralField>(Bounds{0, Dictionary::null()}))
//                     .build();
class ModelBuilder {
  public:
    explicit ModelBuilder(std::string name);

    ModelBuilder& inherits(ModelClassPtr ancestor);
    ModelBuilder& field(const std::string& name, FieldPtr field);
    ModelBuilder& attribute(const std::string& name, const Dictionary& value);
    ModelBuilder& allowUnknownData(bool allow);

    ModelClassPtr build() const;

  private:
    std::string m_name;
    std::vector<ModelClassPtr> m_ancestors;
    std::vector<std::pair<std::string, FieldPtr> > m_fields;
    Dictionary m_attributes;
};

// An instance of a model class: a name -> value mapping that always holds
// every declared field (null until set) and may hold unknown names too.
class Model {
  public:
    explicit Model(ModelClassPtr cls, const Dictionary& kwargs = Dictionary());

    static Model fromDict(ModelClassPtr cls, const Dictionary& mapping);

    const ModelClassPtr& modelClass() const noexcept { return m_class; }

    // Unknown-data policy: the argument when given, else the class default.
    void validate(std::optional<bool> allow_unknown_data = std::nullopt) const;

    Dictionary toDict() const { return m_data; }

    // Copies `mapping` into the instance. When unknown data is forbidden an
    // undeclared key throws UnknownAttribute and nothing is copied.
    void assign(const Dictionary& mapping, std::optional<bool> allow_unknown_data = std::nullopt);

    bool has(const std::string& name) const { return m_data.has(name); }
    const Dictionary& get(const std::string& name) const { return m_data.at(name); }
    void set(const std::string& name, const Dictionary& value) { m_data[name] = value; }
    Dictionary& operator[](const std::string& name) { return m_data[name]; }
    const Dictionary& operator[](const std::string& name) const { return m_data.at(name); }

    // ClassName(field = value, ...) over the declared fields.
    std::string repr() const;

  private:
    void initializeFields();

    ModelClassPtr m_class;
    Dictionary m_data;
};

std::ostream& operator<<(std::ostream& os, const Model& m);

}  // namespace mk
