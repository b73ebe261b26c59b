#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <initializer_list>
#include <map>
#include <vector>
#include <memory>
#include <stdexcept>
#include <sstream>
#include <ostream>

namespace mk {

class Model;

// Out-of-line hooks implemented by the model engine (model.cpp) so that a
// Dictionary can print and compare model instances it refers to.
std::string describeModel(const Model& m);
bool sameModelData(const Model& lhs, const Model& rhs);

struct DictionaryScalarImpl {
    bool m_bool = false;
    double m_double = 0.0;
    int64_t m_int = 0;
    std::string m_string = "";
    std::shared_ptr<Model> m_model;
};

// A loosely-typed value tree: the representation for instance attributes,
// imported mappings and anything a field validates.
struct Dictionary {
    enum TYPE { Object, Boolean, String, Integer, Double, Array, Null, ModelInstance };

  private:
    TYPE my_type = Object;
    std::shared_ptr<DictionaryScalarImpl> scalar = std::make_shared<DictionaryScalarImpl>();

    std::map<int, Dictionary> m_array_map;
    std::map<std::string, Dictionary> m_object_map;

  public:
    Dictionary() { my_type = TYPE::Object; }
    ~Dictionary() = default;

    // Deep copy, except that a Model value keeps referring to the same
    // instance.
    Dictionary(const Dictionary& d) { *this = d; }

    Dictionary(const std::string& s) {
        my_type = TYPE::String;
        scalar->m_string = s;
    }

    Dictionary(const char* s) { *this = std::string(s); }

    Dictionary(int64_t n) {
        my_type = TYPE::Integer;
        scalar->m_int = n;
    }

    Dictionary(int n) { *this = int64_t(n); }

    Dictionary(double x) {
        my_type = TYPE::Double;
        scalar->m_double = x;
    }

    Dictionary(bool b) {
        my_type = TYPE::Boolean;
        scalar->m_bool = b;
    }

    Dictionary(std::shared_ptr<mk::Model> m) {
        if (!m) {
            my_type = TYPE::Null;
            return;
        }
        my_type = TYPE::ModelInstance;
        scalar->m_model = std::move(m);
    }

    // Shares a copy of the instance (defined in model.cpp).
    Dictionary(const mk::Model& m);

    Dictionary(const std::vector<std::string>& v) {
        my_type = TYPE::Array;
        for (size_t i = 0; i < v.size(); ++i)
            m_array_map.emplace(static_cast<int>(i), Dictionary(v[i]));
    }

    Dictionary(const std::vector<Dictionary>& v) {
        my_type = TYPE::Array;
        for (size_t i = 0; i < v.size(); ++i) m_array_map.emplace(static_cast<int>(i), v[i]);
    }

    // Construct an object from initializer list of (key, value) pairs
    Dictionary(std::initializer_list<std::pair<std::string, Dictionary> > init) {
        my_type = TYPE::Object;
        for (auto const& p : init) {
            m_object_map[p.first] = p.second;
        }
    }

    static Dictionary null() {
        Dictionary d;
        d.my_type = TYPE::Null;
        return d;
    }

    // Heterogeneous array literal: Dictionary::array({1, 2, "c"})
    static Dictionary array(std::initializer_list<Dictionary> init) {
        return Dictionary(std::vector<Dictionary>(init));
    }

    static Dictionary array() {
        Dictionary d;
        d.my_type = TYPE::Array;
        return d;
    }

    Dictionary& operator=(const Dictionary& d) {
        if (this == &d) return *this;
        my_type = d.my_type;
        scalar = std::make_shared<DictionaryScalarImpl>(*d.scalar);

        // Build new maps first so assigning from a sub-element
        // (e.g. `dict = dict["key"]`) is safe.
        std::map<std::string, Dictionary> new_object_map;
        std::map<int, Dictionary> new_array_map;

        switch (my_type) {
            case TYPE::Object:
                for (auto const& p : d.m_object_map) {
                    Dictionary tmp;
                    tmp = p.second;
                    new_object_map.emplace(p.first, std::move(tmp));
                }
                break;
            case TYPE::Array:
                for (auto const& kv : d.m_array_map) {
                    Dictionary tmp;
                    tmp = kv.second;
                    new_array_map.emplace(kv.first, std::move(tmp));
                }
                break;
            default:
                // scalar already copied above
                break;
        }

        m_object_map = std::move(new_object_map);
        m_array_map = std::move(new_array_map);
        return *this;
    }

    Dictionary& operator=(const std::string& s) {
        reset(TYPE::String);
        scalar->m_string = s;
        return *this;
    }

    Dictionary& operator=(const char* s) { return operator=(std::string(s)); }

    Dictionary& operator=(int64_t n) {
        reset(TYPE::Integer);
        scalar->m_int = n;
        return *this;
    }

    Dictionary& operator=(int n) { return operator=(int64_t(n)); }

    Dictionary& operator=(double x) {
        reset(TYPE::Double);
        scalar->m_double = x;
        return *this;
    }

    Dictionary& operator=(const bool& b) {
        reset(TYPE::Boolean);
        scalar->m_bool = b;
        return *this;
    }

    bool operator==(const Dictionary& rhs) const {
        if (my_type != rhs.my_type) return false;
        switch (my_type) {
            case TYPE::Boolean:
                return scalar->m_bool == rhs.scalar->m_bool;
            case TYPE::Double:
                return scalar->m_double == rhs.scalar->m_double;
            case TYPE::Integer:
                return scalar->m_int == rhs.scalar->m_int;
            case TYPE::String:
                return scalar->m_string == rhs.scalar->m_string;
            case TYPE::Array:
                return m_array_map == rhs.m_array_map;
            case TYPE::Object:
                return m_object_map == rhs.m_object_map;
            case TYPE::ModelInstance:
                if (scalar->m_model == rhs.scalar->m_model) return true;
                return sameModelData(*scalar->m_model, *rhs.scalar->m_model);
            case TYPE::Null:
                return true;
        }
        return false;
    }

    bool operator!=(const Dictionary& rhs) const { return not(*this == rhs); }

    int count(const std::string& key) const {
        if (my_type != TYPE::Object) return 0;
        return static_cast<int>(m_object_map.count(key));
    }

    bool has(const std::string& key) const noexcept { return count(key) == 1; }
    bool contains(const std::string& k) const noexcept { return has(k); }

    int size() const noexcept {
        switch (my_type) {
            case TYPE::Array:
                return static_cast<int>(m_array_map.size());
            case TYPE::Object:
                return static_cast<int>(m_object_map.size());
            default:
                return 0;
        }
    }

    bool empty() const noexcept {
        switch (my_type) {
            case TYPE::Object:
                return m_object_map.empty();
            case TYPE::Array:
                return m_array_map.empty();
            default:
                return false;
        }
    }

    Dictionary& erase(const std::string& k) {
        if (my_type == TYPE::Object) {
            m_object_map.erase(k);
        }
        return *this;
    }

    TYPE type() const { return my_type; }

    static std::string typeString(TYPE t) {
        switch (t) {
            case TYPE::Object:
                return "Object";
            case TYPE::Boolean:
                return "Boolean";
            case TYPE::Double:
                return "Double";
            case TYPE::Integer:
                return "Integer";
            case TYPE::String:
                return "String";
            case TYPE::Array:
                return "Array";
            case TYPE::Null:
                return "Null";
            case TYPE::ModelInstance:
                return "Model";
        }
        throw std::logic_error("Not a valid type");
    }

    std::string typeString() const { return typeString(my_type); }

    Dictionary& operator[](int index) {
        // An object that has never been used as a mapped object turns into
        // an array on first integer-index access, so dict["arr"][0] = 5 works.
        if (my_type == TYPE::Object && m_object_map.empty()) {
            my_type = TYPE::Array;
            m_array_map.clear();
        }
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        if (index < 0) throw std::logic_error("Negative index");
        for (int i = 0; i <= index; ++i) {
            if (m_array_map.find(i) == m_array_map.end()) m_array_map.emplace(i, Dictionary());
        }
        return m_array_map[index];
    }

    const Dictionary& operator[](int index) const { return at(index); }

    Dictionary& operator[](const std::string& k) {
        if (my_type != TYPE::Object) {
            reset(TYPE::Object);
        }
        return m_object_map[k];
    }

    const Dictionary& operator[](const std::string& k) const { return at(k); }

    Dictionary& at(int index) {
        if (my_type == TYPE::Array) return m_array_map.at(index);
        throw std::logic_error("Not a list");
    }

    const Dictionary& at(int index) const {
        if (my_type == TYPE::Array) return m_array_map.at(index);
        throw std::logic_error("Not a list");
    }

    const Dictionary& at(const std::string& k) const {
        auto it = m_object_map.find(k);
        if (it != m_object_map.end()) return it->second;
        throw std::out_of_range(missingKeyMessage(k));
    }

    Dictionary& at(const std::string& k) {
        auto it = m_object_map.find(k);
        if (it != m_object_map.end()) return it->second;
        throw std::out_of_range(missingKeyMessage(k));
    }

    std::vector<std::string> keys() const {
        if (my_type != TYPE::Object) {
            return {};
        }
        std::vector<std::string> out;
        out.reserve(m_object_map.size());
        for (auto const& p : m_object_map) out.push_back(p.first);
        return out;
    }

    std::vector<Dictionary> values() const {
        if (my_type != TYPE::Object) {
            throw std::logic_error("Cannot get values of non-object type");
        }
        std::vector<Dictionary> out;
        out.reserve(m_object_map.size());
        for (auto const& p : m_object_map) out.push_back(p.second);
        return out;
    }

    std::vector<std::pair<std::string, Dictionary> > items() const {
        if (my_type != TYPE::Object) {
            throw std::logic_error("Cannot get items of non-object type");
        }
        std::vector<std::pair<std::string, Dictionary> > out;
        out.reserve(m_object_map.size());
        for (auto const& [key, value] : m_object_map) {
            out.push_back({key, value});
        }
        return out;
    }

    std::string asString() const {
        if (my_type == TYPE::String) return scalar->m_string;
        if (my_type == TYPE::Integer) return std::to_string(scalar->m_int);
        if (my_type == TYPE::Double) {
            std::ostringstream ss;
            ss << scalar->m_double;
            return ss.str();
        }
        if (my_type == TYPE::Boolean) return scalar->m_bool ? "true" : "false";
        throw std::runtime_error("not a string");
    }

    int64_t asInt() const {
        if (my_type == TYPE::Integer) return scalar->m_int;
        if (my_type == TYPE::Double) return static_cast<int64_t>(scalar->m_double);
        if (my_type == TYPE::Boolean) return scalar->m_bool ? 1 : 0;
        throw std::runtime_error("not an int");
    }

    double asDouble() const {
        if (my_type == TYPE::Double) return scalar->m_double;
        if (my_type == TYPE::Integer) return static_cast<double>(scalar->m_int);
        if (my_type == TYPE::Boolean) return scalar->m_bool ? 1.0 : 0.0;
        throw std::runtime_error("not a double");
    }

    bool asBool() const {
        if (my_type == TYPE::Boolean) return scalar->m_bool;
        throw std::runtime_error("not a bool");
    }

    const std::shared_ptr<mk::Model>& asModel() const {
        if (my_type == TYPE::ModelInstance) return scalar->m_model;
        throw std::runtime_error("not a model instance");
    }

    bool isArrayObject() const { return my_type == TYPE::Array; }
    bool isMappedObject() const { return my_type == TYPE::Object; }

    bool isInt() const { return my_type == TYPE::Integer; }
    bool isDouble() const { return my_type == TYPE::Double; }
    bool isString() const { return my_type == TYPE::String; }
    bool isBool() const { return my_type == TYPE::Boolean; }
    bool isNull() const { return my_type == TYPE::Null; }
    bool isModel() const { return my_type == TYPE::ModelInstance; }
    // Booleans count as numbers, the same way they do for numeric fields.
    bool isNumber() const {
        return my_type == TYPE::Integer || my_type == TYPE::Double || my_type == TYPE::Boolean;
    }

    std::string dump() const;

  private:
    void reset(TYPE t) {
        m_object_map.clear();
        m_array_map.clear();
        scalar = std::make_shared<DictionaryScalarImpl>();
        my_type = t;
    }

    std::string missingKeyMessage(const std::string& k) const {
        std::ostringstream ss;
        ss << "Could not find key <" << k << "> available options are: ";
        bool first = true;
        for (auto const& p : m_object_map) {
            if (!first) ss << ",";
            first = false;
            ss << '"' << p.first << '"';
        }
        return ss.str();
    }
};

// Helper function to escape JSON strings
static inline std::string escape_json_string(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 2);
    result.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                result.push_back(c);
                break;
        }
    }
    result.push_back('"');
    return result;
}

// Compact single-line JSON-like text. Model instances print as their repr.
inline std::string Dictionary::dump() const {
    switch (my_type) {
        case TYPE::Null:
            return "null";
        case TYPE::Boolean:
            return scalar->m_bool ? "true" : "false";
        case TYPE::Integer:
            return std::to_string(scalar->m_int);
        case TYPE::Double: {
            std::ostringstream ss;
            ss << scalar->m_double;
            return ss.str();
        }
        case TYPE::String:
            return escape_json_string(scalar->m_string);
        case TYPE::ModelInstance:
            return describeModel(*scalar->m_model);
        case TYPE::Array: {
            std::ostringstream ss;
            ss << '[';
            bool first = true;
            for (auto const& kv : m_array_map) {
                if (!first) ss << ",";
                first = false;
                ss << kv.second.dump();
            }
            ss << ']';
            return ss.str();
        }
        case TYPE::Object: {
            if (m_object_map.empty()) return std::string("{}");
            std::ostringstream ss;
            ss << '{';
            bool first = true;
            for (auto const& p : m_object_map) {
                if (!first) ss << ",";
                first = false;
                ss << escape_json_string(p.first) << ':' << p.second.dump();
            }
            ss << '}';
            return ss.str();
        }
    }
    return std::string();
}

inline std::ostream& operator<<(std::ostream& os, const Dictionary& d) {
    os << d.dump();
    return os;
}

}  // namespace mk
