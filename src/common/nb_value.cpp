#include "pch.h"
#include "nb_value.hpp"
#include "nb_builtins.hpp"
#include "nb_interpreter.hpp"
#include "nb_module.hpp"

namespace nbimport {

// ---- Value ----

const char* Value::type_name() const {
    switch (type_) {
        case Type::Null:     return "Nil";
        case Type::Bool:     return "Bool";
        case Type::Int:      return "Int";
        case Type::Float:    return "Float";
        case Type::String:   return "String";
        case Type::Function: return "Function";
        case Type::Builtin:  return "Builtin";
        case Type::Module:   return "Module";
    }
    return "Unknown";
}

bool Value::is_truthy() const {
    switch (type_) {
        case Type::Null:   return false;
        case Type::Bool:   return data_.bool_val;
        case Type::Int:    return data_.int_val != 0;
        case Type::Float:  return data_.float_val != 0.0;
        case Type::String: return !as_string().empty();
        default:           return true;
    }
}

std::string Value::to_string() const {
    switch (type_) {
        case Type::Null:
            return "nil";
        case Type::Bool:
            return data_.bool_val ? "true" : "false";
        case Type::Int:
            return std::to_string(data_.int_val);
        case Type::Float: {
            std::ostringstream oss;
            oss << data_.float_val;
            std::string text = oss.str();
            // keep floats recognisable: 2.0 prints as "2.0", not "2"
            if (text.find_first_of(".eEn") == std::string::npos) {
                text += ".0";
            }
            return text;
        }
        case Type::String:
            return as_string();
        case Type::Function:
            return "<func " + as_function()->name + ">";
        case Type::Builtin:
            return "<builtin " + as_builtin()->name + ">";
        case Type::Module:
            return as_module()->to_string();
    }
    return "<unknown>";
}

std::string Value::repr() const {
    if (!is_string()) {
        return to_string();
    }
    std::string out = "\"";
    for (char c : as_string()) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default:   out += c; break;
        }
    }
    out += "\"";
    return out;
}

bool Value::equals(const Value& other) const {
    if (is_number() && other.is_number()) {
        if (is_int() && other.is_int()) {
            return data_.int_val == other.data_.int_val;
        }
        return as_number() == other.as_number();
    }
    if (type_ != other.type_) return false;

    switch (type_) {
        case Type::Null:     return true;
        case Type::Bool:     return data_.bool_val == other.data_.bool_val;
        case Type::String:   return as_string() == other.as_string();
        case Type::Function: return as_function() == other.as_function();
        case Type::Builtin:  return as_builtin() == other.as_builtin();
        case Type::Module:   return as_module() == other.as_module();
        default:             return false;
    }
}

// ---- Namespace ----

bool Namespace::contains(const std::string& key) const {
    return bindings_.find(key) != bindings_.end();
}

const Value* Namespace::find(const std::string& key) const {
    auto it = bindings_.find(key);
    return it != bindings_.end() ? &it->second : nullptr;
}

void Namespace::set(const std::string& key, Value value) {
    bindings_[key] = std::move(value);
    constants_.erase(key);
}

void Namespace::define_constant(const std::string& key, Value value) {
    bindings_[key] = std::move(value);
    constants_.insert(key);
}

bool Namespace::is_constant(const std::string& key) const {
    return constants_.find(key) != constants_.end();
}

bool Namespace::erase(const std::string& key) {
    constants_.erase(key);
    return bindings_.erase(key) > 0;
}

void Namespace::clear() {
    bindings_.clear();
    constants_.clear();
}

std::vector<std::string> Namespace::names() const {
    std::vector<std::string> result;
    result.reserve(bindings_.size());
    for (const auto& [key, _] : bindings_) {
        result.push_back(key);
    }
    return result;
}

} // namespace nbimport
