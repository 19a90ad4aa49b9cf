#pragma once

#include <cassert>
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace nbimport {

// Value types (unboxed - stored directly in Value)
using Int = int64_t;
using Float = double;
using Bool = bool;

// Heap-backed value kinds
struct FunctionObject;
struct BuiltinFunction;
class ModuleObject;

#define NB_ASSERT(cond, msg) assert((cond) && (msg))

class Value {
public:
    // Value variants
    enum class Type : uint8_t {
        Null,
        Bool,
        Int,
        Float,
        String,
        Function,   // Script function
        Builtin,    // Native function
        Module      // Imported module
    };

private:
    using Ref = std::variant<std::monostate,
                             std::string,
                             std::shared_ptr<FunctionObject>,
                             std::shared_ptr<BuiltinFunction>,
                             std::shared_ptr<ModuleObject>>;

    Type type_{Type::Null};

    union {
        Bool bool_val;
        Int int_val;
        Float float_val;
    } data_{.int_val = 0};

    Ref ref_;

public:
    // Constructors
    Value() : type_(Type::Null) {}

    static Value null() { return Value(); }

    static Value from_bool(Bool b) {
        Value v;
        v.type_ = Type::Bool;
        v.data_.bool_val = b;
        return v;
    }

    static Value from_int(Int i) {
        Value v;
        v.type_ = Type::Int;
        v.data_.int_val = i;
        return v;
    }

    static Value from_float(Float f) {
        Value v;
        v.type_ = Type::Float;
        v.data_.float_val = f;
        return v;
    }

    static Value from_string(std::string s) {
        Value v;
        v.type_ = Type::String;
        v.ref_ = std::move(s);
        return v;
    }

    static Value from_function(std::shared_ptr<FunctionObject> fn) {
        Value v;
        v.type_ = Type::Function;
        v.ref_ = std::move(fn);
        return v;
    }

    static Value from_builtin(std::shared_ptr<BuiltinFunction> fn) {
        Value v;
        v.type_ = Type::Builtin;
        v.ref_ = std::move(fn);
        return v;
    }

    static Value from_module(std::shared_ptr<ModuleObject> module) {
        Value v;
        v.type_ = Type::Module;
        v.ref_ = std::move(module);
        return v;
    }

    // Type checking
    bool is_null() const { return type_ == Type::Null; }
    bool is_bool() const { return type_ == Type::Bool; }
    bool is_int() const { return type_ == Type::Int; }
    bool is_float() const { return type_ == Type::Float; }
    bool is_number() const { return is_int() || is_float(); }
    bool is_string() const { return type_ == Type::String; }
    bool is_function() const { return type_ == Type::Function; }
    bool is_builtin() const { return type_ == Type::Builtin; }
    bool is_callable() const { return is_function() || is_builtin(); }
    bool is_module() const { return type_ == Type::Module; }

    Type type() const { return type_; }
    const char* type_name() const;

    // Value access (with assertions)
    Bool as_bool() const {
        NB_ASSERT(is_bool(), "Value is not a bool");
        return data_.bool_val;
    }

    Int as_int() const {
        NB_ASSERT(is_int(), "Value is not an int");
        return data_.int_val;
    }

    Float as_float() const {
        NB_ASSERT(is_float(), "Value is not a float");
        return data_.float_val;
    }

    // Int or Float widened to Float
    Float as_number() const {
        NB_ASSERT(is_number(), "Value is not a number");
        return is_int() ? static_cast<Float>(data_.int_val) : data_.float_val;
    }

    const std::string& as_string() const {
        NB_ASSERT(is_string(), "Value is not a string");
        return std::get<std::string>(ref_);
    }

    const std::shared_ptr<FunctionObject>& as_function() const {
        NB_ASSERT(is_function(), "Value is not a function");
        return std::get<std::shared_ptr<FunctionObject>>(ref_);
    }

    const std::shared_ptr<BuiltinFunction>& as_builtin() const {
        NB_ASSERT(is_builtin(), "Value is not a builtin");
        return std::get<std::shared_ptr<BuiltinFunction>>(ref_);
    }

    const std::shared_ptr<ModuleObject>& as_module() const {
        NB_ASSERT(is_module(), "Value is not a module");
        return std::get<std::shared_ptr<ModuleObject>>(ref_);
    }

    bool is_truthy() const;

    // Conversion to string (strings are returned unquoted)
    std::string to_string() const;

    // Source-like rendering (strings are quoted)
    std::string repr() const;

    // Equality
    bool equals(const Value& other) const;
};

// ============================================================
//  Namespace
// ============================================================

// Mutable identifier -> value mapping. A module's bindings, the shell's
// user namespace and a function's globals are all Namespaces.
class Namespace {
public:
    explicit Namespace(std::string name = {}) : name_(std::move(name)) {}

    const std::string& name() const { return name_; }

    bool contains(const std::string& key) const;
    const Value* find(const std::string& key) const;

    // Binds `key` as a variable. The interpreter rejects assignment to
    // constants before it gets here.
    void set(const std::string& key, Value value);
    void define_constant(const std::string& key, Value value);
    bool is_constant(const std::string& key) const;

    bool erase(const std::string& key);
    void clear();

    std::vector<std::string> names() const;
    size_t size() const { return bindings_.size(); }
    bool empty() const { return bindings_.empty(); }

private:
    std::string name_;
    std::map<std::string, Value> bindings_;
    std::set<std::string> constants_;
};

using NamespacePtr = std::shared_ptr<Namespace>;

} // namespace nbimport
