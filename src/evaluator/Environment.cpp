// src/evaluator/Environment.cpp
#include "MicaError.hpp"
#include "evaluator.hpp"

// ----------------- Environment methods -----------------

Value Environment::declare(const std::string& name, const Value& value, bool is_constant) {
    if (values.find(name) != values.end()) {
        throw EnvError(EnvError::Kind::RedeclareVariable, name);
    }
    Variable var;
    var.value = value;
    var.is_constant = is_constant;
    values[name] = var;
    return value;
}

Value Environment::assign(const std::string& name, const Value& value) {
    Environment* owner = resolve(name);
    if (!owner) {
        throw EnvError(EnvError::Kind::VariableNotFound, name);
    }
    Variable& var = owner->values.at(name);
    if (var.is_constant) {
        throw EnvError(EnvError::Kind::ReassignVariable, name);
    }
    var.value = value;
    return value;
}

Value Environment::lookup(const std::string& name) const {
    const Environment* owner = resolve(name);
    if (!owner) {
        throw EnvError(EnvError::Kind::VariableNotFound, name);
    }
    return owner->values.at(name).value;
}

Environment* Environment::resolve(const std::string& name) {
    Environment* env = this;
    while (env) {
        if (env->values.find(name) != env->values.end()) return env;
        env = env->parent.get();
    }
    return nullptr;
}

const Environment* Environment::resolve(const std::string& name) const {
    const Environment* env = this;
    while (env) {
        if (env->values.find(name) != env->values.end()) return env;
        env = env->parent.get();
    }
    return nullptr;
}

bool Environment::has(const std::string& name) const {
    return resolve(name) != nullptr;
}
