//src/evaluator/Environment.cpp
#include "SoorjError.hpp"
#include "evaluator.hpp"

// ----------------- Environment methods -----------------

Value* Environment::find(const std::string& name) {
    // iterative walk: chains get as deep as the call depth
    for (Environment* e = this; e; e = e->parent.get()) {
        auto it = e->values.find(name);
        if (it != e->values.end()) return &it->second;
    }
    return nullptr;
}

Value& Environment::get(const std::string& name, const Token& tok) {
    Value* v = find(name);
    if (!v) {
        throw SoorjError(ErrorKind::NameError, "Undefined variable '" + name + "'", tok.loc);
    }
    return *v;
}

void Environment::set(const std::string& name, const Value& value) {
    values[name] = value;
}

Environment* Environment::assign(const std::string& name, const Value& value) {
    for (Environment* e = this; e; e = e->parent.get()) {
        auto it = e->values.find(name);
        if (it != e->values.end()) {
            it->second = value;
            return e;
        }
    }
    // no binding anywhere: create in the innermost frame
    values[name] = value;
    return this;
}
