#include "builtins.hpp"

#include <algorithm>
#include <ostream>

BuiltinRegistry& BuiltinRegistry::add(const std::string& name, NativeFn fn) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
        [&](const Entry& e) { return e.name == name; });
    if (it != entries_.end()) {
        it->fn = std::move(fn);
    } else {
        entries_.push_back(Entry{name, std::move(fn)});
    }
    return *this;
}

bool BuiltinRegistry::contains(const std::string& name) const {
    return std::any_of(entries_.begin(), entries_.end(),
        [&](const Entry& e) { return e.name == name; });
}

BuiltinRegistry default_builtins(std::ostream& out) {
    BuiltinRegistry registry;

    // `out` must outlive every evaluator built from this registry
    std::ostream* sink = &out;
    registry.add("print", [sink](const std::vector<Value>& args, EnvPtr) -> Value {
        for (const auto& a : args) {
            *sink << Evaluator::value_to_string(a) << "\n";
        }
        sink->flush();
        return std::monostate{};
    });

    registry.add("time", [](const std::vector<Value>&, EnvPtr) -> Value {
        return std::int64_t{0};
    });

    return registry;
}
