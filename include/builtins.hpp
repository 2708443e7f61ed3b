#pragma once
#include <iosfwd>
#include <string>
#include <vector>

#include "evaluator.hpp"

// Ordered set of native functions seeded as constants into an evaluator's
// global scope. Later entries with the same name replace earlier ones.
class BuiltinRegistry {
   public:
    struct Entry {
        std::string name;
        NativeFn fn;
    };

    BuiltinRegistry& add(const std::string& name, NativeFn fn);
    bool contains(const std::string& name) const;

    const std::vector<Entry>& entries() const { return entries_; }

   private:
    std::vector<Entry> entries_;
};

// print(args...) writes each argument's display form on its own line to `out`;
// time() is a placeholder clock that always returns 0.
BuiltinRegistry default_builtins(std::ostream& out);
