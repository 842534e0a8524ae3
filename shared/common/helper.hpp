#pragma once

#include <cxxabi.h>
#include <cstdlib>
#include <optional>
#include <string>

inline std::string demangle(const char* name) {
    int status = 0;
    char* demangled = abi::__cxa_demangle(name, nullptr, nullptr, &status);
    std::string result = (status == 0 && demangled) ? demangled : name;
    std::free(demangled);
    return result;
}

// "<unnamed>" for the null name, quoted otherwise
inline std::string describeName(const std::optional<std::string>& name) {
    if (!name.has_value()) return "<unnamed>";
    return "'" + *name + "'";
}
