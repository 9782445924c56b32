#include "fingrid/formula/FunctionLibrary.hpp"
#include "fingrid/utils/ModuleLoggers.hpp"
#include "fingrid/utils/TextUtils.hpp"
#include <algorithm>

namespace fingrid {
namespace formula {

const char* familyName(FunctionFamily family) noexcept {
    switch (family) {
        case FunctionFamily::Math:        return "math";
        case FunctionFamily::Statistical: return "statistical";
        case FunctionFamily::Financial:   return "financial";
        case FunctionFamily::Venture:     return "venture";
        case FunctionFamily::Logical:     return "logical";
        case FunctionFamily::Text:        return "text";
        case FunctionFamily::Date:        return "date";
        case FunctionFamily::Lookup:      return "lookup";
    }
    return "math";
}

const FunctionLibrary& FunctionLibrary::builtins() {
    static const FunctionLibrary library = [] {
        FunctionLibrary lib;
        registerMathFunctions(lib);
        registerStatisticalFunctions(lib);
        registerFinancialFunctions(lib);
        registerVentureFunctions(lib);
        registerLogicalFunctions(lib);
        registerTextFunctions(lib);
        registerDateFunctions(lib);
        registerLookupFunctions(lib);
        FORMULA_DEBUG("Function library initialized with {} functions", lib.size());
        return lib;
    }();
    return library;
}

void FunctionLibrary::add(const std::string& name, FunctionFamily family, size_t min_args, size_t max_args,
                          FunctionImpl impl) {
    FunctionSpec spec;
    spec.name = utils::TextUtils::toUpper(name);
    spec.family = family;
    spec.min_args = min_args;
    spec.max_args = max_args;
    spec.impl = std::move(impl);

    auto key = spec.name;
    if (functions_.count(key) != 0) {
        FORMULA_WARN("Function {} registered twice, replacing", key);
    }
    functions_[key] = std::move(spec);
}

const FunctionSpec* FunctionLibrary::find(std::string_view name) const {
    auto it = functions_.find(utils::TextUtils::toUpper(std::string(name)));
    return it != functions_.end() ? &it->second : nullptr;
}

std::vector<std::string> FunctionLibrary::names(FunctionFamily family) const {
    std::vector<std::string> result;
    for (const auto& [name, spec] : functions_) {
        if (spec.family == family) {
            result.push_back(name);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

}} // namespace fingrid::formula
