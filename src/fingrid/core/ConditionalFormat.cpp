#include "fingrid/core/ConditionalFormat.hpp"

namespace fingrid {
namespace core {

namespace {

struct KindName {
    ConditionKind kind;
    const char* name;
};

constexpr KindName kKindNames[] = {
    {ConditionKind::Equals, "equals"},
    {ConditionKind::Greater, "greaterThan"},
    {ConditionKind::Less, "lessThan"},
    {ConditionKind::Between, "between"},
    {ConditionKind::Contains, "contains"},
    {ConditionKind::Duplicate, "duplicate"},
    {ConditionKind::Unique, "unique"}
};

} // namespace

const char* conditionKindName(ConditionKind kind) noexcept {
    for (const auto& entry : kKindNames) {
        if (entry.kind == kind) {
            return entry.name;
        }
    }
    return "equals";
}

std::optional<ConditionKind> parseConditionKind(const std::string& name) noexcept {
    for (const auto& entry : kKindNames) {
        if (name == entry.name) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

}} // namespace fingrid::core
