#include "storage/predicate_eval.h"
#include "utils/datetime.h"

#include <cctype>
#include <cstdint>
#include <optional>

namespace trivium {

using json = nlohmann::json;
using query::RelationalOperator;

namespace {

char lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

template<typename T>
int threeWay(T l, T r) {
    return l < r ? -1 : (l > r ? 1 : 0);
}

// Ganzzahlen exakt (int64/uint64), sonst double
int numericOrdering(const json& left, const json& right) {
    if (left.is_number_integer() && right.is_number_integer()) {
        const bool lu = left.is_number_unsigned();
        const bool ru = right.is_number_unsigned();
        if (lu && ru) return threeWay(left.get<uint64_t>(), right.get<uint64_t>());
        if (!lu && !ru) return threeWay(left.get<int64_t>(), right.get<int64_t>());
        if (lu) {
            const int64_t r = right.get<int64_t>();
            return r < 0 ? 1 : threeWay(left.get<uint64_t>(), static_cast<uint64_t>(r));
        }
        const int64_t l = left.get<int64_t>();
        return l < 0 ? -1 : threeWay(static_cast<uint64_t>(l), right.get<uint64_t>());
    }
    return threeWay(left.get<double>(), right.get<double>());
}

// <0, 0, >0; nullopt wenn nicht vergleichbar
std::optional<int> ordering(const json& left, const json& right, bool temporal) {
    if (left.is_number() && right.is_number()) {
        return numericOrdering(left, right);
    }
    if (left.is_string() && right.is_string()) {
        const auto& ls = left.get_ref<const std::string&>();
        const auto& rs = right.get_ref<const std::string&>();
        if (temporal) {
            auto lt = utils::parseIso8601(ls);
            auto rt = utils::parseIso8601(rs);
            if (lt && rt) return threeWay(*lt, *rt);
        }
        return threeWay(ls.compare(rs), 0);
    }
    return std::nullopt;
}

bool equals(const json& left, const json& right, bool temporal) {
    if (left.is_number() && right.is_number()) {
        return numericOrdering(left, right) == 0;
    }
    if (temporal && left.is_string() && right.is_string()) {
        auto o = ordering(left, right, true);
        return o && *o == 0;
    }
    return left == right;
}

} // namespace

json PredicateEvaluator::resolve(const ObjectInstance& obj, const std::string& property) {
    if (property == meta::kId) return obj.id;
    if (property == meta::kWeight) return obj.weight;
    if (property == meta::kUpsertDate) return utils::formatIso8601(obj.upsert_date_ms);
    if (!obj.properties.is_object()) return nullptr;
    auto it = obj.properties.find(property);
    if (it == obj.properties.end()) return nullptr;
    return *it;
}

bool PredicateEvaluator::isTemporal(const ObjectTypeDefinition* type, const std::string& property) {
    if (property == meta::kUpsertDate) return true;
    if (!type) return false;
    auto def = type->findProperty(property);
    return def && def->data_type == PropertyDataType::DATETIME;
}

bool PredicateEvaluator::matches(const ObjectInstance& obj, const query::RelationalFilter& filter,
                                 const ObjectTypeDefinition* type) {
    return compare(filter.op, resolve(obj, filter.property_name), filter.value,
                   isTemporal(type, filter.property_name));
}

bool PredicateEvaluator::matchesAll(const ObjectInstance& obj, const std::vector<query::RelationalFilter>& filters,
                                    const ObjectTypeDefinition* type) {
    for (const auto& f : filters) {
        if (!matches(obj, f, type)) return false;
    }
    return true;
}

bool PredicateEvaluator::compare(RelationalOperator op, const json& left, const json& right, bool temporal) {
    if (left.is_null()) {
        return op == RelationalOperator::Eq && right.is_null();
    }
    if (right.is_null()) {
        return op == RelationalOperator::Neq;
    }

    switch (op) {
        case RelationalOperator::Eq:
            return equals(left, right, temporal);
        case RelationalOperator::Neq:
            return !equals(left, right, temporal);
        case RelationalOperator::Gt:
        case RelationalOperator::Gte:
        case RelationalOperator::Lt:
        case RelationalOperator::Lte: {
            auto o = ordering(left, right, temporal);
            if (!o) return false; // Typkonflikt
            if (op == RelationalOperator::Gt) return *o > 0;
            if (op == RelationalOperator::Gte) return *o >= 0;
            if (op == RelationalOperator::Lt) return *o < 0;
            return *o <= 0;
        }
        case RelationalOperator::Contains:
        case RelationalOperator::Like:
        case RelationalOperator::StartsWith:
        case RelationalOperator::EndsWith: {
            if (!left.is_string() || !right.is_string()) return false;
            const auto& text = left.get_ref<const std::string&>();
            const auto& pat = right.get_ref<const std::string&>();
            if (op == RelationalOperator::Contains) return text.find(pat) != std::string::npos;
            if (op == RelationalOperator::StartsWith) return std::string_view(text).starts_with(pat);
            if (op == RelationalOperator::EndsWith) return std::string_view(text).ends_with(pat);
            return likeMatch(text, pat);
        }
        case RelationalOperator::In: {
            if (!right.is_array()) return false;
            for (const auto& candidate : right) {
                if (equals(left, candidate, temporal)) return true;
            }
            return false;
        }
    }
    return false;
}

bool PredicateEvaluator::likeMatch(std::string_view text, std::string_view pattern) {
    size_t t = 0, p = 0;
    size_t starP = std::string_view::npos, starT = 0;
    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '_' || lower(pattern[p]) == lower(text[t]))) {
            ++t;
            ++p;
        } else if (p < pattern.size() && pattern[p] == '%') {
            starP = p++;
            starT = t;
        } else if (starP != std::string_view::npos) {
            p = starP + 1;
            t = ++starT;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '%') ++p;
    return p == pattern.size();
}

} // namespace trivium
