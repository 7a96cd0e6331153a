// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/rules/Criterion.h"

#include "rankflow/filter/Filter.h"
#include "rankflow/index/IndexSource.h"
#include "rankflow/search/graph/AttributeGraph.h"
#include "rankflow/search/graph/ExactnessGraph.h"
#include "rankflow/search/graph/FidGraph.h"
#include "rankflow/search/graph/PositionGraph.h"
#include "rankflow/search/graph/ProximityGraph.h"
#include "rankflow/search/graph/TypoGraph.h"
#include "rankflow/search/graph/WordsGraph.h"
#include "rankflow/search/rules/Boost.h"
#include "rankflow/search/rules/ExactAttribute.h"
#include "rankflow/search/rules/GraphBasedRankingRule.h"
#include "rankflow/search/rules/Sort.h"
#include "rankflow/util/Exceptions.h"

#include <algorithm>
#include <optional>
#include <utility>

namespace rankflow {
namespace search {

namespace {

constexpr const char* BOOST_PREFIX = "boost:";
constexpr const char* ASC_SUFFIX = ":asc";
constexpr const char* DESC_SUFFIX = ":desc";

template<typename G>
std::unique_ptr<RankingRule> graphRule(std::optional<TermsMatchingStrategy> strategy = {}) {
    return std::make_unique<GraphBasedRankingRule<G>>(G::NAME, strategy);
}

bool usesQueryGraph(Criterion::Kind kind) {
    switch (kind) {
        case Criterion::Kind::Boost:
        case Criterion::Kind::Sort:
        case Criterion::Kind::Asc:
        case Criterion::Kind::Desc: return false;
        default: return true;
    }
}

// Text before suffix, or nullopt when text does not end with it
std::optional<std::string> fieldBefore(const std::string& text, const char* suffix) {
    const size_t length = std::char_traits<char>::length(suffix);
    if (text.size() <= length || text.compare(text.size() - length, length, suffix) != 0) {
        return std::nullopt;
    }
    return text.substr(0, text.size() - length);
}

std::optional<Criterion> parseAscDesc(const std::string& text) {
    if (auto field = fieldBefore(text, ASC_SUFFIX)) {
        return Criterion{Criterion::Kind::Asc, {}, std::move(*field)};
    }
    if (auto field = fieldBefore(text, DESC_SUFFIX)) {
        return Criterion{Criterion::Kind::Desc, {}, std::move(*field)};
    }
    return std::nullopt;
}

std::string joined(const std::vector<std::string>& names) {
    std::string result;
    for (const auto& name : names) {
        if (!result.empty()) {
            result += ", ";
        }
        result += name;
    }
    return result;
}

void pushSortRule(std::vector<std::unique_ptr<RankingRule>>& rules,
                  std::vector<std::string>& sortedFields, const Criterion& criterion) {
    if (std::find(sortedFields.begin(), sortedFields.end(), criterion.field) !=
        sortedFields.end()) {
        return;
    }
    sortedFields.push_back(criterion.field);
    rules.push_back(
        std::make_unique<SortRule>(criterion.field, criterion.kind == Criterion::Kind::Asc));
}

}  // namespace

Criterion Criterion::parse(const std::string& name) {
    static const std::pair<const char*, Kind> NAMES[] = {
        {"words", Kind::Words},         {"typo", Kind::Typo},
        {"proximity", Kind::Proximity}, {"attribute", Kind::Attribute},
        {"fid", Kind::Fid},             {"position", Kind::Position},
        {"exactness", Kind::Exactness}, {"sort", Kind::Sort},
    };
    for (const auto& [text, kind] : NAMES) {
        if (name == text) {
            return Criterion{kind, {}, {}};
        }
    }
    if (name.rfind(BOOST_PREFIX, 0) == 0) {
        return Criterion{Kind::Boost, name.substr(std::char_traits<char>::length(BOOST_PREFIX)),
                         {}};
    }
    if (auto ascDesc = parseAscDesc(name)) {
        return *ascDesc;
    }
    throw UserException(UserErrorCode::InvalidRankingRule,
                        "`" + name +
                            "` ranking rule is invalid. Valid ranking rules are words, typo, "
                            "proximity, attribute, fid, position, exactness, sort, "
                            "boost:<filter>, <field>:asc and <field>:desc.");
}

Criterion Criterion::parseSort(const std::string& text) {
    if (auto ascDesc = parseAscDesc(text)) {
        return *ascDesc;
    }
    throw UserException(UserErrorCode::InvalidSort,
                        "Invalid syntax for the sort parameter: expected expression ending by "
                        "`:asc` or `:desc`, found `" +
                            text + "`.");
}

std::string Criterion::name() const {
    switch (kind) {
        case Kind::Words: return "words";
        case Kind::Typo: return "typo";
        case Kind::Proximity: return "proximity";
        case Kind::Attribute: return "attribute";
        case Kind::Fid: return "fid";
        case Kind::Position: return "position";
        case Kind::Exactness: return "exactness";
        case Kind::Boost: return BOOST_PREFIX + filter;
        case Kind::Sort: return "sort";
        case Kind::Asc: return field + ASC_SUFFIX;
        case Kind::Desc: return field + DESC_SUFFIX;
    }
    return "";
}

std::vector<Criterion> defaultCriteria() {
    return {
        Criterion{Criterion::Kind::Words, {}, {}},
        Criterion{Criterion::Kind::Typo, {}, {}},
        Criterion{Criterion::Kind::Proximity, {}, {}},
        Criterion{Criterion::Kind::Attribute, {}, {}},
        Criterion{Criterion::Kind::Sort, {}, {}},
        Criterion{Criterion::Kind::Exactness, {}, {}},
    };
}

void validateSort(const std::vector<Criterion>& criteria, const std::vector<Criterion>& sort,
                  const index::IndexSource& index) {
    const bool sortListed = std::any_of(criteria.begin(), criteria.end(), [](const Criterion& c) {
        return c.kind == Criterion::Kind::Sort;
    });
    if (!sort.empty() && !sortListed) {
        throw UserException(UserErrorCode::InvalidSort,
                            "The sort ranking rule must be specified in the ranking rules to use "
                            "the sort parameter at search time.");
    }

    const std::vector<std::string> sortable = index.sortableFields();
    auto check = [&sortable](const Criterion& criterion) {
        if (criterion.kind != Criterion::Kind::Asc && criterion.kind != Criterion::Kind::Desc) {
            return;
        }
        if (std::find(sortable.begin(), sortable.end(), criterion.field) == sortable.end()) {
            throw UserException(UserErrorCode::InvalidSort,
                                "Attribute `" + criterion.field +
                                    "` is not sortable. Available sortable attributes are: `" +
                                    joined(sortable) + "`.");
        }
    };
    std::for_each(criteria.begin(), criteria.end(), check);
    std::for_each(sort.begin(), sort.end(), check);
}

std::vector<std::unique_ptr<RankingRule>> buildRankingRules(const std::vector<Criterion>& criteria,
                                                            const std::vector<Criterion>& sort,
                                                            TermsMatchingStrategy strategy,
                                                            bool placeholder) {
    std::vector<std::unique_ptr<RankingRule>> rules;
    std::vector<Criterion> seen;
    std::vector<std::string> sortedFields;
    bool words = strategy == TermsMatchingStrategy::All;

    for (const Criterion& criterion : criteria) {
        if (std::find(seen.begin(), seen.end(), criterion) != seen.end()) {
            continue;
        }
        seen.push_back(criterion);
        if (placeholder && usesQueryGraph(criterion.kind)) {
            continue;
        }
        if (usesQueryGraph(criterion.kind) && !words) {
            rules.push_back(graphRule<WordsGraph>(strategy));
            words = true;
        }

        switch (criterion.kind) {
            case Criterion::Kind::Words: break;
            case Criterion::Kind::Typo: rules.push_back(graphRule<TypoGraph>()); break;
            case Criterion::Kind::Proximity: rules.push_back(graphRule<ProximityGraph>()); break;
            case Criterion::Kind::Attribute:
                rules.push_back(graphRule<AttributeGraph>());
                if (std::find(seen.begin(), seen.end(),
                              Criterion{Criterion::Kind::Fid, {}, {}}) == seen.end()) {
                    rules.push_back(graphRule<FidGraph>());
                    seen.push_back(Criterion{Criterion::Kind::Fid, {}, {}});
                }
                if (std::find(seen.begin(), seen.end(),
                              Criterion{Criterion::Kind::Position, {}, {}}) == seen.end()) {
                    rules.push_back(graphRule<PositionGraph>());
                    seen.push_back(Criterion{Criterion::Kind::Position, {}, {}});
                }
                break;
            case Criterion::Kind::Fid: rules.push_back(graphRule<FidGraph>()); break;
            case Criterion::Kind::Position: rules.push_back(graphRule<PositionGraph>()); break;
            case Criterion::Kind::Exactness:
                rules.push_back(std::make_unique<ExactAttributeRule>());
                rules.push_back(graphRule<ExactnessGraph>());
                break;
            case Criterion::Kind::Sort:
                for (const Criterion& entry : sort) {
                    pushSortRule(rules, sortedFields, entry);
                }
                break;
            case Criterion::Kind::Asc:
            case Criterion::Kind::Desc: pushSortRule(rules, sortedFields, criterion); break;
            case Criterion::Kind::Boost: {
                auto filter = filter::Filter::fromString(criterion.filter);
                if (!filter) {
                    throw FilterParseException("Boost filter is empty", 0);
                }
                rules.push_back(std::make_unique<BoostRule>(std::move(*filter)));
                break;
            }
        }
    }
    return rules;
}

}  // namespace search
}  // namespace rankflow
