#include "delta.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace jdiff {

NodeKind node_kind(const Json::Value &node) {
    switch (node.type()) {
        case Json::ValueType::nullValue:
            return NodeKind::Null;
        case Json::ValueType::booleanValue:
            return NodeKind::Boolean;
        case Json::ValueType::intValue:
        case Json::ValueType::uintValue:
        case Json::ValueType::realValue:
            return NodeKind::Number;
        case Json::ValueType::stringValue:
            return NodeKind::String;
        case Json::ValueType::arrayValue:
            return NodeKind::List;
        case Json::ValueType::objectValue:
            return NodeKind::Map;
    }
    return NodeKind::Null;
}

const char *kind_name(DeltaKind kind) {
    switch (kind) {
        case DeltaKind::Equal:
            return "Equal";
        case DeltaKind::DifferentContent:
            return "DifferentContent";
        case DeltaKind::DifferentVariant:
            return "DifferentVariant";
        case DeltaKind::MissingInSecond:
            return "MissingInSecond";
        case DeltaKind::MissingInFirst:
            return "MissingInFirst";
        case DeltaKind::List:
            return "List";
        case DeltaKind::Map:
            return "Map";
    }
    return "Unknown";
}

Delta Delta::equal(const Json::Value &node) {
    return Delta(DeltaKind::Equal, &node, nullptr);
}

Delta Delta::different_content(const Json::Value &first, const Json::Value &second) {
    return Delta(DeltaKind::DifferentContent, &first, &second);
}

Delta Delta::different_variant(const Json::Value &first, const Json::Value &second) {
    return Delta(DeltaKind::DifferentVariant, &first, &second);
}

Delta Delta::missing_in_second(const Json::Value &first) {
    return Delta(DeltaKind::MissingInSecond, &first, nullptr);
}

Delta Delta::missing_in_first(const Json::Value &second) {
    return Delta(DeltaKind::MissingInFirst, nullptr, &second);
}

Delta Delta::list(Items items) {
    Delta delta(DeltaKind::List, nullptr, nullptr);
    delta.items_ = std::move(items);
    return delta;
}

Delta Delta::map(Members members) {
    Delta delta(DeltaKind::Map, nullptr, nullptr);
    delta.members_ = std::move(members);
    return delta;
}

namespace {

Delta compare_scalar(const Json::Value &first, const Json::Value &second) {
    if (first == second) {
        return Delta::equal(first);
    }
    return Delta::different_content(first, second);
}

Delta compare_list(const Json::Value &first, const Json::Value &second) {
    const Json::ArrayIndex first_length = first.size();
    const Json::ArrayIndex second_length = second.size();
    const Json::ArrayIndex min_length = std::min(first_length, second_length);

    Delta::Items items;
    items.reserve(std::max(first_length, second_length));

    Json::ArrayIndex i = 0;
    for (; i < min_length; i++) {
        items.push_back(compare(first[i], second[i]));
    }
    for (; i < first_length; i++) {
        items.push_back(Delta::missing_in_second(first[i]));
    }
    for (; i < second_length; i++) {
        items.push_back(Delta::missing_in_first(second[i]));
    }

    return Delta::list(std::move(items));
}

Delta compare_map(const Json::Value &first, const Json::Value &second) {
    Delta::Members members;

    for (Json::Value::const_iterator it = first.begin(); it != first.end(); ++it) {
        std::string key = it.name();
        const Json::Value *other = second.find(key.data(), key.data() + key.length());
        if (other != nullptr) {
            members.emplace(key, compare(*it, *other));
        } else {
            members.emplace(key, Delta::missing_in_second(*it));
        }
    }

    for (Json::Value::const_iterator it = second.begin(); it != second.end(); ++it) {
        std::string key = it.name();
        if (first.isMember(key)) continue;
        members.emplace(key, Delta::missing_in_first(*it));
    }

    return Delta::map(std::move(members));
}

void count_into(const Delta &delta, DeltaStats &stats) {
    switch (delta.kind()) {
        case DeltaKind::Equal:
            stats.equal++;
            break;
        case DeltaKind::DifferentContent:
            stats.different_content++;
            break;
        case DeltaKind::DifferentVariant:
            stats.different_variant++;
            break;
        case DeltaKind::MissingInSecond:
            stats.missing_in_second++;
            break;
        case DeltaKind::MissingInFirst:
            stats.missing_in_first++;
            break;
        case DeltaKind::List:
            for (const Delta &item : delta.items()) {
                count_into(item, stats);
            }
            break;
        case DeltaKind::Map:
            for (const auto &member : delta.members()) {
                count_into(member.second, stats);
            }
            break;
    }
}

Json::Value make_delta_json(DeltaKind kind) {
    Json::Value val;
    val["_t"] = std::string{static_cast<char>(kind)};
    return val;
}

}  // namespace

Delta compare(const Json::Value &first, const Json::Value &second) {
    const NodeKind first_kind = node_kind(first);
    const NodeKind second_kind = node_kind(second);

    if (first_kind != second_kind) {
        return Delta::different_variant(first, second);
    }

    switch (first_kind) {
        case NodeKind::Null:
            return Delta::equal(first);
        case NodeKind::Boolean:
        case NodeKind::Number:
        case NodeKind::String:
            return compare_scalar(first, second);
        case NodeKind::List:
            return compare_list(first, second);
        case NodeKind::Map:
            return compare_map(first, second);
    }

    return Delta::different_variant(first, second);
}

DeltaStats count_leaves(const Delta &delta) {
    DeltaStats stats;
    count_into(delta, stats);
    return stats;
}

Json::Value to_json(const Delta &delta) {
    Json::Value val = make_delta_json(delta.kind());

    switch (delta.kind()) {
        case DeltaKind::Equal:
        case DeltaKind::MissingInSecond:
            val["a"] = *delta.first();
            break;
        case DeltaKind::MissingInFirst:
            val["b"] = *delta.second();
            break;
        case DeltaKind::DifferentContent:
        case DeltaKind::DifferentVariant:
            val["a"] = *delta.first();
            val["b"] = *delta.second();
            break;
        case DeltaKind::List: {
            Json::Value items = Json::arrayValue;
            for (const Delta &item : delta.items()) {
                items.append(to_json(item));
            }
            val["items"] = items;
            break;
        }
        case DeltaKind::Map: {
            Json::Value members = Json::objectValue;
            for (const auto &member : delta.members()) {
                members[member.first] = to_json(member.second);
            }
            val["members"] = members;
            break;
        }
    }

    return val;
}

}  // namespace jdiff
