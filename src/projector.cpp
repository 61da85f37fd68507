#include "projector.hpp"

#include <string>

namespace jdiff {

namespace {

Json::Value make_pair(const Json::Value &first, const Json::Value &second) {
    Json::Value pair = Json::arrayValue;
    pair.append(first);
    pair.append(second);
    return pair;
}

bool project_list(const Delta &delta, const DeltaFilter &filter, Json::Value &out) {
    Json::Value list = Json::arrayValue;
    for (const Delta &item : delta.items()) {
        Json::Value item_out;
        if (project(item, filter, item_out)) {
            list.append(item_out);
        }
    }
    if (list.empty()) {
        return false;
    }
    out = list;
    return true;
}

bool project_map(const Delta &delta, const DeltaFilter &filter, Json::Value &out) {
    Json::Value map = Json::objectValue;
    for (const auto &member : delta.members()) {
        Json::Value member_out;
        if (project(member.second, filter, member_out)) {
            map[member.first] = member_out;
        }
    }
    if (map.empty()) {
        return false;
    }
    out = map;
    return true;
}

}  // namespace

bool project(const Delta &delta, const DeltaFilter &filter, Json::Value &out) {
    if (filter && filter(delta, out)) {
        return true;
    }

    switch (delta.kind()) {
        case DeltaKind::List:
            return project_list(delta, filter, out);
        case DeltaKind::Map:
            return project_map(delta, filter, out);
        default:
            return false;
    }
}

Json::Value project_document(const Delta &delta, const DeltaFilter &filter) {
    Json::Value out;
    if (!project(delta, filter, out)) {
        return Json::Value(Json::nullValue);
    }
    return out;
}

DeltaFilter equal_filter() {
    return [](const Delta &delta, Json::Value &out) {
        if (delta.kind() != DeltaKind::Equal) return false;
        out = *delta.first();
        return true;
    };
}

DeltaFilter diff_ab_filter() {
    return [](const Delta &delta, Json::Value &out) {
        switch (delta.kind()) {
            case DeltaKind::DifferentContent:
            case DeltaKind::DifferentVariant:
                out = make_pair(*delta.first(), *delta.second());
                return true;
            case DeltaKind::MissingInSecond:
                out = *delta.first();
                return true;
            default:
                return false;
        }
    };
}

DeltaFilter diff_ba_filter() {
    return [](const Delta &delta, Json::Value &out) {
        switch (delta.kind()) {
            case DeltaKind::DifferentContent:
            case DeltaKind::DifferentVariant:
                out = make_pair(*delta.second(), *delta.first());
                return true;
            case DeltaKind::MissingInFirst:
                out = *delta.second();
                return true;
            default:
                return false;
        }
    };
}

Projections project_all(const Delta &delta) {
    Projections projections;
    projections.equal = project_document(delta, equal_filter());
    projections.diff_ab = project_document(delta, diff_ab_filter());
    projections.diff_ba = project_document(delta, diff_ba_filter());
    return projections;
}

}  // namespace jdiff
