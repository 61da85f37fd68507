#ifndef __PROJECTS_JDIFF_SRC_PROJECTOR_HPP_
#define __PROJECTS_JDIFF_SRC_PROJECTOR_HPP_

#include <json/value.h>

#include <functional>

#include "delta.hpp"

namespace jdiff {

/**
 * Per-node policy for project().
 *
 * Returns true and fills `out` to replace the delta node with a document
 * node. Returns false to decline; the projector then recurses into List and
 * Map deltas and drops every other kind.
 */
typedef std::function<bool(const Delta &delta, Json::Value &out)> DeltaFilter;

/**
 * Folds a delta into a plain document.
 *
 * Returns false when the projection is absent. Absent list items and map
 * members are dropped, and a container whose children are all absent is
 * itself absent. An absent result is different from a present null.
 */
bool project(const Delta &delta, const DeltaFilter &filter, Json::Value &out);

// Same as project(), with an absent result rendered as null.
Json::Value project_document(const Delta &delta, const DeltaFilter &filter);

// Keeps Equal(v) as v.
DeltaFilter equal_filter();

// Differences seen from the first document: [v1, v2] pairs and
// MissingInSecond values.
DeltaFilter diff_ab_filter();

// Differences seen from the second document: [v2, v1] pairs and
// MissingInFirst values.
DeltaFilter diff_ba_filter();

struct Projections {
    Json::Value equal;
    Json::Value diff_ab;
    Json::Value diff_ba;
};

Projections project_all(const Delta &delta);

}  // namespace jdiff

#endif  // __PROJECTS_JDIFF_SRC_PROJECTOR_HPP_
