#ifndef __PROJECTS_JDIFF_SRC_DELTA_HPP_
#define __PROJECTS_JDIFF_SRC_DELTA_HPP_

#include <json/json.h>
#include <json/value.h>

#include <map>
#include <string>
#include <vector>

namespace jdiff {

enum class DeltaKind : char {
    Equal = 'E',
    DifferentContent = 'C',
    DifferentVariant = 'V',
    MissingInSecond = '2',
    MissingInFirst = '1',
    List = 'L',
    Map = 'M',
};

enum class NodeKind {
    Null,
    Boolean,
    Number,
    String,
    List,
    Map,
};

NodeKind node_kind(const Json::Value &node);

const char *kind_name(DeltaKind kind);

/**
 * Relationship between two documents at one position.
 *
 * E: Equal               (first)
 * C: DifferentContent    (first, second)
 * V: DifferentVariant    (first, second)
 * 2: MissingInSecond     (first)
 * 1: MissingInFirst      (second)
 * L: List                (items)
 * M: Map                 (members)
 *
 * Leaf deltas point into the compared documents, so a Delta must not
 * outlive either of them.
 */
class Delta {
   public:
    typedef std::vector<Delta> Items;
    typedef std::map<std::string, Delta> Members;

    static Delta equal(const Json::Value &node);
    static Delta different_content(const Json::Value &first, const Json::Value &second);
    static Delta different_variant(const Json::Value &first, const Json::Value &second);
    static Delta missing_in_second(const Json::Value &first);
    static Delta missing_in_first(const Json::Value &second);
    static Delta list(Items items);
    static Delta map(Members members);

    DeltaKind kind() const { return kind_; }
    bool is_leaf() const { return kind_ != DeltaKind::List && kind_ != DeltaKind::Map; }

    // nullptr when this kind carries no node from that side
    const Json::Value *first() const { return first_; }
    const Json::Value *second() const { return second_; }

    const Items &items() const { return items_; }
    const Members &members() const { return members_; }

   private:
    Delta(DeltaKind kind, const Json::Value *first, const Json::Value *second)
        : kind_(kind), first_(first), second_(second) {}

    DeltaKind kind_;
    const Json::Value *first_;
    const Json::Value *second_;
    Items items_;
    Members members_;
};

struct DeltaStats {
    int equal = 0;
    int different_content = 0;
    int different_variant = 0;
    int missing_in_second = 0;
    int missing_in_first = 0;

    int total() const {
        return equal + different_content + different_variant + missing_in_second + missing_in_first;
    }
};

Delta compare(const Json::Value &first, const Json::Value &second);

DeltaStats count_leaves(const Delta &delta);

Json::Value to_json(const Delta &delta);

}  // namespace jdiff

#endif  // __PROJECTS_JDIFF_SRC_DELTA_HPP_
