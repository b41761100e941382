//
// Pass 3: Flatten
//
// Normalizes operand lists of unions and intersections bottom-up.
//

#include <typeshape/passes.hh>
#include <typeshape/ir_utils.hh>
#include <algorithm>

namespace typeshape::passes {

namespace {
    void append_unique(std::vector<ir::type>& members, const ir::type& t) {
        if (std::find(members.begin(), members.end(), t) == members.end()) {
            members.push_back(t);
        }
    }

    ir::type flatten_union(const std::vector<ir::type>& operands) {
        std::vector<ir::type> members;
        for (const auto& op : operands) {
            if (op.is<ir::failed_intersection>()) {
                continue;
            }
            if (const auto* nested = op.as<ir::union_type>()) {
                for (const auto& m : nested->members) {
                    append_unique(members, m);
                }
            } else {
                append_unique(members, op);
            }
        }

        if (members.empty()) {
            return ir::make_failed_intersection();
        }
        if (members.size() == 1) {
            return members.front();
        }
        return ir::make_union(std::move(members));
    }

    ir::type flatten_intersection(const std::vector<ir::type>& operands) {
        std::vector<ir::type> members;
        for (const auto& op : operands) {
            if (op.is<ir::failed_intersection>()) {
                return ir::make_failed_intersection();
            }
            if (const auto* nested = op.as<ir::intersection>()) {
                for (const auto& m : nested->members) {
                    append_unique(members, m);
                }
            } else {
                append_unique(members, op);
            }
        }

        if (members.size() == 1) {
            return members.front();
        }

        // A & (B | C) -> (A & B) | (A & C)
        auto union_it = std::find_if(members.begin(), members.end(),
            [](const ir::type& m) { return m.is<ir::union_type>(); });
        if (union_it != members.end()) {
            const auto alternatives = union_it->as<ir::union_type>()->members;
            std::vector<ir::type> branches;
            branches.reserve(alternatives.size());
            for (const auto& alt : alternatives) {
                std::vector<ir::type> branch;
                for (const auto& m : members) {
                    branch.push_back(&m == &*union_it ? alt : m);
                }
                branches.push_back(flatten_intersection(branch));
            }
            return flatten_union(branches);
        }

        return ir::make_intersection(std::move(members));
    }
}

ir::type flatten(const ir::type& t) {
    ir::type mapped = ir::map_children(t, [](const ir::type& child) { return flatten(child); });

    if (const auto* u = mapped.as<ir::union_type>()) {
        return flatten_union(u->members);
    }
    if (const auto* n = mapped.as<ir::intersection>()) {
        return flatten_intersection(n->members);
    }
    return mapped;
}

} // namespace typeshape::passes
