//
// Pass 4: Intersection solving
//
// Every intersection is reduced pairwise. Operands are dereferenced
// through the memo, classified into disjoint value categories and merged
// structurally when the categories agree.
//

#include <typeshape/passes.hh>
#include <typeshape/ir_utils.hh>
#include <typeshape/ir_printer.hh>
#include "pass_utils.hh"
#include <algorithm>
#include <utility>

namespace typeshape::passes {

namespace {
    bool references_key(const ir::type& t, const std::string& key) {
        return ir::contains_node(t, [&](const ir::type& n) {
            const auto* inst = n.as<ir::instantiated_type>();
            return inst && inst->key == key;
        });
    }

    const ir::property_signature* find_property(const ir::object_pattern& o, const std::string& key) {
        auto it = std::find_if(o.properties.begin(), o.properties.end(),
            [&](const ir::property_signature& p) { return p.key == key; });
        return it == o.properties.end() ? nullptr : &*it;
    }
}

intersection_solver::intersection_solver(const ir::instantiation_memo& memo, std::size_t max_depth)
    : memo_(memo)
    , max_depth_(max_depth)
{
}

// ============================================================================
// Tree walk
// ============================================================================

ir::type intersection_solver::solve(const ir::type& t) {
    ir::type mapped = ir::map_children(t, [this](const ir::type& child) { return solve(child); });

    if (const auto* n = mapped.as<ir::intersection>()) {
        return reduce(n->members);
    }
    if (const auto* u = mapped.as<ir::union_type>()) {
        return prune_union(u->members);
    }
    return mapped;
}

ir::type intersection_solver::reduce(const std::vector<ir::type>& members) {
    ir::type left = members.front();
    for (std::size_t i = 1; i < members.size(); ++i) {
        const ir::type& right = members[i];
        if (left.is<ir::failed_intersection>() || right.is<ir::failed_intersection>()) {
            return ir::make_failed_intersection();
        }
        left = intersect(left, right);
        if (left.is<ir::failed_intersection>()) {
            return left;
        }
    }
    return left;
}

ir::type intersection_solver::prune_union(const std::vector<ir::type>& members) {
    std::vector<ir::type> kept;
    for (const auto& m : members) {
        if (!m.is<ir::failed_intersection>()) {
            kept.push_back(m);
        }
    }

    if (kept.empty()) {
        return ir::make_failed_intersection();
    }
    if (kept.size() == 1) {
        return kept.front();
    }
    // Solved members may themselves be unions now
    return flatten(ir::make_union(std::move(kept)));
}

// ============================================================================
// Memo access
// ============================================================================

const ir::type& intersection_solver::solved_instance(const std::string& key) {
    auto cached = solved_.find(key);
    if (cached != solved_.end()) {
        return cached->second;
    }

    if (detail::on_stack(solving_, key)) {
        throw circular_intersection_error(key);
    }

    auto it = memo_.find(key);
    if (it == memo_.end()) {
        throw internal_error("could not find instantiated type '" + key + "'");
    }

    ir::type value = [&] {
        detail::scoped_push<std::string> in_progress(solving_, key);
        return solve(flatten(it->second.value));
    }();

    return solved_.emplace(key, std::move(value)).first->second;
}

ir::type intersection_solver::unsolved_instance(const std::string& key) {
    auto it = memo_.find(key);
    if (it == memo_.end()) {
        throw internal_error("could not find instantiated type '" + key + "'");
    }

    // Only a structured body puts a level of indirection between the
    // entry and its own intersection
    ir::type value = flatten(it->second.value);
    if (value.is<ir::intersection>() || value.is<ir::union_type>()) {
        throw circular_intersection_error(key);
    }
    return value;
}

ir::type intersection_solver::dereference(const ir::type& t, std::optional<std::string>& key) {
    std::vector<std::string> chain;
    ir::type current = t;

    while (const auto* inst = current.as<ir::instantiated_type>()) {
        if (detail::on_stack(chain, inst->key)) {
            throw circular_intersection_error(inst->key);
        }
        chain.push_back(inst->key);
        key = inst->key;
        if (detail::on_stack(solving_, inst->key) && !solved_.contains(inst->key)) {
            current = unsolved_instance(inst->key);
        } else {
            current = solved_instance(inst->key);
        }
    }
    return current;
}

// ============================================================================
// Pairwise intersection
// ============================================================================

ir::type intersection_solver::intersect_types(const ir::type& left, const ir::type& right) {
    return solve(flatten(ir::make_intersection({left, right})));
}

ir::type intersection_solver::intersect(const ir::type& left_operand, const ir::type& right_operand) {
    if (depth_ >= max_depth_) {
        throw depth_limit_error(solving_.empty() ? ir::to_string(left_operand) : solving_.back(),
                                max_depth_);
    }
    detail::scoped_depth nesting(depth_);

    std::optional<std::string> left_key;
    std::optional<std::string> right_key;
    ir::type left = dereference(left_operand, left_key);
    ir::type right = dereference(right_operand, right_key);

    if (left.is<ir::failed_intersection>() || right.is<ir::failed_intersection>()) {
        return ir::make_failed_intersection();
    }

    // A dereferenced union distributes like a written one
    if (left.is<ir::union_type>() || right.is<ir::union_type>()) {
        return intersect_types(left, right);
    }

    ir::hierarchy_info left_info = ir::classify(left);
    ir::hierarchy_info right_info = ir::classify(right);

    // any & unknown is unknown, but both generate the same check
    if (left_info.is_anything || right_info.is_anything) {
        return ir::make_primitive(ir::primitive_kind::any);
    }

    if (!left_info.disjoint || !right_info.disjoint) {
        throw internal_error(std::string("cannot classify intersection operands ") + ir::kind_name(left) +
                             " and " + ir::kind_name(right));
    }

    if (*left_info.disjoint != *right_info.disjoint) {
        return ir::make_failed_intersection();
    }

    switch (*left_info.disjoint) {
        case ir::disjoint_kind::array: {
            const auto* left_tuple = left.as<ir::tuple>();
            const auto* right_tuple = right.as<ir::tuple>();
            if (left_tuple && right_tuple) {
                return intersect_tuples(left, right);
            }
            if (left_tuple) {
                return intersect_array_and_tuple(*right.as<ir::builtin_type>(), *left_tuple);
            }
            if (right_tuple) {
                return intersect_array_and_tuple(*left.as<ir::builtin_type>(), *right_tuple);
            }
            return intersect_arrays(*left.as<ir::builtin_type>(), *right.as<ir::builtin_type>());
        }

        case ir::disjoint_kind::boolean:
        case ir::disjoint_kind::number:
        case ir::disjoint_kind::bigint:
        case ir::disjoint_kind::string:
        case ir::disjoint_kind::symbol: {
            if (left.is<ir::primitive_type>()) {
                return right;
            }
            if (right.is<ir::primitive_type>()) {
                return left;
            }
            const auto* left_literal = left.as<ir::literal>();
            const auto* right_literal = right.as<ir::literal>();
            if (!left_literal || !right_literal) {
                throw internal_error(std::string("expected literal operands, got ") + ir::kind_name(left) +
                                     " and " + ir::kind_name(right));
            }
            if (left_literal->value == right_literal->value) {
                return left;
            }
            return ir::make_failed_intersection();
        }

        case ir::disjoint_kind::null:
        case ir::disjoint_kind::undefined:
            if (!left.is<ir::primitive_type>() || !right.is<ir::primitive_type>()) {
                throw internal_error(std::string("nullish intersection of ") + ir::kind_name(left) +
                                     " and " + ir::kind_name(right));
            }
            return left;

        case ir::disjoint_kind::object: {
            if (left.is<ir::primitive_type>()) {
                return right;
            }
            if (right.is<ir::primitive_type>()) {
                return left;
            }
            return intersect_objects(*left.as<ir::object_pattern>(), *right.as<ir::object_pattern>(),
                                     left_key, right_key);
        }

        case ir::disjoint_kind::map:
            return intersect_maps(*left.as<ir::builtin_type>(), *right.as<ir::builtin_type>());

        case ir::disjoint_kind::set:
            return intersect_sets(*left.as<ir::builtin_type>(), *right.as<ir::builtin_type>());
    }

    throw internal_error(std::string("unexpected disjoint kind ") +
                         ir::disjoint_kind_name(*left_info.disjoint));
}

// ============================================================================
// Objects
// ============================================================================

ir::type intersection_solver::intersect_objects(const ir::object_pattern& left,
                                                const ir::object_pattern& right,
                                                const std::optional<std::string>& left_key,
                                                const std::optional<std::string>& right_key) {
    std::optional<std::pair<std::string, std::string>> merge_pair;
    if (left_key && right_key) {
        merge_pair = std::make_pair(*left_key, *right_key);
        if (detail::on_stack(merging_, *merge_pair)) {
            broken_cycle_ = merge_pair;
            return ir::make_failed_intersection();
        }
    }

    // Shared keys whose value refers back to its own object cannot be merged
    for (const auto& prop : left.properties) {
        const auto* other = find_property(right, prop.key);
        if (!other) continue;
        if ((left_key && references_key(prop.value, *left_key)) ||
            (right_key && references_key(other->value, *right_key))) {
            return ir::make_failed_intersection();
        }
    }

    std::optional<detail::scoped_push<std::pair<std::string, std::string>>> merging;
    if (merge_pair) {
        merging.emplace(merging_, *merge_pair);
    }

    std::optional<ir::type> string_indexer = left.string_indexer ? left.string_indexer : right.string_indexer;
    if (left.string_indexer && right.string_indexer) {
        string_indexer = intersect_types(*left.string_indexer, *right.string_indexer);
    }

    std::optional<ir::type> number_indexer = left.number_indexer ? left.number_indexer : right.number_indexer;
    if (left.number_indexer && right.number_indexer) {
        number_indexer = intersect_types(*left.number_indexer, *right.number_indexer);
    }
    if (string_indexer && number_indexer) {
        number_indexer = intersect_types(*number_indexer, *string_indexer);
    }

    std::vector<ir::property_signature> properties;
    properties.reserve(left.properties.size() + right.properties.size());

    for (const auto& prop : left.properties) {
        if (const auto* other = find_property(right, prop.key)) {
            std::optional<ir::type> merged = merge_shared_property(prop.value, other->value, merge_pair);
            if (!merged) {
                return ir::make_failed_intersection();
            }
            properties.push_back(ir::make_property(prop.key, std::move(*merged),
                                                   prop.optional && other->optional));
        } else {
            properties.push_back(prop);
        }
    }
    for (const auto& prop : right.properties) {
        if (!find_property(left, prop.key)) {
            properties.push_back(prop);
        }
    }

    return ir::make_object(std::move(properties), std::move(string_indexer), std::move(number_indexer));
}

std::optional<ir::type> intersection_solver::merge_shared_property(
    const ir::type& left, const ir::type& right,
    const std::optional<std::pair<std::string, std::string>>& merge_pair) {
    std::optional<std::pair<std::string, std::string>> outer = std::exchange(broken_cycle_, std::nullopt);
    ir::type merged = intersect_types(left, right);

    if (!broken_cycle_) {
        broken_cycle_ = std::move(outer);
        return merged;
    }
    if (!merged.is<ir::failed_intersection>()) {
        // The repeated pair was absorbed, e.g. by a union member
        broken_cycle_ = std::move(outer);
        return merged;
    }

    // Every merge between the repeated pair and this one fails with it
    if (merge_pair && *broken_cycle_ == *merge_pair) {
        broken_cycle_ = std::move(outer);
    }
    return std::nullopt;
}

// ============================================================================
// Arrays and tuples
// ============================================================================

ir::type intersection_solver::intersect_arrays(const ir::builtin_type& left, const ir::builtin_type& right) {
    return ir::make_array(intersect_types(left.element_types[0], right.element_types[0]));
}

ir::type intersection_solver::intersect_array_and_tuple(const ir::builtin_type& array, const ir::tuple& t) {
    const ir::type& element = array.element_types[0];

    std::vector<ir::type> elements;
    elements.reserve(t.elements.size());
    for (const auto& e : t.elements) {
        elements.push_back(intersect_types(e, element));
    }

    std::optional<ir::type> rest;
    if (t.rest) {
        rest = intersect_types(*t.rest, element);
    }

    return ir::make_tuple(std::move(elements), std::move(rest), t.first_optional_index);
}

ir::type intersection_solver::intersect_tuples(const ir::type& left, const ir::type& right) {
    const auto& first = *left.as<ir::tuple>();
    const auto& second = *right.as<ir::tuple>();

    std::size_t l1 = first.elements.size();
    std::size_t l2 = second.elements.size();
    const ir::tuple& shorter = l2 > l1 ? first : second;
    const ir::tuple& longer = l2 > l1 ? second : first;

    if (l1 != l2 && !shorter.rest && longer.first_optional_index > shorter.elements.size()) {
        throw tuple_shape_error("Cannot intersect " + ir::to_string(left) + " with " +
                                ir::to_string(right) +
                                ": tuples of different lengths need a rest element on the shorter "
                                "one or optional elements right after it");
    }

    auto merge_position = [&](const ir::type& a, const ir::type& b) {
        ir::type merged = intersect_types(a, b);
        if (merged.is<ir::failed_intersection>()) {
            throw tuple_shape_error("Cannot intersect tuple elements " + ir::to_string(a) +
                                    " and " + ir::to_string(b));
        }
        return merged;
    };

    std::size_t shorter_len = std::min(l1, l2);
    std::size_t longer_len = std::max(l1, l2);

    std::vector<ir::type> elements;
    elements.reserve(longer_len);
    for (std::size_t i = 0; i < shorter_len; ++i) {
        elements.push_back(merge_position(shorter.elements[i], longer.elements[i]));
    }
    if (shorter.rest) {
        for (std::size_t i = shorter_len; i < longer_len; ++i) {
            elements.push_back(merge_position(*shorter.rest, longer.elements[i]));
        }
    }

    std::optional<ir::type> rest;
    if (shorter.rest && longer.rest) {
        rest = intersect_types(*shorter.rest, *longer.rest);
    }

    return ir::make_tuple(std::move(elements), std::move(rest),
                          std::max(first.first_optional_index, second.first_optional_index));
}

// ============================================================================
// Maps and sets
// ============================================================================

ir::type intersection_solver::intersect_maps(const ir::builtin_type& left, const ir::builtin_type& right) {
    ir::type key = intersect_types(left.element_types[0], right.element_types[0]);
    if (key.is<ir::failed_intersection>()) {
        return key;
    }

    ir::type value = intersect_types(left.element_types[1], right.element_types[1]);
    if (value.is<ir::failed_intersection>()) {
        throw internal_error("failed to intersect map values " + ir::to_string(left.element_types[1]) +
                             " and " + ir::to_string(right.element_types[1]));
    }

    return ir::make_map(std::move(key), std::move(value));
}

ir::type intersection_solver::intersect_sets(const ir::builtin_type& left, const ir::builtin_type& right) {
    ir::type element = intersect_types(left.element_types[0], right.element_types[0]);
    if (element.is<ir::failed_intersection>()) {
        return element;
    }
    return ir::make_set(std::move(element));
}

// ============================================================================
// Entry point
// ============================================================================

ir::type solve_intersections(const ir::type& t,
                             const ir::instantiation_memo& memo,
                             std::size_t max_depth) {
    intersection_solver solver(memo, max_depth);
    return solver.solve(t);
}

} // namespace typeshape::passes
