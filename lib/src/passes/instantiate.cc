//
// Pass 2: Instantiation
//
// Every reference becomes an indirection into the memo. Each canonical key
// is expanded once; a key met again on its own ancestry is a cycle and
// its entry is flagged circular once the traversal is over.
//

#include <typeshape/passes.hh>
#include <typeshape/ir_utils.hh>
#include "pass_utils.hh"

namespace typeshape::passes {

namespace {
    void add_stats(ir::usage_stats& into, const ir::usage_stats& from) {
        for (const auto& [key, count] : from) {
            into[key] += count;
        }
    }

    /// Flags the memo entries of keys found on a cycle when the traversal
    /// ends, including when it is unwound by an error.
    class circular_marker {
    public:
        circular_marker(ir::instantiation_memo& memo, const std::vector<std::string>& pending)
            : memo_(memo)
            , pending_(pending)
        {
        }

        ~circular_marker() {
            for (const auto& key : pending_) {
                auto it = memo_.find(key);
                if (it != memo_.end()) {
                    it->second.circular = true;
                }
            }
        }

        /// On a completed traversal every pending key has an entry
        void check_complete() const {
            for (const auto& key : pending_) {
                if (memo_.find(key) == memo_.end()) {
                    throw internal_error("circular key '" + key + "' has no instantiated entry");
                }
            }
        }

        circular_marker(const circular_marker&) = delete;
        circular_marker& operator=(const circular_marker&) = delete;

    private:
        ir::instantiation_memo& memo_;
        const std::vector<std::string>& pending_;
    };

    class instantiator {
    public:
        explicit instantiator(instantiation_state& state)
            : state_(state)
        {
        }

        ir::type run(const ir::type& t) {
            circular_marker marker(state_.memo, circular_);
            ir::type result = instantiate_type(t, state_.stats);
            marker.check_complete();
            return result;
        }

    private:
        instantiation_state& state_;
        std::vector<std::string> ancestry_;  // Keys whose bodies are being expanded
        std::vector<std::string> circular_;

        ir::type instantiate_type(const ir::type& t, ir::usage_stats& stats) {
            return ir::transform(t,
                [](const ir::type& n) { return n.is<ir::type_ref>(); },
                [&](const ir::type& n) { return instantiate_reference(*n.as<ir::type_ref>(), stats); });
        }

        ir::type instantiate_reference(const ir::type_ref& ref, ir::usage_stats& stats) {
            std::string key = ir::type_key(ref);
            ++stats[key];

            if (detail::on_stack(ancestry_, key)) {
                if (!detail::on_stack(circular_, key)) {
                    circular_.push_back(key);
                }
                return ir::make_instantiated(key);
            }

            auto memoized = state_.memo.find(key);
            if (memoized != state_.memo.end()) {
                add_stats(stats, memoized->second.stats);
                return ir::make_instantiated(key);
            }

            auto it = state_.named_types.find(ref.name);
            if (it == state_.named_types.end()) {
                throw unregistered_type_error(ref.name);
            }
            const ir::type& declaration = it->second;
            if (!ir::accepts_type_parameters(declaration)) {
                throw type_does_not_accept_generic_parameters_error(ref.name, ir::kind_name(declaration));
            }

            ir::type body = ir::apply_type_parameters(declaration, ref.name, ref.parameters);

            if (ancestry_.size() >= state_.max_depth) {
                throw depth_limit_error(key, state_.max_depth);
            }

            ir::usage_stats local;
            ir::type value = [&] {
                detail::scoped_push<std::string> expanding(ancestry_, key);
                return instantiate_type(body, local);
            }();

            state_.memo.emplace(key, ir::type_info{local, value, false});
            state_.new_keys.push_back(key);
            add_stats(stats, local);

            return ir::make_instantiated(key);
        }
    };
}

ir::type instantiate(const ir::type& t, instantiation_state& state) {
    instantiator inst(state);
    return inst.run(t);
}

} // namespace typeshape::passes
