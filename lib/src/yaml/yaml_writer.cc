//
// Compile result writer
//

#include <typeshape/yaml.hh>
#include <typeshape/ir_printer.hh>
#include <cstdint>

namespace typeshape::yaml {

namespace {
    const char* level_name(diagnostic_level level) {
        switch (level) {
            case diagnostic_level::error:   return "error";
            case diagnostic_level::warning: return "warning";
        }
        throw internal_error("unknown diagnostic level");
    }

    fkyaml::node instance_to_yaml(const compile_result& result, const std::string& key, const ir::type& solved) {
        fkyaml::node entry = fkyaml::node::mapping();
        entry["value"] = fkyaml::node(ir::to_string(solved));

        bool circular = false;
        auto memo_entry = result.memo.find(key);
        if (memo_entry != result.memo.end()) {
            circular = memo_entry->second.circular;
        }
        entry["circular"] = fkyaml::node(circular);

        std::int64_t uses = 0;
        auto usage = result.usage.find(key);
        if (usage != result.usage.end()) {
            uses = static_cast<std::int64_t>(usage->second);
        }
        entry["uses"] = fkyaml::node(uses);
        entry["named"] = fkyaml::node(result.emit_as_function(key));

        return entry;
    }
}

fkyaml::node result_to_yaml(const compile_result& result) {
    fkyaml::node root = fkyaml::node::mapping();

    fkyaml::node types = fkyaml::node::mapping();
    for (const auto& [name, solved] : result.types) {
        types[name] = fkyaml::node(ir::to_string(solved));
    }
    root["types"] = std::move(types);

    fkyaml::node instances = fkyaml::node::mapping();
    for (const auto& [key, solved] : result.instances) {
        instances[key] = instance_to_yaml(result, key, solved);
    }
    root["instances"] = std::move(instances);

    fkyaml::node::sequence_type diagnostics;
    for (const auto& diag : result.diagnostics) {
        fkyaml::node d = fkyaml::node::mapping();
        d["type"] = fkyaml::node(diag.type_name);
        d["level"] = fkyaml::node(std::string(level_name(diag.level)));
        d["code"] = fkyaml::node(diag.code);
        d["message"] = fkyaml::node(diag.message);
        diagnostics.push_back(std::move(d));
    }
    root["diagnostics"] = fkyaml::node::sequence(std::move(diagnostics));

    return root;
}

std::string write_result(const compile_result& result) {
    return fkyaml::node::serialize(result_to_yaml(result));
}

} // namespace typeshape::yaml
