//
// Diagnostic formatting and compile_result queries
//

#include <typeshape/passes.hh>
#include <algorithm>
#include <ostream>
#include <sstream>

namespace typeshape {

// ============================================================================
// Diagnostic Formatting
// ============================================================================

std::string diagnostic::format() const {
    std::ostringstream oss;

    // Format: Name: level: message [code]
    if (!type_name.empty()) {
        oss << type_name << ": ";
    }

    switch (level) {
        case diagnostic_level::error:
            oss << "error: ";
            break;
        case diagnostic_level::warning:
            oss << "warning: ";
            break;
    }

    oss << message;

    if (!code.empty()) {
        oss << " [" << code << "]";
    }

    return oss.str();
}

// ============================================================================
// Compile Result Methods
// ============================================================================

bool compile_result::has_errors() const {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
        [](const auto& d) { return d.level == diagnostic_level::error; });
}

bool compile_result::has_warnings() const {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
        [](const auto& d) { return d.level == diagnostic_level::warning; });
}

std::size_t compile_result::error_count() const {
    return std::count_if(diagnostics.begin(), diagnostics.end(),
        [](const auto& d) { return d.level == diagnostic_level::error; });
}

std::size_t compile_result::warning_count() const {
    return std::count_if(diagnostics.begin(), diagnostics.end(),
        [](const auto& d) { return d.level == diagnostic_level::warning; });
}

void compile_result::print_diagnostics(std::ostream& os) const {
    for (const auto& diag : diagnostics) {
        os << diag.format() << "\n";
    }

    if (!diagnostics.empty()) {
        std::size_t errors = error_count();
        std::size_t warnings = warning_count();

        os << "\n";
        if (errors > 0) {
            os << errors << " error" << (errors != 1 ? "s" : "");
        }
        if (warnings > 0) {
            if (errors > 0) os << ", ";
            os << warnings << " warning" << (warnings != 1 ? "s" : "");
        }
        os << " generated.\n";
    }
}

bool compile_result::emit_as_function(const std::string& key) const {
    auto entry = memo.find(key);
    if (entry != memo.end() && entry->second.circular) {
        return true;
    }
    auto uses = usage.find(key);
    return uses != usage.end() && uses->second > 1;
}

} // namespace typeshape
