//
// IR text rendering
//

#include <typeshape/ir_printer.hh>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <ostream>
#include <sstream>

namespace typeshape::ir {

namespace {
    std::string quote(const std::string& s) {
        std::string out = "\"";
        for (char c : s) {
            switch (c) {
                case '"':  out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\t': out += "\\t"; break;
                default:   out += c; break;
            }
        }
        out += '"';
        return out;
    }

    bool is_identifier(const std::string& s) {
        auto start = [](char c) {
            return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
        };
        if (s.empty() || !start(s.front())) {
            return false;
        }
        return std::all_of(s.begin() + 1, s.end(), [&](char c) {
            return start(c) || std::isdigit(static_cast<unsigned char>(c));
        });
    }

    std::string format_number(double value) {
        // Shortest representation that round-trips: 1 rather than 1.000000
        char buffer[64];
        auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
        if (ec != std::errc{}) {
            std::ostringstream oss;
            oss << value;
            return oss.str();
        }
        return std::string(buffer, end);
    }

    bool is_compound(const type& t) {
        return t.is<union_type>() || t.is<intersection>();
    }

    class printer {
    public:
        explicit printer(std::ostringstream& out) : out_(out) {}

        void print(const type& t) {
            std::visit([this](const auto& n) { render(n); }, t.get().value);
        }

    private:
        std::ostringstream& out_;

        // Union/intersection operands nested in another operator get parentheses
        void print_operand(const type& t) {
            if (is_compound(t)) {
                out_ << "(";
                print(t);
                out_ << ")";
            } else {
                print(t);
            }
        }

        void print_list(const std::vector<type>& types, const char* separator) {
            for (std::size_t i = 0; i < types.size(); ++i) {
                if (i > 0) out_ << separator;
                print(types[i]);
            }
        }

        void print_parameter_header(std::size_t count, const std::vector<type>& defaults) {
            if (count == 0) return;
            std::size_t first_default = count - defaults.size();
            out_ << "<";
            for (std::size_t i = 0; i < count; ++i) {
                if (i > 0) out_ << ", ";
                out_ << "$" << i;
                if (i >= first_default) {
                    out_ << " = ";
                    print(defaults[i - first_default]);
                }
            }
            out_ << ">";
        }

        void render(const primitive_type& p) {
            out_ << primitive_kind_name(p.kind);
        }

        void render(const literal& l) {
            out_ << to_string(l.value);
        }

        void render(const type_ref& r) {
            out_ << r.name;
            if (!r.parameters.empty()) {
                out_ << "<";
                print_list(r.parameters, ", ");
                out_ << ">";
            }
        }

        void render(const instantiated_type& i) {
            out_ << i.key;
        }

        void render(const generic_type& g) {
            out_ << "$" << g.index;
        }

        void render(const type_alias& a) {
            out_ << "alias";
            print_parameter_header(a.parameter_count, a.defaults);
            out_ << " = ";
            print(a.value);
        }

        void render(const interface_decl& i) {
            out_ << "interface";
            print_parameter_header(i.parameter_count, i.defaults);
            out_ << " ";
            render(i.body);
        }

        void render(const object_pattern& o) {
            out_ << "{";
            bool first = true;
            auto separate = [&]() {
                if (!first) out_ << "; ";
                first = false;
            };
            for (const auto& prop : o.properties) {
                separate();
                out_ << (is_identifier(prop.key) ? prop.key : quote(prop.key)) << (prop.optional ? "?: " : ": ");
                print(prop.value);
            }
            if (o.string_indexer) {
                separate();
                out_ << "[key: string]: ";
                print(*o.string_indexer);
            }
            if (o.number_indexer) {
                separate();
                out_ << "[index: number]: ";
                print(*o.number_indexer);
            }
            out_ << "}";
        }

        void render(const builtin_type& b) {
            out_ << builtin_kind_name(b.kind) << "<";
            print_list(b.element_types, ", ");
            out_ << ">";
        }

        void render(const tuple& t) {
            out_ << "[";
            for (std::size_t i = 0; i < t.elements.size(); ++i) {
                if (i > 0) out_ << ", ";
                print_operand(t.elements[i]);
                if (i >= t.first_optional_index) out_ << "?";
            }
            if (t.rest) {
                if (!t.elements.empty()) out_ << ", ";
                out_ << "...";
                print_operand(*t.rest);
            }
            out_ << "]";
        }

        void render(const union_type& u) {
            for (std::size_t i = 0; i < u.members.size(); ++i) {
                if (i > 0) out_ << " | ";
                print_operand(u.members[i]);
            }
        }

        void render(const intersection& n) {
            for (std::size_t i = 0; i < n.members.size(); ++i) {
                if (i > 0) out_ << " & ";
                print_operand(n.members[i]);
            }
        }

        void render(const failed_intersection&) {
            out_ << "never";
        }
    };
}

std::string to_string(const type& t) {
    std::ostringstream oss;
    printer(oss).print(t);
    return oss.str();
}

std::string to_string(const literal_value& value) {
    if (const auto* s = std::get_if<std::string>(&value)) {
        return quote(*s);
    }
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? "true" : "false";
    }
    return format_number(std::get<double>(value));
}

std::ostream& operator<<(std::ostream& os, const type& t) {
    return os << to_string(t);
}

} // namespace typeshape::ir
