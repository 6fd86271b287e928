#include <sexpr/lang/parser.hpp>
#include <sexpr/lang/printer.hpp>
#include <sexpr/log.hpp>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace sexpr;

static void dump_node(const Node& node, int depth) {
    std::string indent(depth * 2, ' ');
    std::cout << indent << node.span.to_string() << "  ";

    if (auto a = node.atom()) {
        std::cout << "atom " << a->text << "\n";
    } else if (auto n = node.number()) {
        std::cout << (n->is_decimal ? "decimal " : "integer ") << n->to_string()
                  << "  [" << base_name(n->base) << ", value " << n->canonical() << "]\n";
    } else if (auto s = node.string()) {
        std::cout << "string \"" << s->raw << "\"\n";
    } else if (auto b = node.bytes()) {
        std::cout << "bytes #" << b->to_hex() << "#  (" << b->data.size() << " bytes)\n";
    } else if (auto g = node.group()) {
        std::cout << group_kind_name(g->kind) << " group, "
                  << g->children.size() << " children\n";
        for (const auto& child : g->children) {
            dump_node(child, depth + 1);
        }
    }
}

int main(int argc, char* argv[]) {
    log::init_from_env();

    if (argc < 2) {
        std::cerr << "Usage: sexpr-dump <file> [--config cfg.toml] [--tokens] [--print]\n";
        return 1;
    }

    std::string path = argv[1];
    std::string config_path;
    bool show_tokens = false;
    bool reprint = false;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--tokens") {
            show_tokens = true;
        } else if (arg == "--print") {
            reprint = true;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::cerr << "error: unknown argument " << arg << "\n";
            return 1;
        }
    }

    Settings settings;
    if (!config_path.empty()) {
        auto sr = Settings::load(config_path);
        if (sr.is_err()) {
            std::cerr << sr.error().format() << "\n";
            return 1;
        }
        settings = std::move(sr).value();
    }

    std::ifstream f(path, std::ios::binary);
    if (!f) {
        std::cerr << "error: cannot open " << path << "\n";
        return 1;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    std::string source = ss.str();

    if (show_tokens) {
        auto lr = lex(source, settings.syntax);
        if (lr.is_err()) {
            std::cerr << lr.error().format() << "\n";
            return 1;
        }
        std::cout << "-- Tokens --\n";
        for (const auto& t : lr.value().tokens) {
            std::cout << "  " << t.span.to_string()
                      << "  " << token_type_name(t.type)
                      << "  \"" << t.text << "\"\n";
        }
        std::cout << "\n";
    }

    auto pr = parse(source, settings.syntax);
    if (pr.is_err()) {
        std::cerr << pr.error().format() << "\n";
        return 1;
    }
    const auto& result = pr.value();

    std::cout << "--- " << path << " ---\n";
    std::cout << "Nodes: " << result.nodes.size()
              << "  Comments: " << result.comments.size() << "\n\n";
    for (const auto& node : result.nodes) {
        dump_node(node, 0);
    }

    if (reprint) {
        auto text = print(result, settings.syntax, settings.printer);
        if (text.is_err()) {
            std::cerr << text.error().format() << "\n";
            return 1;
        }
        std::cout << "\n-- Printed --\n" << text.value() << "\n";
    }

    if (!result.diagnostics.empty()) {
        std::cout << "\n-- Diagnostics --\n";
        for (const auto& d : result.diagnostics) {
            std::cout << "  " << d.format(path) << "\n";
        }
        return 2;
    }

    return 0;
}
