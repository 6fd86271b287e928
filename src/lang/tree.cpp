#include <sexpr/lang/tree.hpp>

namespace sexpr {

const std::vector<Node>* Node::group(GroupKind kind) const {
    auto g = group();
    if (!g || g->kind != kind) return nullptr;
    return &g->children;
}

const std::string& Node::atom_text() const {
    static const std::string empty;
    auto a = atom();
    return a ? a->text : empty;
}

namespace {

struct EqualVisitor {
    const Node& other;

    bool operator()(const Atom& a) const {
        auto b = other.atom();
        return b && a.text == b->text;
    }
    bool operator()(const Number& a) const {
        auto b = other.number();
        return b && a.same_value(*b);
    }
    bool operator()(const StringLit& a) const {
        auto b = other.string();
        return b && a.raw == b->raw;
    }
    bool operator()(const Bytes& a) const {
        auto b = other.bytes();
        return b && a == *b;
    }
    bool operator()(const Group& a) const {
        auto b = other.group();
        return b && a.kind == b->kind && structurally_equal(a.children, b->children);
    }
};

} // anonymous namespace

bool structurally_equal(const Node& a, const Node& b) {
    return std::visit(EqualVisitor{b}, a.value);
}

bool structurally_equal(const std::vector<Node>& a, const std::vector<Node>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (!structurally_equal(a[i], b[i])) return false;
    }
    return true;
}

} // namespace sexpr
