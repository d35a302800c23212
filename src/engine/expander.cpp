#include <monolith/expander.hpp>
#include <monolith/condition.hpp>
#include <monolith/log.hpp>
#include <monolith/resolver.hpp>

namespace monolith {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static void append_node(NodeList& out, Node node) {
    if (node.kind == Node::Text && !out.empty() && out.back().kind == Node::Text) {
        out.back().text += node.text;
        return;
    }
    out.push_back(std::move(node));
}

static const Branch* select_branch(const Node& group, const Value& scope) {
    for (const auto& branch : group.branches) {
        if (!branch.condition.has_value()) return &branch;
        if (evaluate_condition(branch.condition.value(), scope)) return &branch;
    }
    return nullptr;
}

Value loop_scope(const std::string& var, const Value& element) {
    Value::ObjectT members;
    members.emplace(var, element);
    return Value::object(std::move(members));
}

Value::ArrayT loop_items(const std::string& path, const Value& scope) {
    auto r = resolve(path, scope);
    if (r.absent() || r.value.is_null()) return {};
    if (r.value.is_array()) return r.value.items();
    return {std::move(r.value)};
}

// ---------------------------------------------------------------------------
// Conditional pass
// ---------------------------------------------------------------------------

NodeList expand_conditionals(const NodeList& nodes, const Value& scope) {
    NodeList out;
    for (const auto& node : nodes) {
        switch (node.kind) {
        case Node::If: {
            const Branch* chosen = select_branch(node, scope);
            if (!chosen) break;
            for (auto& n : expand_conditionals(chosen->body, scope)) {
                append_node(out, std::move(n));
            }
            break;
        }
        case Node::For: {
            Node copy = node;
            copy.body = expand_conditionals(node.body, scope);
            out.push_back(std::move(copy));
            break;
        }
        default:
            append_node(out, node);
            break;
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// Loop pass
// ---------------------------------------------------------------------------

static std::string render_loop(const Node& loop, const Value& scope) {
    auto items = loop_items(loop.expr, scope);
    log::trace("loop %s over '%s': %zu iteration(s)",
               loop.block_id.c_str(), loop.expr.c_str(), items.size());

    std::string out;
    for (const auto& item : items) {
        Value iteration = loop_scope(loop.var, item);
        out += substitute_variables(expand_loops(loop.body, iteration), iteration);
    }
    return out;
}

NodeList expand_loops(const NodeList& nodes, const Value& scope) {
    NodeList out;
    for (const auto& node : nodes) {
        if (node.kind == Node::For) {
            append_node(out, Node::make_text(render_loop(node, scope)));
        } else {
            append_node(out, node);
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// Variable pass
// ---------------------------------------------------------------------------

std::string substitute_variables(const NodeList& nodes, const Value& scope) {
    std::string out;
    for (const auto& node : nodes) {
        switch (node.kind) {
        case Node::Text:
            out += node.text;
            break;
        case Node::Variable:
            out += substitute(node.expr, scope);
            break;
        case Node::If:
            out += substitute_variables(expand_conditionals({node}, scope), scope);
            break;
        case Node::For:
            out += render_loop(node, scope);
            break;
        }
    }
    return out;
}

} // namespace monolith
