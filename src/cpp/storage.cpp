#include "celio/io/storage.hpp"

#include <cmath>

namespace celio {

std::string Node::name() const {
    const std::string p = path();
    if (p == "/") return p;
    const auto pos = p.find_last_of('/');
    return pos == std::string::npos ? p : p.substr(pos + 1);
}

std::string Node::get_string_attr(const std::string& name, const std::string& dflt) const {
    auto v = get_attr(name);
    if (!v) return dflt;
    if (const auto* s = std::get_if<std::string>(&*v)) return *s;
    throw TypeMismatchError("attribute '" + name + "' on " + path() + " is not a string");
}

bool Node::get_bool_attr(const std::string& name, bool dflt) const {
    auto v = get_attr(name);
    if (!v) return dflt;
    if (const auto* b = std::get_if<bool>(&*v)) return *b;
    if (const auto* i = std::get_if<std::int64_t>(&*v)) return *i != 0;
    throw TypeMismatchError("attribute '" + name + "' on " + path() + " is not a boolean");
}

std::vector<std::string> Node::get_strings_attr(const std::string& name) const {
    auto v = get_attr(name);
    if (!v) return {};
    if (const auto* list = std::get_if<std::vector<std::string>>(&*v)) return *list;
    if (const auto* s = std::get_if<std::string>(&*v)) return {*s};
    // an empty list may come back untyped from stores without list dtypes
    if (const auto* d = std::get_if<std::vector<double>>(&*v); d && d->empty()) return {};
    if (const auto* n = std::get_if<std::vector<std::int64_t>>(&*v); n && n->empty()) return {};
    throw TypeMismatchError("attribute '" + name + "' on " + path() + " is not a string list");
}

std::vector<Index> Node::get_ints_attr(const std::string& name) const {
    auto v = get_attr(name);
    if (!v) {
        throw ReadError("missing attribute '" + name + "' on " + path());
    }
    if (const auto* list = std::get_if<std::vector<std::int64_t>>(&*v)) {
        return {list->begin(), list->end()};
    }
    if (const auto* i = std::get_if<std::int64_t>(&*v)) return {*i};
    if (const auto* s = std::get_if<std::vector<std::string>>(&*v); s && s->empty()) return {};
    if (const auto* d = std::get_if<std::vector<double>>(&*v)) {
        std::vector<Index> out;
        out.reserve(d->size());
        for (double x : *d) {
            if (std::floor(x) != x) {
                throw TypeMismatchError("attribute '" + name + "' on " + path() +
                                        " holds non-integral values");
            }
            out.push_back(static_cast<Index>(x));
        }
        return out;
    }
    throw TypeMismatchError("attribute '" + name + "' on " + path() + " is not an integer list");
}

std::unique_ptr<GroupNode> GroupNode::open_group(const std::string& key) const {
    auto node = open(key);
    if (node->kind() != NodeKind::Group) {
        throw ReadError("'" + node->path() + "' is an array, expected a group");
    }
    return std::unique_ptr<GroupNode>(static_cast<GroupNode*>(node.release()));
}

std::unique_ptr<ArrayNode> GroupNode::open_array(const std::string& key) const {
    auto node = open(key);
    if (node->kind() != NodeKind::Array) {
        throw ReadError("'" + node->path() + "' is a group, expected an array");
    }
    return std::unique_ptr<ArrayNode>(static_cast<ArrayNode*>(node.release()));
}

} // namespace celio
