#include "celio/spec/tag.hpp"
#include "celio/config.hpp"
#include "celio/core/warning.hpp"

namespace celio::spec {

std::string Tag::str() const {
    if (is_legacy()) return "<untagged>";
    return name + "@" + version;
}

Tag read_tag(const Node& node) {
    const bool has_type = node.has_attr(config::kEncodingTypeAttr);
    const bool has_version = node.has_attr(config::kEncodingVersionAttr);
    if (has_type != has_version) {
        warn(WarningCategory::MalformedTag,
             "Element '" + node.path() + "' carries only one of " +
             config::kEncodingTypeAttr + " / " + config::kEncodingVersionAttr +
             "; reading it as untagged.");
        return Tag{};
    }
    return Tag{node.get_string_attr(config::kEncodingTypeAttr),
               node.get_string_attr(config::kEncodingVersionAttr)};
}

void write_tag(Node& node, const Tag& tag) {
    node.set_attr(config::kEncodingTypeAttr, tag.name);
    node.set_attr(config::kEncodingVersionAttr, tag.version);
}

} // namespace celio::spec
