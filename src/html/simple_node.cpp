#include <sleek/html/tree_builder.h>
#include <algorithm>

namespace sleek::html {

SimpleNode* SimpleNode::append_child(std::unique_ptr<SimpleNode> child) {
    child->parent = this;
    auto* raw = child.get();
    children.push_back(std::move(child));
    return raw;
}

void SimpleNode::remove_child(SimpleNode* child) {
    auto it = std::find_if(children.begin(), children.end(),
        [child](const std::unique_ptr<SimpleNode>& c) { return c.get() == child; });
    if (it != children.end()) {
        (*it)->parent = nullptr;
        children.erase(it);
    }
}

std::string SimpleNode::text_content() const {
    if (type == Text || type == Comment) {
        return data;
    }
    std::string result;
    for (auto& child : children) {
        if (child->type == Comment) continue;
        result += child->text_content();
    }
    return result;
}

SimpleNode* SimpleNode::find_element(const std::string& tag) const {
    for (auto& child : children) {
        if (child->type == Element && child->tag_name == tag) {
            return child.get();
        }
        auto* found = child->find_element(tag);
        if (found) return found;
    }
    return nullptr;
}

std::vector<SimpleNode*> SimpleNode::find_all_elements(const std::string& tag) const {
    std::vector<SimpleNode*> result;
    for (auto& child : children) {
        if (child->type == Element && child->tag_name == tag) {
            result.push_back(child.get());
        }
        auto sub = child->find_all_elements(tag);
        result.insert(result.end(), sub.begin(), sub.end());
    }
    return result;
}

const std::string* SimpleNode::get_attribute(std::string_view name) const {
    for (const auto& attr : attributes) {
        if (attr.name == name) return &attr.value;
    }
    return nullptr;
}

bool SimpleNode::has_attribute(std::string_view name) const {
    return get_attribute(name) != nullptr;
}

void SimpleNode::set_attribute(std::string_view name, std::string value) {
    for (auto& attr : attributes) {
        if (attr.name == name) {
            attr.value = std::move(value);
            return;
        }
    }
    attributes.push_back(Attribute{std::string(name), std::move(value)});
}

void for_each_element(SimpleNode& root, const std::function<void(SimpleNode&)>& visit) {
    if (root.type == SimpleNode::Element) {
        visit(root);
    }
    for (auto& child : root.children) {
        for_each_element(*child, visit);
    }
}

} // namespace sleek::html
