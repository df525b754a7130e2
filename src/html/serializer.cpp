#include <sleek/html/serializer.h>

namespace sleek::html {

namespace {

constexpr std::string_view kNoBreakSpace = "\xC2\xA0";

void append_escaped(std::string& out, std::string_view text, bool attribute_mode) {
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '&') {
            out += "&amp;";
        } else if (c == '\xC2' && text.substr(i, 2) == kNoBreakSpace) {
            out += "&nbsp;";
            ++i;
        } else if (attribute_mode && c == '"') {
            out += "&quot;";
        } else if (!attribute_mode && c == '<') {
            out += "&lt;";
        } else if (!attribute_mode && c == '>') {
            out += "&gt;";
        } else {
            out += c;
        }
    }
}

bool has_raw_text_content(const SimpleNode& node) {
    return node.type == SimpleNode::Element &&
           (is_raw_text_element(node.tag_name) || node.tag_name == "plaintext");
}

void serialize_into(std::string& out, const SimpleNode& node) {
    switch (node.type) {
        case SimpleNode::Document:
            for (const auto& child : node.children) {
                serialize_into(out, *child);
            }
            return;

        case SimpleNode::DocumentType:
            out += "<!DOCTYPE ";
            out += node.doctype_name;
            if (!node.public_id.empty()) {
                out += " PUBLIC \"";
                out += node.public_id;
                out += '"';
                if (!node.system_id.empty()) {
                    out += " \"";
                    out += node.system_id;
                    out += '"';
                }
            } else if (!node.system_id.empty()) {
                out += " SYSTEM \"";
                out += node.system_id;
                out += '"';
            }
            out += '>';
            return;

        case SimpleNode::Comment:
            out += "<!--";
            out += node.data;
            out += "-->";
            return;

        case SimpleNode::Text:
            if (node.parent != nullptr && has_raw_text_content(*node.parent)) {
                out += node.data;
            } else {
                append_escaped(out, node.data, false);
            }
            return;

        case SimpleNode::Element:
            break;
    }

    out += '<';
    out += node.tag_name;
    for (const auto& attr : node.attributes) {
        out += ' ';
        out += attr.name;
        out += "=\"";
        append_escaped(out, attr.value, true);
        out += '"';
    }

    if (node.self_closing && node.children.empty()) {
        out += "/>";
        return;
    }
    out += '>';

    if (is_void_element(node.tag_name)) {
        return;
    }

    for (const auto& child : node.children) {
        serialize_into(out, *child);
    }

    out += "</";
    out += node.tag_name;
    out += '>';
}

} // anonymous namespace

std::string serialize(const SimpleNode& node) {
    std::string out;
    serialize_into(out, node);
    return out;
}

} // namespace sleek::html
