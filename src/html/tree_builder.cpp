#include <sleek/html/tree_builder.h>
#include <algorithm>
#include <unordered_set>

namespace sleek::html {

// ============================================================================
// Helper utilities
// ============================================================================

static const std::unordered_set<std::string>& void_elements() {
    static const std::unordered_set<std::string> s = {
        "area", "base", "basefont", "bgsound", "br", "col", "embed", "frame",
        "hr", "img", "input", "keygen", "link", "meta", "param", "source",
        "track", "wbr"
    };
    return s;
}

static const std::unordered_set<std::string>& special_elements() {
    static const std::unordered_set<std::string> s = {
        "address", "applet", "area", "article", "aside", "base",
        "basefont", "bgsound", "blockquote", "body", "br", "button",
        "caption", "center", "col", "colgroup", "dd", "details",
        "dir", "div", "dl", "dt", "embed", "fieldset", "figcaption",
        "figure", "footer", "form", "frame", "frameset", "h1", "h2",
        "h3", "h4", "h5", "h6", "head", "header", "hgroup", "hr",
        "html", "iframe", "img", "input", "li", "link", "listing",
        "main", "marquee", "menu", "meta", "nav", "noembed",
        "noframes", "noscript", "object", "ol", "p", "param",
        "plaintext", "pre", "script", "section", "select", "source",
        "style", "summary", "table", "tbody", "td", "template",
        "textarea", "tfoot", "th", "thead", "title", "tr", "track",
        "ul", "wbr", "xmp"
    };
    return s;
}

// Elements that implicitly close a <p> when encountered as a start tag
static bool closes_p(const std::string& tag) {
    static const std::unordered_set<std::string> s = {
        "address", "article", "aside", "blockquote", "center", "details",
        "dialog", "dir", "div", "dl", "fieldset", "figcaption", "figure",
        "footer", "header", "hgroup", "hr", "listing", "main",
        "menu", "nav", "ol", "p", "pre", "search", "section", "summary",
        "form", "table", "ul", "plaintext",
        "h1", "h2", "h3", "h4", "h5", "h6"
    };
    return s.count(tag) > 0;
}

static bool is_heading(const std::string& tag) {
    return tag.size() == 2 && tag[0] == 'h' && tag[1] >= '1' && tag[1] <= '6';
}

static bool is_head_content(const std::string& tag) {
    return tag == "base" || tag == "basefont" || tag == "bgsound" ||
           tag == "link" || tag == "meta" || tag == "title" ||
           tag == "noframes" || tag == "style" || tag == "script" ||
           tag == "noscript" || tag == "template";
}

// RCDATA elements: title, textarea
static bool is_rcdata_element(const std::string& tag) {
    return tag == "title" || tag == "textarea";
}

static bool is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\f' || c == '\r';
}

static bool is_all_whitespace(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
        [](char c) { return is_whitespace(c); });
}

bool is_raw_text_element(const std::string& tag) {
    return tag == "script" || tag == "style" || tag == "xmp"
        || tag == "iframe" || tag == "noembed" || tag == "noframes" || tag == "noscript";
}

bool is_void_element(const std::string& tag) {
    return void_elements().count(tag) > 0;
}

// ============================================================================
// TreeBuilder
// ============================================================================

TreeBuilder::TreeBuilder() {
    document_ = std::make_unique<SimpleNode>();
    document_->type = SimpleNode::Document;
}

SimpleNode* TreeBuilder::current_node() {
    if (open_elements_.empty()) return document_.get();
    return open_elements_.back();
}

bool TreeBuilder::in_foreign_content() const {
    for (auto it = open_elements_.rbegin(); it != open_elements_.rend(); ++it) {
        if ((*it)->tag_name == "svg" || (*it)->tag_name == "math") return true;
        if ((*it)->tag_name == "foreignobject") return false;
    }
    return false;
}

SimpleNode* TreeBuilder::insert_element(const Token& token) {
    const bool foreign = in_foreign_content() || token.name == "svg" || token.name == "math";
    const bool raw = is_raw_text_element(token.name) || is_rcdata_element(token.name);

    auto node = std::make_unique<SimpleNode>();
    node->type = SimpleNode::Element;
    node->tag_name = token.name;
    node->attributes = token.attributes;
    // The self-closing flag only closes the element in foreign content;
    // on an HTML element like <script/> it is ignored.
    node->self_closing = token.self_closing && foreign && !raw;
    auto* raw_node = current_node()->append_child(std::move(node));
    if (!is_void_element(token.name) && !raw_node->self_closing) {
        open_elements_.push_back(raw_node);
    }
    return raw_node;
}

SimpleNode* TreeBuilder::insert_element(const std::string& tag) {
    auto node = std::make_unique<SimpleNode>();
    node->type = SimpleNode::Element;
    node->tag_name = tag;
    auto* raw = current_node()->append_child(std::move(node));
    if (!is_void_element(tag)) {
        open_elements_.push_back(raw);
    }
    return raw;
}

void TreeBuilder::insert_text(const std::string& data) {
    auto* cur = current_node();
    // Merge with previous text node if possible
    if (!cur->children.empty() && cur->children.back()->type == SimpleNode::Text) {
        cur->children.back()->data += data;
        return;
    }
    auto node = std::make_unique<SimpleNode>();
    node->type = SimpleNode::Text;
    node->data = data;
    cur->append_child(std::move(node));
}

void TreeBuilder::insert_comment(const std::string& data) {
    auto node = std::make_unique<SimpleNode>();
    node->type = SimpleNode::Comment;
    node->data = data;
    current_node()->append_child(std::move(node));
}

void TreeBuilder::generate_implied_end_tags(const std::string& except) {
    static const std::unordered_set<std::string> implied = {
        "dd", "dt", "li", "optgroup", "option", "p", "rb", "rp", "rt", "rtc"
    };
    while (!open_elements_.empty()) {
        auto& tag = current_node()->tag_name;
        if (tag == except) break;
        if (implied.count(tag) == 0) break;
        open_elements_.pop_back();
    }
}

bool TreeBuilder::has_element_in_scope(const std::string& tag) const {
    static const std::unordered_set<std::string> scope_markers = {
        "applet", "caption", "html", "table", "td", "th", "marquee", "object", "template"
    };
    for (auto it = open_elements_.rbegin(); it != open_elements_.rend(); ++it) {
        if ((*it)->tag_name == tag) return true;
        if (scope_markers.count((*it)->tag_name)) return false;
    }
    return false;
}

bool TreeBuilder::has_element_in_button_scope(const std::string& tag) const {
    static const std::unordered_set<std::string> scope_markers = {
        "applet", "caption", "html", "table", "td", "th", "marquee", "object", "template",
        "button"
    };
    for (auto it = open_elements_.rbegin(); it != open_elements_.rend(); ++it) {
        if ((*it)->tag_name == tag) return true;
        if (scope_markers.count((*it)->tag_name)) return false;
    }
    return false;
}

bool TreeBuilder::has_element_in_table_scope(const std::string& tag) const {
    for (auto it = open_elements_.rbegin(); it != open_elements_.rend(); ++it) {
        if ((*it)->tag_name == tag) return true;
        if ((*it)->tag_name == "html" || (*it)->tag_name == "table" ||
            (*it)->tag_name == "template") {
            return false;
        }
    }
    return false;
}

void TreeBuilder::pop_until(const std::string& tag) {
    while (!open_elements_.empty()) {
        auto* node = open_elements_.back();
        open_elements_.pop_back();
        if (node->tag_name == tag) break;
    }
}

void TreeBuilder::close_element(const std::string& tag) {
    if (has_element_in_scope(tag)) {
        generate_implied_end_tags(tag);
        pop_until(tag);
    }
}

void TreeBuilder::merge_attributes(SimpleNode* target, const Token& token) {
    if (!target) return;
    for (const auto& incoming : token.attributes) {
        if (!target->has_attribute(incoming.name)) {
            target->attributes.push_back(incoming);
        }
    }
}

void TreeBuilder::apply_implicit_closures(const std::string& tag) {
    if (closes_p(tag) && has_element_in_button_scope("p")) {
        close_element("p");
    }

    // A new <li>, <dd> or <dt> closes the previous sibling item.
    if (tag == "li" || tag == "dd" || tag == "dt") {
        for (auto it = open_elements_.rbegin(); it != open_elements_.rend(); ++it) {
            const std::string node_tag = (*it)->tag_name;
            bool same_kind = tag == "li" ? node_tag == "li"
                                         : (node_tag == "dd" || node_tag == "dt");
            if (same_kind) {
                generate_implied_end_tags(node_tag);
                pop_until(node_tag);
                break;
            }
            if (special_elements().count(node_tag) &&
                node_tag != "address" && node_tag != "div" && node_tag != "p") {
                break;
            }
        }
        if (has_element_in_button_scope("p")) {
            close_element("p");
        }
    }

    if (is_heading(tag) && !open_elements_.empty() && is_heading(current_node()->tag_name)) {
        open_elements_.pop_back();
    }

    if ((tag == "option" || tag == "optgroup") &&
        !open_elements_.empty() && current_node()->tag_name == "option") {
        open_elements_.pop_back();
    }
    if (tag == "optgroup" && !open_elements_.empty() && current_node()->tag_name == "optgroup") {
        open_elements_.pop_back();
    }

    if (tag == "button" && has_element_in_scope("button")) {
        close_element("button");
    }

    // Nested anchors are not allowed; the open one ends first.
    if (tag == "a" && has_element_in_scope("a")) {
        pop_until("a");
    }

    // Table structure: cells, rows and sections close their open siblings.
    if (tag == "td" || tag == "th" || tag == "tr" ||
        tag == "thead" || tag == "tbody" || tag == "tfoot") {
        for (const char* cell : {"td", "th"}) {
            if (has_element_in_table_scope(cell)) {
                generate_implied_end_tags();
                pop_until(cell);
            }
        }
    }
    if ((tag == "tr" || tag == "thead" || tag == "tbody" || tag == "tfoot") &&
        has_element_in_table_scope("tr")) {
        pop_until("tr");
    }
    if (tag == "thead" || tag == "tbody" || tag == "tfoot") {
        for (const char* section : {"thead", "tbody", "tfoot"}) {
            if (has_element_in_table_scope(section)) {
                pop_until(section);
            }
        }
    }
}

void TreeBuilder::process_token(const Token& token) {
    switch (mode_) {
        case InsertionMode::Initial:     handle_initial(token); break;
        case InsertionMode::BeforeHtml:  handle_before_html(token); break;
        case InsertionMode::BeforeHead:  handle_before_head(token); break;
        case InsertionMode::InHead:      handle_in_head(token); break;
        case InsertionMode::AfterHead:   handle_after_head(token); break;
        case InsertionMode::InBody:      handle_in_body(token); break;
        case InsertionMode::Text:        handle_text(token); break;
        case InsertionMode::AfterBody:   handle_after_body(token); break;
    }
}

// ============================================================================
// Insertion mode handlers
// ============================================================================

void TreeBuilder::handle_initial(const Token& token) {
    if (token.type == Token::Character && is_all_whitespace(token.data)) {
        return; // Ignore whitespace
    }
    if (token.type == Token::Comment) {
        insert_comment(token.data);
        return;
    }
    if (token.type == Token::DOCTYPE) {
        auto node = std::make_unique<SimpleNode>();
        node->type = SimpleNode::DocumentType;
        node->doctype_name = token.name;
        if (token.has_public_id) node->public_id = token.public_id;
        if (token.has_system_id) node->system_id = token.system_id;
        document_->append_child(std::move(node));
        mode_ = InsertionMode::BeforeHtml;
        return;
    }
    // Anything else: switch to BeforeHtml and reprocess
    mode_ = InsertionMode::BeforeHtml;
    handle_before_html(token);
}

void TreeBuilder::handle_before_html(const Token& token) {
    if (token.type == Token::DOCTYPE) {
        return; // Ignore
    }
    if (token.type == Token::Comment) {
        insert_comment(token.data);
        return;
    }
    if (token.type == Token::Character && is_all_whitespace(token.data)) {
        return; // Ignore whitespace
    }
    if (token.type == Token::StartTag && token.name == "html") {
        insert_element(token);
        mode_ = InsertionMode::BeforeHead;
        return;
    }
    if (token.type == Token::EndTag) {
        if (token.name != "head" && token.name != "body"
            && token.name != "html" && token.name != "br") {
            return; // Parse error, ignore
        }
    }
    // Anything else: create html element and reprocess
    insert_element("html");
    mode_ = InsertionMode::BeforeHead;
    process_token(token);
}

void TreeBuilder::handle_before_head(const Token& token) {
    if (token.type == Token::Character && is_all_whitespace(token.data)) {
        return;
    }
    if (token.type == Token::Comment) {
        insert_comment(token.data);
        return;
    }
    if (token.type == Token::DOCTYPE) {
        return;
    }
    if (token.type == Token::StartTag && token.name == "html") {
        merge_attributes(document_->find_element("html"), token);
        return;
    }
    if (token.type == Token::StartTag && token.name == "head") {
        head_ = insert_element(token);
        mode_ = InsertionMode::InHead;
        return;
    }
    if (token.type == Token::EndTag) {
        if (token.name != "head" && token.name != "body"
            && token.name != "html" && token.name != "br") {
            return;
        }
    }
    // Implied head
    head_ = insert_element("head");
    mode_ = InsertionMode::InHead;
    process_token(token);
}

void TreeBuilder::handle_in_head(const Token& token) {
    if (token.type == Token::Character && is_all_whitespace(token.data)) {
        insert_text(token.data);
        return;
    }
    if (token.type == Token::Comment) {
        insert_comment(token.data);
        return;
    }
    if (token.type == Token::DOCTYPE) {
        return;
    }
    if (token.type == Token::StartTag) {
        const std::string& tag = token.name;
        if (tag == "html") {
            merge_attributes(document_->find_element("html"), token);
            return;
        }
        if (tag == "head") {
            return; // Ignore duplicate head
        }
        if (is_head_content(tag)) {
            insert_element(token);
            if (is_raw_text_element(tag) || is_rcdata_element(tag)) {
                original_mode_ = mode_;
                mode_ = InsertionMode::Text;
            }
            return;
        }
        // Anything else (iframe, textarea, xmp, ...) ends the head below
    }
    if (token.type == Token::EndTag && token.name == "template") {
        close_element("template");
        return;
    }
    if (token.type == Token::EndTag && token.name == "head") {
        open_elements_.pop_back(); // Pop head
        mode_ = InsertionMode::AfterHead;
        return;
    }
    if (token.type == Token::EndTag) {
        if (token.name != "body" && token.name != "html" && token.name != "br") {
            return;
        }
    }
    // Implied end of head
    if (!open_elements_.empty() && current_node()->tag_name == "head") {
        open_elements_.pop_back();
    }
    mode_ = InsertionMode::AfterHead;
    process_token(token);
}

void TreeBuilder::handle_after_head(const Token& token) {
    if (token.type == Token::Character && is_all_whitespace(token.data)) {
        insert_text(token.data);
        return;
    }
    if (token.type == Token::Comment) {
        insert_comment(token.data);
        return;
    }
    if (token.type == Token::DOCTYPE) {
        return;
    }
    if (token.type == Token::StartTag && token.name == "html") {
        handle_in_body(token);
        return;
    }
    if (token.type == Token::StartTag && token.name == "body") {
        body_ = insert_element(token);
        mode_ = InsertionMode::InBody;
        return;
    }
    if (token.type == Token::StartTag && token.name == "head") {
        return; // Ignore
    }
    if (token.type == Token::StartTag && is_head_content(token.name) && head_ != nullptr) {
        // Late head content still belongs in <head>
        open_elements_.push_back(head_);
        handle_in_head(token);
        if (mode_ != InsertionMode::Text) {
            auto it = std::find(open_elements_.begin(), open_elements_.end(), head_);
            if (it != open_elements_.end()) open_elements_.erase(it);
        } else {
            original_mode_ = InsertionMode::AfterHead;
        }
        return;
    }
    if (token.type == Token::EndTag) {
        if (token.name != "body" && token.name != "html" && token.name != "br") {
            return;
        }
    }
    // Implied body
    body_ = insert_element("body");
    mode_ = InsertionMode::InBody;
    process_token(token);
}

void TreeBuilder::handle_in_body(const Token& token) {
    if (token.type == Token::Character) {
        insert_text(token.data);
        return;
    }
    if (token.type == Token::Comment) {
        insert_comment(token.data);
        return;
    }
    if (token.type == Token::DOCTYPE || token.type == Token::EndOfFile) {
        return;
    }

    if (token.type == Token::StartTag) {
        const auto& tag = token.name;

        if (tag == "html") {
            merge_attributes(document_->find_element("html"), token);
            return;
        }
        if (tag == "body") {
            merge_attributes(body_, token);
            return;
        }
        if (tag == "head") {
            return;
        }

        apply_implicit_closures(tag);

        if (is_raw_text_element(tag) || is_rcdata_element(tag)) {
            insert_element(token);
            original_mode_ = mode_;
            mode_ = InsertionMode::Text;
            return;
        }

        insert_element(token);
        return;
    }

    // End tags
    const auto& tag = token.name;

    if (tag == "body" || tag == "html") {
        if (has_element_in_scope("body")) {
            mode_ = InsertionMode::AfterBody;
            if (tag == "html") process_token(token);
        }
        return;
    }

    if (tag == "p") {
        if (!has_element_in_button_scope("p")) {
            // A stray </p> produces an empty paragraph
            Token p_token;
            p_token.type = Token::StartTag;
            p_token.name = "p";
            insert_element(p_token);
        }
        close_element("p");
        return;
    }

    if (tag == "br") {
        Token br_token;
        br_token.type = Token::StartTag;
        br_token.name = "br";
        insert_element(br_token);
        return;
    }

    // Any other end tag: close the nearest matching element unless a
    // special element sits above it.
    for (auto it = open_elements_.rbegin(); it != open_elements_.rend(); ++it) {
        const std::string node_tag = (*it)->tag_name;
        if (node_tag == tag) {
            generate_implied_end_tags(tag);
            pop_until(tag);
            return;
        }
        if (special_elements().count(node_tag) && !in_foreign_content()) {
            return;
        }
    }
}

void TreeBuilder::handle_text(const Token& token) {
    if (token.type == Token::Character) {
        insert_text(token.data);
        return;
    }
    if (token.type == Token::EndTag || token.type == Token::EndOfFile) {
        open_elements_.pop_back();
        mode_ = original_mode_;
        // Head content seen after </head> was parsed with head re-opened
        if (mode_ == InsertionMode::AfterHead && head_ != nullptr &&
            !open_elements_.empty() && open_elements_.back() == head_) {
            open_elements_.pop_back();
        }
        if (token.type == Token::EndOfFile) {
            process_token(token);
        }
        return;
    }
}

void TreeBuilder::handle_after_body(const Token& token) {
    if (token.type == Token::Character && is_all_whitespace(token.data)) {
        handle_in_body(token);
        return;
    }
    if (token.type == Token::Comment) {
        auto* html = document_->find_element("html");
        auto node = std::make_unique<SimpleNode>();
        node->type = SimpleNode::Comment;
        node->data = token.data;
        (html ? html : document_.get())->append_child(std::move(node));
        return;
    }
    if (token.type == Token::DOCTYPE || token.type == Token::EndOfFile) {
        return;
    }
    if (token.type == Token::EndTag && (token.name == "html" || token.name == "body")) {
        return;
    }
    // Content after </body> goes back into the body
    mode_ = InsertionMode::InBody;
    process_token(token);
}

// ============================================================================
// parse()
// ============================================================================

std::unique_ptr<SimpleNode> parse(std::string_view html) {
    Tokenizer tokenizer(html);
    TreeBuilder builder;

    while (true) {
        Token token = tokenizer.next_token();

        builder.process_token(token);

        // Switch the tokenizer for elements whose content is not markup
        if (token.type == Token::StartTag && builder.mode() == InsertionMode::Text) {
            tokenizer.set_last_start_tag(token.name);
            if (token.name == "script") {
                tokenizer.set_state(TokenizerState::ScriptData);
            } else if (is_rcdata_element(token.name)) {
                tokenizer.set_state(TokenizerState::RCDATA);
            } else {
                tokenizer.set_state(TokenizerState::RAWTEXT);
            }
        } else if (token.type == Token::StartTag && token.name == "plaintext") {
            tokenizer.set_state(TokenizerState::PLAINTEXT);
        }

        if (token.type == Token::EndOfFile) break;
    }

    return builder.take_document();
}

} // namespace sleek::html
