#pragma once
#include <sleek/html/tokenizer.h>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sleek::html {

// Mutable document tree produced by parse() and consumed by the serializer.
struct SimpleNode {
    enum Type { Element, Text, Comment, Document, DocumentType };
    Type type = Element;
    std::string tag_name;
    std::string data;  // for text/comment
    std::string doctype_name;
    std::string public_id;
    std::string system_id;
    std::vector<Attribute> attributes;
    // Written back as <tag/>; only kept for elements inside svg or math
    bool self_closing = false;
    SimpleNode* parent = nullptr;
    std::vector<std::unique_ptr<SimpleNode>> children;

    SimpleNode* append_child(std::unique_ptr<SimpleNode> child);
    void remove_child(SimpleNode* child);

    // Get text content recursively
    std::string text_content() const;

    // Find element by tag
    SimpleNode* find_element(const std::string& tag) const;
    std::vector<SimpleNode*> find_all_elements(const std::string& tag) const;

    // Attribute names are stored lowercased by the tokenizer
    const std::string* get_attribute(std::string_view name) const;
    bool has_attribute(std::string_view name) const;
    void set_attribute(std::string_view name, std::string value);
};

// Pre-order walk over every element below (and including) root.
// The callback must not add or remove nodes.
void for_each_element(SimpleNode& root, const std::function<void(SimpleNode&)>& visit);

enum class InsertionMode {
    Initial,
    BeforeHtml,
    BeforeHead,
    InHead,
    AfterHead,
    InBody,
    Text,
    AfterBody
};

class TreeBuilder {
public:
    TreeBuilder();

    // Process a token
    void process_token(const Token& token);

    // Get the built document
    std::unique_ptr<SimpleNode> take_document() { return std::move(document_); }

    InsertionMode mode() const { return mode_; }

private:
    std::unique_ptr<SimpleNode> document_;
    SimpleNode* head_ = nullptr;
    SimpleNode* body_ = nullptr;
    std::vector<SimpleNode*> open_elements_;
    InsertionMode mode_ = InsertionMode::Initial;
    InsertionMode original_mode_ = InsertionMode::Initial;

    // Insertion mode handlers
    void handle_initial(const Token& token);
    void handle_before_html(const Token& token);
    void handle_before_head(const Token& token);
    void handle_in_head(const Token& token);
    void handle_after_head(const Token& token);
    void handle_in_body(const Token& token);
    void handle_text(const Token& token);
    void handle_after_body(const Token& token);

    // Helpers
    SimpleNode* current_node();
    SimpleNode* insert_element(const Token& token);
    SimpleNode* insert_element(const std::string& tag);
    void insert_text(const std::string& data);
    void insert_comment(const std::string& data);
    void generate_implied_end_tags(const std::string& except = "");
    bool has_element_in_scope(const std::string& tag) const;
    bool has_element_in_button_scope(const std::string& tag) const;
    bool has_element_in_table_scope(const std::string& tag) const;
    bool in_foreign_content() const;
    void pop_until(const std::string& tag);
    void close_element(const std::string& tag);
    void merge_attributes(SimpleNode* target, const Token& token);
    void apply_implicit_closures(const std::string& tag);
};

// Convenience: parse HTML string to document
std::unique_ptr<SimpleNode> parse(std::string_view html);

// Raw text elements: their content is never entity-escaped
bool is_raw_text_element(const std::string& tag);
bool is_void_element(const std::string& tag);

} // namespace sleek::html
