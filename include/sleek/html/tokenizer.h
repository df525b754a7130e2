#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sleek::html {

struct Attribute {
    std::string name;
    std::string value;
};

struct Token {
    enum Type { DOCTYPE, StartTag, EndTag, Character, Comment, EndOfFile };
    Type type = Character;
    std::string name;
    std::vector<Attribute> attributes;
    bool self_closing = false;
    std::string data;  // For Character/Comment tokens

    // DOCTYPE-specific
    std::string public_id;
    std::string system_id;
    bool has_public_id = false;
    bool has_system_id = false;
    bool force_quirks = false;
};

enum class TokenizerState {
    Data, TagOpen, EndTagOpen, TagName,
    BeforeAttributeName, AttributeName, AfterAttributeName,
    BeforeAttributeValue, AttributeValueDoubleQuoted, AttributeValueSingleQuoted,
    AttributeValueUnquoted, AfterAttributeValueQuoted,
    SelfClosingStartTag, BogusComment,
    MarkupDeclarationOpen, Comment, DOCTYPE,
    RAWTEXT, RCDATA, ScriptData, PLAINTEXT
};

class Tokenizer {
public:
    explicit Tokenizer(std::string_view input);

    Token next_token();
    void set_state(TokenizerState state);
    void set_last_start_tag(const std::string& tag) { last_start_tag_ = tag; }

private:
    std::string_view input_;
    size_t pos_ = 0;
    TokenizerState state_ = TokenizerState::Data;
    std::string last_start_tag_;
    Token current_token_;
    std::optional<Token> pending_token_;

    char consume();
    char peek() const;
    bool at_end() const;
    void reconsume();
    bool lookahead_ci(std::string_view word) const;

    void begin_tag(Token::Type type);
    void begin_attribute();
    Token finish_tag();
    Token emit_string(std::string s);
    Token emit_eof();

    // Text content of RAWTEXT, RCDATA, script and plaintext elements up to
    // the matching end tag. A complete end tag is queued as pending_token_.
    Token consume_raw_text(bool decode_entities);
    void parse_doctype_identifiers();

    // Called after '&'. Returns the decoded text, or "&" when nothing matched.
    std::string try_consume_entity(bool in_attribute);
};

// Named character reference lookup without the leading '&' and trailing ';'.
std::optional<char32_t> lookup_named_entity(std::string_view name);

void append_utf8(std::string& out, char32_t code_point);

} // namespace sleek::html
