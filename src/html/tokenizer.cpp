#include <sleek/html/tokenizer.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <unordered_set>

namespace sleek::html {

namespace {

constexpr char kReplacementCharacter[] = "\xEF\xBF\xBD";

char to_lower(char c) {
    if (c >= 'A' && c <= 'Z') return static_cast<char>(c + 32);
    return c;
}

bool is_whitespace(char c) {
    return c == '\t' || c == '\n' || c == '\f' || c == ' ' || c == '\r';
}

bool is_alpha(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool is_alnum(char c) {
    return is_alpha(c) || (c >= '0' && c <= '9');
}

// Numeric references in 0x80-0x9F name windows-1252 characters
char32_t remap_c1_control(char32_t cp) {
    switch (cp) {
        case 0x80: return 0x20AC; case 0x82: return 0x201A; case 0x83: return 0x0192;
        case 0x84: return 0x201E; case 0x85: return 0x2026; case 0x86: return 0x2020;
        case 0x87: return 0x2021; case 0x88: return 0x02C6; case 0x89: return 0x2030;
        case 0x8A: return 0x0160; case 0x8B: return 0x2039; case 0x8C: return 0x0152;
        case 0x8E: return 0x017D; case 0x91: return 0x2018; case 0x92: return 0x2019;
        case 0x93: return 0x201C; case 0x94: return 0x201D; case 0x95: return 0x2022;
        case 0x96: return 0x2013; case 0x97: return 0x2014; case 0x98: return 0x02DC;
        case 0x99: return 0x2122; case 0x9A: return 0x0161; case 0x9B: return 0x203A;
        case 0x9C: return 0x0153; case 0x9E: return 0x017E; case 0x9F: return 0x0178;
        default: return cp;
    }
}

} // anonymous namespace

Tokenizer::Tokenizer(std::string_view input) : input_(input) {}

char Tokenizer::consume() {
    if (pos_ < input_.size()) {
        return input_[pos_++];
    }
    return '\0';
}

char Tokenizer::peek() const {
    if (pos_ < input_.size()) {
        return input_[pos_];
    }
    return '\0';
}

bool Tokenizer::at_end() const {
    return pos_ >= input_.size();
}

void Tokenizer::reconsume() {
    if (pos_ > 0) {
        --pos_;
    }
}

bool Tokenizer::lookahead_ci(std::string_view word) const {
    if (input_.size() - pos_ < word.size()) return false;
    for (size_t i = 0; i < word.size(); ++i) {
        if (to_lower(input_[pos_ + i]) != to_lower(word[i])) return false;
    }
    return true;
}

void Tokenizer::begin_tag(Token::Type type) {
    current_token_ = Token{};
    current_token_.type = type;
}

void Tokenizer::begin_attribute() {
    current_token_.attributes.push_back(Attribute{});
}

Token Tokenizer::finish_tag() {
    // Duplicate attributes: the first occurrence wins
    auto& attrs = current_token_.attributes;
    std::unordered_set<std::string> seen;
    attrs.erase(std::remove_if(attrs.begin(), attrs.end(),
        [&seen](const Attribute& a) { return !seen.insert(a.name).second; }),
        attrs.end());

    if (current_token_.type == Token::StartTag) {
        last_start_tag_ = current_token_.name;
    }
    state_ = TokenizerState::Data;
    return std::move(current_token_);
}

Token Tokenizer::emit_string(std::string s) {
    Token t;
    t.type = Token::Character;
    t.data = std::move(s);
    return t;
}

Token Tokenizer::emit_eof() {
    Token t;
    t.type = Token::EndOfFile;
    return t;
}

void Tokenizer::set_state(TokenizerState state) {
    state_ = state;
}

std::string Tokenizer::try_consume_entity(bool in_attribute) {
    // Called after '&' has been consumed.
    size_t start = pos_;

    if (at_end()) return "&";

    // Numeric character reference: &#...;
    if (peek() == '#') {
        consume();
        bool hex = false;
        if (peek() == 'x' || peek() == 'X') {
            hex = true;
            consume();
        }

        std::string digits;
        while (!at_end() && (hex ? std::isxdigit(static_cast<unsigned char>(peek()))
                                 : std::isdigit(static_cast<unsigned char>(peek())))) {
            digits += consume();
        }

        if (digits.empty()) { pos_ = start; return "&"; }

        if (!at_end() && peek() == ';') consume();

        std::string result;
        if (digits.size() > 8) {
            result = kReplacementCharacter;
            return result;
        }
        unsigned long codepoint = std::strtoul(digits.c_str(), nullptr, hex ? 16 : 10);
        if (codepoint == 0 || codepoint > 0x10FFFF ||
            (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
            return kReplacementCharacter;
        }
        append_utf8(result, remap_c1_control(static_cast<char32_t>(codepoint)));
        return result;
    }

    // Named character reference: &name;
    std::string name;
    while (!at_end() && is_alnum(peek()) && name.size() < 32) {
        name += consume();
    }
    bool has_semicolon = !at_end() && peek() == ';';

    auto cp = lookup_named_entity(name);
    if (cp.has_value()) {
        if (has_semicolon) {
            consume();
            std::string result;
            append_utf8(result, cp.value());
            return result;
        }
        // Without ';' only the XML entities resolve, and never in an
        // attribute value when followed by '=' (query strings like &lt=1).
        bool legacy = name == "amp" || name == "lt" || name == "gt" || name == "quot";
        if (legacy && !(in_attribute && peek() == '=')) {
            std::string result;
            append_utf8(result, cp.value());
            return result;
        }
    }

    pos_ = start;
    return "&";
}

Token Tokenizer::consume_raw_text(bool decode_entities) {
    std::string text;
    while (!at_end()) {
        char c = peek();
        if (c == '<' && pos_ + 1 < input_.size() && input_[pos_ + 1] == '/' &&
            !last_start_tag_.empty()) {
            size_t name_start = pos_ + 2;
            size_t name_end = name_start + last_start_tag_.size();
            bool matches = name_end <= input_.size();
            for (size_t i = 0; matches && i < last_start_tag_.size(); ++i) {
                matches = to_lower(input_[name_start + i]) == last_start_tag_[i];
            }
            if (matches && (name_end == input_.size() || is_whitespace(input_[name_end]) ||
                            input_[name_end] == '/' || input_[name_end] == '>')) {
                size_t close = input_.find('>', name_end);
                Token end_tag;
                end_tag.type = Token::EndTag;
                end_tag.name = last_start_tag_;
                pos_ = close == std::string_view::npos ? input_.size() : close + 1;
                state_ = TokenizerState::Data;
                if (text.empty()) return end_tag;
                pending_token_ = std::move(end_tag);
                return emit_string(std::move(text));
            }
        }
        if (decode_entities && c == '&') {
            consume();
            text += try_consume_entity(false);
            continue;
        }
        if (c == '\0') {
            consume();
            text += kReplacementCharacter;
            continue;
        }
        text += consume();
    }
    if (text.empty()) return emit_eof();
    return emit_string(std::move(text));
}

void Tokenizer::parse_doctype_identifiers() {
    auto skip_ws = [this] {
        while (!at_end() && is_whitespace(peek())) consume();
    };
    auto read_quoted = [this](std::string& out) -> bool {
        char quote = peek();
        if (quote != '"' && quote != '\'') return false;
        consume();
        while (!at_end() && peek() != quote && peek() != '>') {
            out += consume();
        }
        if (peek() == quote) {
            consume();
            return true;
        }
        return false;
    };

    skip_ws();
    if (lookahead_ci("PUBLIC")) {
        pos_ += 6;
        skip_ws();
        current_token_.has_public_id = read_quoted(current_token_.public_id);
        if (!current_token_.has_public_id) current_token_.force_quirks = true;
        skip_ws();
        if (peek() == '"' || peek() == '\'') {
            current_token_.has_system_id = read_quoted(current_token_.system_id);
        }
    } else if (lookahead_ci("SYSTEM")) {
        pos_ += 6;
        skip_ws();
        current_token_.has_system_id = read_quoted(current_token_.system_id);
        if (!current_token_.has_system_id) current_token_.force_quirks = true;
    } else if (!at_end() && peek() != '>') {
        current_token_.force_quirks = true;
    }

    // Anything else up to '>' is ignored
    while (!at_end() && peek() != '>') consume();
    if (!at_end()) consume();
}

Token Tokenizer::next_token() {
    if (pending_token_.has_value()) {
        Token t = std::move(*pending_token_);
        pending_token_.reset();
        return t;
    }

    while (true) {
        switch (state_) {

        // ====================================================================
        // Data state: emits the longest run of text before the next tag
        // ====================================================================
        case TokenizerState::Data: {
            if (at_end()) return emit_eof();
            std::string text;
            while (!at_end() && peek() != '<') {
                char c = consume();
                if (c == '&') {
                    text += try_consume_entity(false);
                } else {
                    text += c;
                }
            }
            if (!text.empty()) return emit_string(std::move(text));
            consume();  // '<'
            state_ = TokenizerState::TagOpen;
            continue;
        }

        // ====================================================================
        // Tag Open state
        // ====================================================================
        case TokenizerState::TagOpen: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return emit_string("<");
            }
            char c = consume();
            if (c == '!') {
                state_ = TokenizerState::MarkupDeclarationOpen;
                continue;
            }
            if (c == '/') {
                state_ = TokenizerState::EndTagOpen;
                continue;
            }
            if (is_alpha(c)) {
                begin_tag(Token::StartTag);
                reconsume();
                state_ = TokenizerState::TagName;
                continue;
            }
            if (c == '?') {
                begin_tag(Token::Comment);
                reconsume();
                state_ = TokenizerState::BogusComment;
                continue;
            }
            // Parse error, emit '<' as character
            state_ = TokenizerState::Data;
            reconsume();
            return emit_string("<");
        }

        // ====================================================================
        // End Tag Open state
        // ====================================================================
        case TokenizerState::EndTagOpen: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return emit_string("</");
            }
            char c = consume();
            if (is_alpha(c)) {
                begin_tag(Token::EndTag);
                reconsume();
                state_ = TokenizerState::TagName;
                continue;
            }
            if (c == '>') {
                // Parse error: </>
                state_ = TokenizerState::Data;
                continue;
            }
            begin_tag(Token::Comment);
            reconsume();
            state_ = TokenizerState::BogusComment;
            continue;
        }

        // ====================================================================
        // Tag Name state
        // ====================================================================
        case TokenizerState::TagName: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return emit_eof();
            }
            char c = consume();
            if (is_whitespace(c)) {
                state_ = TokenizerState::BeforeAttributeName;
                continue;
            }
            if (c == '/') {
                state_ = TokenizerState::SelfClosingStartTag;
                continue;
            }
            if (c == '>') {
                return finish_tag();
            }
            if (c == '\0') {
                current_token_.name += kReplacementCharacter;
                continue;
            }
            current_token_.name += to_lower(c);
            continue;
        }

        // ====================================================================
        // Before Attribute Name state
        // ====================================================================
        case TokenizerState::BeforeAttributeName: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return emit_eof();
            }
            char c = consume();
            if (is_whitespace(c)) {
                continue;
            }
            if (c == '/' || c == '>') {
                reconsume();
                state_ = TokenizerState::AfterAttributeName;
                continue;
            }
            begin_attribute();
            if (c == '=') {
                current_token_.attributes.back().name += c;
            } else {
                reconsume();
            }
            state_ = TokenizerState::AttributeName;
            continue;
        }

        // ====================================================================
        // Attribute Name state
        // ====================================================================
        case TokenizerState::AttributeName: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return emit_eof();
            }
            char c = consume();
            if (is_whitespace(c) || c == '/' || c == '>') {
                reconsume();
                state_ = TokenizerState::AfterAttributeName;
                continue;
            }
            if (c == '=') {
                state_ = TokenizerState::BeforeAttributeValue;
                continue;
            }
            current_token_.attributes.back().name += to_lower(c);
            continue;
        }

        // ====================================================================
        // After Attribute Name state
        // ====================================================================
        case TokenizerState::AfterAttributeName: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return emit_eof();
            }
            char c = consume();
            if (is_whitespace(c)) {
                continue;
            }
            if (c == '/') {
                state_ = TokenizerState::SelfClosingStartTag;
                continue;
            }
            if (c == '=') {
                state_ = TokenizerState::BeforeAttributeValue;
                continue;
            }
            if (c == '>') {
                return finish_tag();
            }
            begin_attribute();
            reconsume();
            state_ = TokenizerState::AttributeName;
            continue;
        }

        // ====================================================================
        // Before Attribute Value state
        // ====================================================================
        case TokenizerState::BeforeAttributeValue: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return emit_eof();
            }
            char c = consume();
            if (is_whitespace(c)) {
                continue;
            }
            if (c == '"') {
                state_ = TokenizerState::AttributeValueDoubleQuoted;
                continue;
            }
            if (c == '\'') {
                state_ = TokenizerState::AttributeValueSingleQuoted;
                continue;
            }
            if (c == '>') {
                return finish_tag();
            }
            reconsume();
            state_ = TokenizerState::AttributeValueUnquoted;
            continue;
        }

        // ====================================================================
        // Attribute Value (quoted) states
        // ====================================================================
        case TokenizerState::AttributeValueDoubleQuoted:
        case TokenizerState::AttributeValueSingleQuoted: {
            const char quote = state_ == TokenizerState::AttributeValueDoubleQuoted ? '"' : '\'';
            std::string& value = current_token_.attributes.back().value;
            while (!at_end()) {
                char c = consume();
                if (c == quote) {
                    state_ = TokenizerState::AfterAttributeValueQuoted;
                    break;
                }
                if (c == '&') {
                    value += try_consume_entity(true);
                } else if (c == '\0') {
                    value += kReplacementCharacter;
                } else {
                    value += c;
                }
            }
            if (state_ != TokenizerState::AfterAttributeValueQuoted) {
                state_ = TokenizerState::Data;
                return emit_eof();
            }
            continue;
        }

        // ====================================================================
        // Attribute Value (unquoted) state
        // ====================================================================
        case TokenizerState::AttributeValueUnquoted: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return emit_eof();
            }
            char c = consume();
            if (is_whitespace(c)) {
                state_ = TokenizerState::BeforeAttributeName;
                continue;
            }
            if (c == '>') {
                return finish_tag();
            }
            if (c == '&') {
                current_token_.attributes.back().value += try_consume_entity(true);
                continue;
            }
            current_token_.attributes.back().value += c;
            continue;
        }

        // ====================================================================
        // After Attribute Value (quoted) state
        // ====================================================================
        case TokenizerState::AfterAttributeValueQuoted: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return emit_eof();
            }
            char c = consume();
            if (is_whitespace(c)) {
                state_ = TokenizerState::BeforeAttributeName;
                continue;
            }
            if (c == '/') {
                state_ = TokenizerState::SelfClosingStartTag;
                continue;
            }
            if (c == '>') {
                return finish_tag();
            }
            reconsume();
            state_ = TokenizerState::BeforeAttributeName;
            continue;
        }

        // ====================================================================
        // Self-Closing Start Tag state
        // ====================================================================
        case TokenizerState::SelfClosingStartTag: {
            if (at_end()) {
                state_ = TokenizerState::Data;
                return emit_eof();
            }
            char c = consume();
            if (c == '>') {
                current_token_.self_closing = true;
                return finish_tag();
            }
            reconsume();
            state_ = TokenizerState::BeforeAttributeName;
            continue;
        }

        // ====================================================================
        // Bogus Comment state: everything up to the next '>'
        // ====================================================================
        case TokenizerState::BogusComment: {
            size_t close = input_.find('>', pos_);
            size_t end = close == std::string_view::npos ? input_.size() : close;
            Token t;
            t.type = Token::Comment;
            t.data = std::string(input_.substr(pos_, end - pos_));
            pos_ = close == std::string_view::npos ? input_.size() : close + 1;
            state_ = TokenizerState::Data;
            return t;
        }

        // ====================================================================
        // Markup Declaration Open state
        // ====================================================================
        case TokenizerState::MarkupDeclarationOpen: {
            if (lookahead_ci("--")) {
                pos_ += 2;
                state_ = TokenizerState::Comment;
                continue;
            }
            if (lookahead_ci("DOCTYPE")) {
                pos_ += 7;
                state_ = TokenizerState::DOCTYPE;
                continue;
            }
            // CDATA outside foreign content and anything else
            state_ = TokenizerState::BogusComment;
            continue;
        }

        // ====================================================================
        // Comment state: <!-- ... -->, including the abrupt <!--> and <!--->
        // ====================================================================
        case TokenizerState::Comment: {
            Token t;
            t.type = Token::Comment;
            state_ = TokenizerState::Data;
            if (lookahead_ci(">")) {
                pos_ += 1;
                return t;
            }
            if (lookahead_ci("->")) {
                pos_ += 2;
                return t;
            }
            size_t close = input_.find("-->", pos_);
            size_t bang_close = input_.find("--!>", pos_);
            size_t terminator_len = 3;
            if (bang_close != std::string_view::npos &&
                (close == std::string_view::npos || bang_close < close)) {
                close = bang_close;
                terminator_len = 4;
            }
            if (close == std::string_view::npos) {
                t.data = std::string(input_.substr(pos_));
                pos_ = input_.size();
                return t;
            }
            t.data = std::string(input_.substr(pos_, close - pos_));
            pos_ = close + terminator_len;
            return t;
        }

        // ====================================================================
        // DOCTYPE state: name plus optional PUBLIC/SYSTEM identifiers
        // ====================================================================
        case TokenizerState::DOCTYPE: {
            begin_tag(Token::DOCTYPE);
            while (!at_end() && is_whitespace(peek())) consume();
            while (!at_end() && !is_whitespace(peek()) && peek() != '>') {
                current_token_.name += to_lower(consume());
            }
            if (current_token_.name.empty()) {
                current_token_.force_quirks = true;
            }
            parse_doctype_identifiers();
            state_ = TokenizerState::Data;
            return std::move(current_token_);
        }

        // ====================================================================
        // Raw text states
        // ====================================================================
        case TokenizerState::RAWTEXT:
        case TokenizerState::ScriptData:
            return consume_raw_text(false);

        case TokenizerState::RCDATA:
            return consume_raw_text(true);

        case TokenizerState::PLAINTEXT: {
            if (at_end()) return emit_eof();
            std::string rest(input_.substr(pos_));
            pos_ = input_.size();
            return emit_string(std::move(rest));
        }

        } // switch
    }
}

} // namespace sleek::html
