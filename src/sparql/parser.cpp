#include <semgraph/sparql/parser.h>
#include <semgraph/ontology/vocab.h>
#include <semgraph/util/string_util.h>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <sstream>

namespace semgraph {
namespace sparql {

// ============================================================================
// Token Implementation
// ============================================================================

std::string Token::ToString() const {
    std::ostringstream oss;
    oss << "Token(" << static_cast<int>(type) << ", \"" << text
        << "\", line=" << line << ", col=" << column << ")";
    return oss.str();
}

// ============================================================================
// SPARQLTokenizer Implementation
// ============================================================================

SPARQLTokenizer::SPARQLTokenizer(std::string input)
    : input_(std::move(input)) {}

arrow::Result<std::vector<Token>> SPARQLTokenizer::Tokenize() {
    std::vector<Token> tokens;

    while (!IsAtEnd()) {
        SkipWhitespace();
        if (IsAtEnd()) break;

        if (CurrentChar() == '#') {
            SkipComment();
            continue;
        }

        char c = CurrentChar();
        Token token = MakeToken(TokenType::ERROR, "");

        if (c == '?' || c == '$') {
            // '?' not followed by a name is the zero-or-one path quantifier
            if (c == '?' && !IsAlphaNumeric(PeekChar()) && PeekChar() != '_') {
                token = MakeToken(TokenType::QUESTION, "?");
                Advance();
            } else {
                token = ReadVariable();
            }
        } else if (c == '<') {
            if (PeekChar() == '=') {
                token = MakeToken(TokenType::LESS_EQUAL, "<=");
                Advance();
                Advance();
            } else {
                // IRI if a '>' closes it before any character an IRI cannot hold
                bool found_close = false;
                for (size_t i = pos_ + 1; i < input_.size(); ++i) {
                    char ch = input_[i];
                    if (ch == '>') {
                        found_close = true;
                        break;
                    }
                    if (IsWhitespace(ch) || ch == '"' || ch == '{' || ch == '}' ||
                        ch == '|' || ch == '^' || ch == '`' || ch == '\\') {
                        break;
                    }
                }
                if (found_close) {
                    token = ReadIRI();
                } else {
                    token = MakeToken(TokenType::LESS_THAN, "<");
                    Advance();
                }
            }
        } else if (c == '"' || c == '\'') {
            token = ReadStringLiteral(c);
        } else if (IsDigit(c)) {
            token = ReadNumber();
        } else if (c == '@') {
            token = ReadLangTag();
        } else if (c == '_' && PeekChar() == ':') {
            size_t start_line = line_;
            size_t start_column = column_;
            Advance();  // _
            Advance();  // :
            std::string label;
            while (!IsAtEnd() && IsNameChar(CurrentChar())) {
                label += CurrentChar();
                Advance();
            }
            if (label.empty()) {
                token = MakeError("Blank node label expected after '_:'");
            } else {
                token = Token(TokenType::BLANK_NODE, label, start_line, start_column);
            }
        } else if (IsAlpha(c) || c == ':') {
            token = ReadKeywordOrPrefixedName();
        } else {
            token = ReadOperator();
        }

        if (token.type == TokenType::ERROR) {
            std::ostringstream oss;
            oss << "Lexical error at line " << token.line << ", column " << token.column
                << ": " << token.text;
            return arrow::Status::Invalid(oss.str());
        }
        tokens.push_back(std::move(token));
    }

    tokens.push_back(MakeToken(TokenType::END_OF_INPUT, ""));
    return tokens;
}

char SPARQLTokenizer::CurrentChar() const {
    if (IsAtEnd()) return '\0';
    return input_[pos_];
}

char SPARQLTokenizer::PeekChar(size_t offset) const {
    if (pos_ + offset >= input_.size()) return '\0';
    return input_[pos_ + offset];
}

bool SPARQLTokenizer::IsAtEnd() const {
    return pos_ >= input_.size();
}

void SPARQLTokenizer::Advance() {
    if (IsAtEnd()) return;
    if (input_[pos_] == '\n') {
        line_++;
        column_ = 1;
    } else {
        column_++;
    }
    pos_++;
}

void SPARQLTokenizer::SkipWhitespace() {
    while (!IsAtEnd() && IsWhitespace(CurrentChar())) {
        Advance();
    }
}

void SPARQLTokenizer::SkipComment() {
    while (!IsAtEnd() && CurrentChar() != '\n') {
        Advance();
    }
    if (!IsAtEnd()) Advance();
}

Token SPARQLTokenizer::ReadVariable() {
    size_t start_line = line_;
    size_t start_column = column_;
    char prefix = CurrentChar();
    Advance();

    std::string name;
    while (!IsAtEnd() && (IsAlphaNumeric(CurrentChar()) || CurrentChar() == '_')) {
        name += CurrentChar();
        Advance();
    }

    if (name.empty()) {
        return MakeError("Variable name expected after " + std::string(1, prefix));
    }

    return Token(TokenType::VARIABLE, std::string(1, prefix) + name, start_line, start_column);
}

Token SPARQLTokenizer::ReadIRI() {
    size_t start_line = line_;
    size_t start_column = column_;

    Advance();  // '<'

    std::string iri;
    while (!IsAtEnd() && CurrentChar() != '>') {
        iri += CurrentChar();
        Advance();
    }

    if (IsAtEnd()) {
        return MakeError("Unterminated IRI");
    }

    Advance();  // '>'

    return Token(TokenType::IRI_REF, "<" + iri + ">", start_line, start_column);
}

Token SPARQLTokenizer::ReadStringLiteral(char quote) {
    size_t start_line = line_;
    size_t start_column = column_;

    bool long_string = PeekChar() == quote && PeekChar(2) == quote;
    size_t delimiter = long_string ? 3 : 1;
    for (size_t i = 0; i < delimiter; ++i) {
        Advance();
    }

    std::string value;
    while (true) {
        if (IsAtEnd()) {
            return MakeError("Unterminated string literal");
        }
        char c = CurrentChar();
        if (c == quote && (!long_string || (PeekChar() == quote && PeekChar(2) == quote))) {
            break;
        }
        if (!long_string && (c == '\n' || c == '\r')) {
            return MakeError("Line break in short string literal");
        }
        if (c == '\\') {
            Advance();
            if (IsAtEnd()) {
                return MakeError("Unterminated string literal");
            }
            char escaped = CurrentChar();
            switch (escaped) {
                case 'n': value += '\n'; break;
                case 't': value += '\t'; break;
                case 'r': value += '\r'; break;
                case 'b': value += '\b'; break;
                case 'f': value += '\f'; break;
                case '\\': value += '\\'; break;
                case '"': value += '"'; break;
                case '\'': value += '\''; break;
                default:
                    return MakeError(std::string("Invalid escape sequence \\") + escaped);
            }
            Advance();
        } else {
            value += c;
            Advance();
        }
    }

    for (size_t i = 0; i < delimiter; ++i) {
        Advance();
    }

    return Token(TokenType::STRING_LITERAL, value, start_line, start_column);
}

Token SPARQLTokenizer::ReadNumber() {
    size_t start_line = line_;
    size_t start_column = column_;

    std::string number;
    TokenType type = TokenType::INTEGER;

    while (!IsAtEnd() && IsDigit(CurrentChar())) {
        number += CurrentChar();
        Advance();
    }

    // A '.' only continues the number when digits follow; otherwise it ends a triple
    if (CurrentChar() == '.' && IsDigit(PeekChar())) {
        type = TokenType::DECIMAL;
        number += '.';
        Advance();
        while (!IsAtEnd() && IsDigit(CurrentChar())) {
            number += CurrentChar();
            Advance();
        }
    }

    if (CurrentChar() == 'e' || CurrentChar() == 'E') {
        size_t sign = (PeekChar() == '+' || PeekChar() == '-') ? 1 : 0;
        if (IsDigit(PeekChar(1 + sign))) {
            type = TokenType::DOUBLE;
            number += CurrentChar();
            Advance();
            if (sign) {
                number += CurrentChar();
                Advance();
            }
            while (!IsAtEnd() && IsDigit(CurrentChar())) {
                number += CurrentChar();
                Advance();
            }
        }
    }

    return Token(type, number, start_line, start_column);
}

Token SPARQLTokenizer::ReadLangTag() {
    size_t start_line = line_;
    size_t start_column = column_;
    Advance();  // '@'

    std::string tag;
    while (!IsAtEnd() && (IsAlphaNumeric(CurrentChar()) || CurrentChar() == '-')) {
        tag += CurrentChar();
        Advance();
    }
    if (tag.empty() || !IsAlpha(tag[0])) {
        return MakeError("Language tag expected after '@'");
    }
    return Token(TokenType::LANG_TAG, tag, start_line, start_column);
}

Token SPARQLTokenizer::ReadKeywordOrPrefixedName() {
    size_t start_line = line_;
    size_t start_column = column_;

    std::string text;
    while (!IsAtEnd() && IsNameChar(CurrentChar())) {
        text += CurrentChar();
        Advance();
    }

    if (CurrentChar() == ':') {
        text += ':';
        Advance();
        // Local names may contain '.', but never end with one
        while (!IsAtEnd()) {
            char c = CurrentChar();
            if (IsNameChar(c)) {
                text += c;
                Advance();
            } else if (c == '.' && IsNameChar(PeekChar())) {
                text += c;
                Advance();
            } else {
                break;
            }
        }
        return Token(TokenType::PREFIX_LABEL, text, start_line, start_column);
    }

    if (text == "a") {
        return Token(TokenType::A, text, start_line, start_column);
    }

    auto keyword_type = LookupKeyword(ToUpper(text));
    if (keyword_type.has_value()) {
        return Token(*keyword_type, text, start_line, start_column);
    }

    return Token(TokenType::ERROR, "Unknown keyword '" + text + "'", start_line, start_column);
}

Token SPARQLTokenizer::ReadOperator() {
    size_t start_line = line_;
    size_t start_column = column_;
    char c = CurrentChar();

    switch (c) {
        case '(': Advance(); return Token(TokenType::LPAREN, "(", start_line, start_column);
        case ')': Advance(); return Token(TokenType::RPAREN, ")", start_line, start_column);
        case '{': Advance(); return Token(TokenType::LBRACE, "{", start_line, start_column);
        case '}': Advance(); return Token(TokenType::RBRACE, "}", start_line, start_column);
        case '[': Advance(); return Token(TokenType::LBRACKET, "[", start_line, start_column);
        case ']': Advance(); return Token(TokenType::RBRACKET, "]", start_line, start_column);
        case '.': Advance(); return Token(TokenType::DOT, ".", start_line, start_column);
        case ';': Advance(); return Token(TokenType::SEMICOLON, ";", start_line, start_column);
        case ',': Advance(); return Token(TokenType::COMMA, ",", start_line, start_column);
        case '+': Advance(); return Token(TokenType::PLUS, "+", start_line, start_column);
        case '-': Advance(); return Token(TokenType::MINUS, "-", start_line, start_column);
        case '*': Advance(); return Token(TokenType::MULTIPLY, "*", start_line, start_column);
        case '/': Advance(); return Token(TokenType::DIVIDE, "/", start_line, start_column);
        case '=': Advance(); return Token(TokenType::EQUAL, "=", start_line, start_column);

        case '!':
            Advance();
            if (CurrentChar() == '=') {
                Advance();
                return Token(TokenType::NOT_EQUAL, "!=", start_line, start_column);
            }
            return Token(TokenType::NOT, "!", start_line, start_column);

        case '>':
            Advance();
            if (CurrentChar() == '=') {
                Advance();
                return Token(TokenType::GREATER_EQUAL, ">=", start_line, start_column);
            }
            return Token(TokenType::GREATER_THAN, ">", start_line, start_column);

        case '&':
            Advance();
            if (CurrentChar() == '&') {
                Advance();
                return Token(TokenType::AND, "&&", start_line, start_column);
            }
            return MakeError("Expected '&&' for AND operator");

        case '|':
            Advance();
            if (CurrentChar() == '|') {
                Advance();
                return Token(TokenType::OR, "||", start_line, start_column);
            }
            return Token(TokenType::PIPE, "|", start_line, start_column);

        case '^':
            Advance();
            if (CurrentChar() == '^') {
                Advance();
                return Token(TokenType::DATATYPE_MARKER, "^^", start_line, start_column);
            }
            return Token(TokenType::CARET, "^", start_line, start_column);

        default:
            return MakeError("Unknown character '" + std::string(1, c) + "'");
    }
}

bool SPARQLTokenizer::IsWhitespace(char c) const {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool SPARQLTokenizer::IsDigit(char c) const {
    return c >= '0' && c <= '9';
}

bool SPARQLTokenizer::IsAlpha(char c) const {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool SPARQLTokenizer::IsAlphaNumeric(char c) const {
    return IsAlpha(c) || IsDigit(c);
}

bool SPARQLTokenizer::IsNameChar(char c) const {
    return IsAlphaNumeric(c) || c == '_' || c == '-';
}

Token SPARQLTokenizer::MakeToken(TokenType type, std::string text) {
    return Token(type, std::move(text), line_, column_);
}

Token SPARQLTokenizer::MakeError(std::string message) {
    return Token(TokenType::ERROR, std::move(message), line_, column_);
}

std::optional<TokenType> SPARQLTokenizer::LookupKeyword(const std::string& text) const {
    static const std::unordered_map<std::string, TokenType> keywords = {
        {"PREFIX", TokenType::PREFIX},
        {"BASE", TokenType::BASE},
        {"SELECT", TokenType::SELECT},
        {"ASK", TokenType::ASK},
        {"CONSTRUCT", TokenType::CONSTRUCT},
        {"DESCRIBE", TokenType::DESCRIBE},
        {"WHERE", TokenType::WHERE},
        {"FILTER", TokenType::FILTER},
        {"BIND", TokenType::BIND},
        {"OPTIONAL", TokenType::OPTIONAL},
        {"UNION", TokenType::UNION},
        {"ORDER", TokenType::ORDER},
        {"BY", TokenType::BY},
        {"ASC", TokenType::ASC},
        {"DESC", TokenType::DESC},
        {"DISTINCT", TokenType::DISTINCT},
        {"REDUCED", TokenType::REDUCED},
        {"LIMIT", TokenType::LIMIT},
        {"OFFSET", TokenType::OFFSET},
        {"AS", TokenType::AS},
        {"VALUES", TokenType::VALUES},
        {"UNDEF", TokenType::UNDEF},
        {"MINUS", TokenType::MINUS_KEYWORD},
        {"EXISTS", TokenType::EXISTS},
        {"NOT", TokenType::NOT_KEYWORD},
        {"IN", TokenType::IN},

        {"GROUP", TokenType::GROUP},
        {"HAVING", TokenType::HAVING},
        {"GRAPH", TokenType::GRAPH},
        {"FROM", TokenType::FROM},
        {"NAMED", TokenType::NAMED},
        {"SERVICE", TokenType::SERVICE},

        {"INSERT", TokenType::INSERT},
        {"DELETE", TokenType::DELETE},
        {"LOAD", TokenType::LOAD},
        {"CLEAR", TokenType::CLEAR},
        {"DROP", TokenType::DROP},
        {"CREATE", TokenType::CREATE},
        {"ADD", TokenType::ADD},
        {"MOVE", TokenType::MOVE},
        {"COPY", TokenType::COPY},
        {"WITH", TokenType::WITH},
        {"DATA", TokenType::DATA},
        {"ALL", TokenType::ALL},
        {"DEFAULT", TokenType::DEFAULT},
        {"SILENT", TokenType::SILENT},
        {"INTO", TokenType::INTO},
        {"TO", TokenType::TO},
        {"USING", TokenType::USING},

        {"BOUND", TokenType::BOUND},
        {"ISIRI", TokenType::ISIRI},
        {"ISURI", TokenType::ISURI},
        {"ISLITERAL", TokenType::ISLITERAL},
        {"ISBLANK", TokenType::ISBLANK},
        {"ISNUMERIC", TokenType::ISNUMERIC},
        {"STR", TokenType::STR},
        {"LANG", TokenType::LANG},
        {"DATATYPE", TokenType::DATATYPE},
        {"REGEX", TokenType::REGEX},

        {"STRLEN", TokenType::STRLEN},
        {"UCASE", TokenType::UCASE},
        {"LCASE", TokenType::LCASE},
        {"STRSTARTS", TokenType::STRSTARTS},
        {"STRENDS", TokenType::STRENDS},
        {"CONTAINS", TokenType::CONTAINS},
        {"CONCAT", TokenType::CONCAT},
        {"LANGMATCHES", TokenType::LANGMATCHES},

        {"IF", TokenType::IF},
        {"COALESCE", TokenType::COALESCE},

        {"COUNT", TokenType::COUNT},
        {"SUM", TokenType::SUM},
        {"AVG", TokenType::AVG},
        {"MIN", TokenType::MIN},
        {"MAX", TokenType::MAX},
        {"GROUP_CONCAT", TokenType::GROUP_CONCAT},
        {"SAMPLE", TokenType::SAMPLE},

        {"TRUE", TokenType::BOOLEAN},
        {"FALSE", TokenType::BOOLEAN},
    };

    auto it = keywords.find(text);
    if (it != keywords.end()) {
        return it->second;
    }
    return std::nullopt;
}

// ============================================================================
// SPARQLParser Implementation
// ============================================================================

namespace {

bool IsUpdateToken(TokenType type) {
    switch (type) {
        case TokenType::INSERT:
        case TokenType::DELETE:
        case TokenType::LOAD:
        case TokenType::CLEAR:
        case TokenType::DROP:
        case TokenType::CREATE:
        case TokenType::ADD:
        case TokenType::MOVE:
        case TokenType::COPY:
        case TokenType::WITH:
            return true;
        default:
            return false;
    }
}

bool IsUnsupportedToken(TokenType type) {
    switch (type) {
        case TokenType::GROUP:
        case TokenType::HAVING:
        case TokenType::GRAPH:
        case TokenType::FROM:
        case TokenType::NAMED:
        case TokenType::SERVICE:
        case TokenType::COUNT:
        case TokenType::SUM:
        case TokenType::AVG:
        case TokenType::MIN:
        case TokenType::MAX:
        case TokenType::GROUP_CONCAT:
        case TokenType::SAMPLE:
        case TokenType::DATA:
        case TokenType::ALL:
        case TokenType::DEFAULT:
        case TokenType::SILENT:
        case TokenType::INTO:
        case TokenType::TO:
        case TokenType::USING:
            return true;
        default:
            return false;
    }
}

bool IsPathOperator(TokenType type) {
    return type == TokenType::DIVIDE || type == TokenType::PIPE ||
           type == TokenType::MULTIPLY || type == TokenType::PLUS ||
           type == TokenType::QUESTION;
}

std::optional<ExprOperator> BuiltInOperator(TokenType type) {
    switch (type) {
        case TokenType::BOUND: return ExprOperator::Bound;
        case TokenType::ISIRI: return ExprOperator::IsIRI;
        case TokenType::ISURI: return ExprOperator::IsIRI;
        case TokenType::ISLITERAL: return ExprOperator::IsLiteral;
        case TokenType::ISBLANK: return ExprOperator::IsBlank;
        case TokenType::ISNUMERIC: return ExprOperator::IsNumeric;
        case TokenType::STR: return ExprOperator::Str;
        case TokenType::LANG: return ExprOperator::Lang;
        case TokenType::DATATYPE: return ExprOperator::Datatype;
        case TokenType::REGEX: return ExprOperator::Regex;
        case TokenType::STRLEN: return ExprOperator::StrLen;
        case TokenType::UCASE: return ExprOperator::UCase;
        case TokenType::LCASE: return ExprOperator::LCase;
        case TokenType::STRSTARTS: return ExprOperator::StrStarts;
        case TokenType::STRENDS: return ExprOperator::StrEnds;
        case TokenType::CONTAINS: return ExprOperator::Contains;
        case TokenType::CONCAT: return ExprOperator::Concat;
        case TokenType::LANGMATCHES: return ExprOperator::LangMatches;
        case TokenType::IF: return ExprOperator::If;
        case TokenType::COALESCE: return ExprOperator::Coalesce;
        default: return std::nullopt;
    }
}

// Allowed argument count range per built-in; max of SIZE_MAX means variadic
std::pair<size_t, size_t> BuiltInArity(ExprOperator op) {
    switch (op) {
        case ExprOperator::Regex: return {2, 3};
        case ExprOperator::StrStarts:
        case ExprOperator::StrEnds:
        case ExprOperator::Contains:
        case ExprOperator::LangMatches: return {2, 2};
        case ExprOperator::If: return {3, 3};
        case ExprOperator::Concat: return {0, SIZE_MAX};
        case ExprOperator::Coalesce: return {1, SIZE_MAX};
        default: return {1, 1};
    }
}

arrow::Result<size_t> ParseCount(const std::string& text) {
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return arrow::Status::Invalid("Integer out of range: ", text);
    }
    return value;
}

} // namespace

SPARQLParser::SPARQLParser(std::vector<Token> tokens)
    : tokens_(std::move(tokens)) {
    prefixes_["rdf"] = std::string(vocab::kRdfNs);
    prefixes_["rdfs"] = std::string(vocab::kRdfsNs);
    prefixes_["skos"] = std::string(vocab::kSkosNs);
    prefixes_["owl"] = std::string(vocab::kOwlNs);
    prefixes_["xsd"] = std::string(vocab::kXsdNs);
}

arrow::Result<Query> SPARQLParser::Parse() {
    ARROW_RETURN_NOT_OK(RejectUnsupportedTokens());

    Query query;

    while (Check(TokenType::BASE) || Check(TokenType::PREFIX)) {
        if (Check(TokenType::BASE)) {
            ARROW_ASSIGN_OR_RAISE(auto base, ParseBaseDeclaration());
            query.base_iri = std::move(base);
        } else {
            ARROW_RETURN_NOT_OK(ParsePrefixDeclaration());
        }
    }

    if (Check(TokenType::SELECT)) {
        ARROW_ASSIGN_OR_RAISE(auto select_query, ParseSelectQuery());
        query.query_body = std::move(select_query);
    } else if (Check(TokenType::ASK)) {
        ARROW_ASSIGN_OR_RAISE(auto ask_query, ParseAskQuery());
        query.query_body = std::move(ask_query);
    } else if (Check(TokenType::CONSTRUCT)) {
        ARROW_ASSIGN_OR_RAISE(auto construct_query, ParseConstructQuery());
        query.query_body = std::move(construct_query);
    } else if (Check(TokenType::DESCRIBE)) {
        ARROW_ASSIGN_OR_RAISE(auto describe_query, ParseDescribeQuery());
        query.query_body = std::move(describe_query);
    } else {
        return Error("Expected SELECT, ASK, CONSTRUCT, or DESCRIBE");
    }

    if (!IsAtEnd()) {
        return Error("Unexpected input after end of query");
    }

    return query;
}

// Token navigation

const Token& SPARQLParser::CurrentToken() const {
    if (IsAtEnd()) {
        return tokens_.back();
    }
    return tokens_[pos_];
}

const Token& SPARQLParser::PeekToken(size_t offset) const {
    if (pos_ + offset >= tokens_.size()) {
        return tokens_.back();
    }
    return tokens_[pos_ + offset];
}

bool SPARQLParser::IsAtEnd() const {
    return pos_ >= tokens_.size() || tokens_[pos_].type == TokenType::END_OF_INPUT;
}

void SPARQLParser::Advance() {
    if (!IsAtEnd()) {
        pos_++;
    }
}

bool SPARQLParser::Match(TokenType type) {
    if (Check(type)) {
        Advance();
        return true;
    }
    return false;
}

bool SPARQLParser::Check(TokenType type) const {
    if (IsAtEnd()) return false;
    return CurrentToken().type == type;
}

arrow::Status SPARQLParser::Expect(TokenType type, const std::string& message) {
    if (!Check(type)) {
        return Error(message);
    }
    Advance();
    return arrow::Status::OK();
}

arrow::Status SPARQLParser::Error(const std::string& message) const {
    const Token& token = CurrentToken();
    std::ostringstream oss;
    oss << "Parse error at line " << token.line << ", column " << token.column
        << ": " << message << " (found: '" << token.text << "')";
    return arrow::Status::Invalid(oss.str());
}

arrow::Status SPARQLParser::RejectUnsupportedTokens() const {
    for (const Token& token : tokens_) {
        if (IsUpdateToken(token.type)) {
            return arrow::Status::Invalid("Update operation '", ToUpper(token.text),
                                          "' is not allowed; only read-only queries are accepted");
        }
    }
    for (const Token& token : tokens_) {
        if (IsUnsupportedToken(token.type)) {
            std::ostringstream oss;
            oss << "Unsupported construct '" << ToUpper(token.text) << "' at line "
                << token.line << ", column " << token.column;
            return arrow::Status::Invalid(oss.str());
        }
    }
    return arrow::Status::OK();
}

// ============================================================================
// Prologue
// ============================================================================

arrow::Result<std::string> SPARQLParser::ParseBaseDeclaration() {
    ARROW_RETURN_NOT_OK(Expect(TokenType::BASE, "Expected BASE keyword"));

    if (!Check(TokenType::IRI_REF)) {
        return Error("Expected IRI after BASE");
    }
    const std::string& text = CurrentToken().text;
    base_iri_ = text.substr(1, text.size() - 2);
    Advance();

    return base_iri_;
}

arrow::Status SPARQLParser::ParsePrefixDeclaration() {
    ARROW_RETURN_NOT_OK(Expect(TokenType::PREFIX, "Expected PREFIX keyword"));

    if (!Check(TokenType::PREFIX_LABEL) || CurrentToken().text.back() != ':') {
        return Error("Expected prefix label ending in ':' after PREFIX");
    }
    std::string label = CurrentToken().text;
    label.pop_back();
    Advance();

    if (!Check(TokenType::IRI_REF)) {
        return Error("Expected IRI after prefix label");
    }
    const std::string& text = CurrentToken().text;
    prefixes_[label] = ExpandRelativeIRI(text.substr(1, text.size() - 2));
    Advance();

    return arrow::Status::OK();
}

arrow::Result<std::string> SPARQLParser::ExpandPrefixedName(const std::string& prefixed_name) {
    size_t colon_pos = prefixed_name.find(':');
    if (colon_pos == std::string::npos) {
        return Error("Expected prefixed name");
    }

    std::string prefix = prefixed_name.substr(0, colon_pos);
    auto it = prefixes_.find(prefix);
    if (it == prefixes_.end()) {
        return Error("Undefined prefix '" + prefix + "'");
    }

    return it->second + prefixed_name.substr(colon_pos + 1);
}

std::string SPARQLParser::ExpandRelativeIRI(const std::string& iri) const {
    if (base_iri_.empty()) {
        return iri;
    }

    // Absolute IRIs start with a scheme
    size_t colon_pos = iri.find(':');
    if (colon_pos != std::string::npos && colon_pos > 0) {
        bool is_scheme = std::isalpha(static_cast<unsigned char>(iri[0])) != 0;
        for (size_t i = 0; i < colon_pos && is_scheme; ++i) {
            char c = iri[i];
            is_scheme = std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' ||
                        c == '.';
        }
        if (is_scheme) {
            return iri;
        }
    }

    if (base_iri_.back() == '/' || base_iri_.back() == '#') {
        return base_iri_ + iri;
    }
    if (!iri.empty() && iri[0] != '/' && iri[0] != '#') {
        return base_iri_ + "/" + iri;
    }
    return base_iri_ + iri;
}

// ============================================================================
// Query forms
// ============================================================================

arrow::Result<SelectQuery> SPARQLParser::ParseSelectQuery() {
    SelectQuery query;

    QueryPattern projected;
    ARROW_ASSIGN_OR_RAISE(query.select, ParseSelectClause(projected));

    Match(TokenType::WHERE);
    if (!Check(TokenType::LBRACE)) {
        return Error("Expected WHERE keyword or '{' for graph pattern");
    }
    ARROW_ASSIGN_OR_RAISE(query.where, ParseWhereClause());

    // (expr AS ?v) projections are evaluated after the pattern's own BINDs
    query.where.binds.insert(query.where.binds.end(), projected.binds.begin(),
                             projected.binds.end());

    ARROW_RETURN_NOT_OK(ParseSolutionModifiers(query.modifiers));
    return query;
}

arrow::Result<SelectClause> SPARQLParser::ParseSelectClause(QueryPattern& where_binds) {
    SelectClause clause;

    ARROW_RETURN_NOT_OK(Expect(TokenType::SELECT, "Expected SELECT keyword"));

    // REDUCED permits duplicate elimination, so it is evaluated as DISTINCT
    if (Match(TokenType::DISTINCT) || Match(TokenType::REDUCED)) {
        clause.distinct = true;
    }

    if (Match(TokenType::MULTIPLY)) {
        return clause;
    }

    while (Check(TokenType::VARIABLE) || Check(TokenType::LPAREN)) {
        if (Match(TokenType::LPAREN)) {
            ARROW_ASSIGN_OR_RAISE(auto expr, ParseExpression());
            ARROW_RETURN_NOT_OK(Expect(TokenType::AS, "Expected AS in SELECT expression"));
            ARROW_ASSIGN_OR_RAISE(auto alias, ParseVariable());
            ARROW_RETURN_NOT_OK(Expect(TokenType::RPAREN, "Expected ')' after SELECT expression"));
            where_binds.binds.emplace_back(expr, alias);
            clause.variables.push_back(alias);
        } else {
            ARROW_ASSIGN_OR_RAISE(auto var, ParseVariable());
            clause.variables.push_back(std::move(var));
        }
    }

    if (clause.variables.empty()) {
        if (Check(TokenType::LBRACE) || Check(TokenType::WHERE)) {
            return Error("Expected variables or '*' after SELECT");
        }
        return Error("Expected variable, '(' or '*' in SELECT clause");
    }

    return clause;
}

arrow::Result<AskQuery> SPARQLParser::ParseAskQuery() {
    AskQuery query;

    ARROW_RETURN_NOT_OK(Expect(TokenType::ASK, "Expected ASK keyword"));

    Match(TokenType::WHERE);
    if (!Check(TokenType::LBRACE)) {
        return Error("Expected WHERE keyword or '{' for graph pattern");
    }
    ARROW_ASSIGN_OR_RAISE(query.where, ParseWhereClause());

    return query;
}

arrow::Result<ConstructQuery> SPARQLParser::ParseConstructQuery() {
    ConstructQuery query;

    ARROW_RETURN_NOT_OK(Expect(TokenType::CONSTRUCT, "Expected CONSTRUCT keyword"));

    // CONSTRUCT WHERE { bgp }: the pattern doubles as the template
    if (Match(TokenType::WHERE)) {
        ARROW_ASSIGN_OR_RAISE(query.where, ParseWhereClause());
        const QueryPattern& where = query.where;
        if (!where.filters.empty() || !where.binds.empty() || !where.optionals.empty() ||
            !where.unions.empty() || !where.values.empty() || !where.minus_patterns.empty()) {
            return Error("CONSTRUCT WHERE requires a basic graph pattern");
        }
        if (where.bgp) {
            query.construct_template = where.bgp->triples;
        }
        ARROW_RETURN_NOT_OK(ParseSolutionModifiers(query.modifiers));
        return query;
    }

    in_template_ = true;
    auto construct_template = ParseConstructTemplate();
    in_template_ = false;
    ARROW_ASSIGN_OR_RAISE(query.construct_template, std::move(construct_template));

    Match(TokenType::WHERE);
    if (!Check(TokenType::LBRACE)) {
        return Error("Expected WHERE keyword or '{' for graph pattern");
    }
    ARROW_ASSIGN_OR_RAISE(query.where, ParseWhereClause());

    ARROW_RETURN_NOT_OK(ParseSolutionModifiers(query.modifiers));
    return query;
}

arrow::Result<std::vector<TriplePattern>> SPARQLParser::ParseConstructTemplate() {
    std::vector<TriplePattern> triples;

    ARROW_RETURN_NOT_OK(Expect(TokenType::LBRACE, "Expected '{' to start CONSTRUCT template"));

    while (!Check(TokenType::RBRACE) && !IsAtEnd()) {
        ARROW_RETURN_NOT_OK(ParseTriplesBlock(triples));
    }

    ARROW_RETURN_NOT_OK(Expect(TokenType::RBRACE, "Expected '}' to end CONSTRUCT template"));

    return triples;
}

arrow::Result<DescribeQuery> SPARQLParser::ParseDescribeQuery() {
    DescribeQuery query;

    ARROW_RETURN_NOT_OK(Expect(TokenType::DESCRIBE, "Expected DESCRIBE keyword"));

    if (Match(TokenType::MULTIPLY)) {
        query.describe_all = true;
    } else {
        while (Check(TokenType::VARIABLE) || Check(TokenType::IRI_REF) ||
               Check(TokenType::PREFIX_LABEL)) {
            ARROW_ASSIGN_OR_RAISE(auto resource, ParseRDFTerm());
            query.resources.push_back(std::move(resource));
        }
        if (query.resources.empty()) {
            return Error("DESCRIBE requires at least one resource or '*'");
        }
    }

    if (Match(TokenType::WHERE) || Check(TokenType::LBRACE)) {
        ARROW_ASSIGN_OR_RAISE(auto where, ParseWhereClause());
        query.where = std::move(where);
    }

    if (!query.where) {
        if (query.describe_all) {
            return Error("DESCRIBE * requires a WHERE clause");
        }
        for (const auto& resource : query.resources) {
            if (IsVariable(resource)) {
                return Error("DESCRIBE of variable " + sparql::ToString(resource) +
                             " requires a WHERE clause");
            }
        }
    }

    ARROW_RETURN_NOT_OK(ParseSolutionModifiers(query.modifiers));
    return query;
}

// ============================================================================
// Graph patterns
// ============================================================================

arrow::Result<QueryPattern> SPARQLParser::ParseWhereClause() {
    QueryPattern pattern;

    ARROW_RETURN_NOT_OK(Expect(TokenType::LBRACE, "Expected '{' to start graph pattern"));

    while (!Check(TokenType::RBRACE) && !IsAtEnd()) {
        if (Check(TokenType::FILTER)) {
            ARROW_ASSIGN_OR_RAISE(auto filter, ParseFilterClause());
            pattern.filters.push_back(std::move(filter));
        } else if (Check(TokenType::BIND)) {
            ARROW_ASSIGN_OR_RAISE(auto bind, ParseBindClause());
            pattern.binds.push_back(std::move(bind));
        } else if (Match(TokenType::OPTIONAL)) {
            ARROW_ASSIGN_OR_RAISE(auto optional_where, ParseWhereClause());
            pattern.optionals.emplace_back(std::make_shared<QueryPattern>(std::move(optional_where)));
        } else if (Match(TokenType::MINUS_KEYWORD)) {
            ARROW_ASSIGN_OR_RAISE(auto minus_where, ParseWhereClause());
            pattern.minus_patterns.emplace_back(std::make_shared<QueryPattern>(std::move(minus_where)));
        } else if (Check(TokenType::VALUES)) {
            ARROW_ASSIGN_OR_RAISE(auto values, ParseValuesClause());
            pattern.values.push_back(std::move(values));
        } else if (Check(TokenType::SELECT) ||
                   (Check(TokenType::LBRACE) && PeekToken().type == TokenType::SELECT)) {
            return Error("Sub-queries are not supported");
        } else if (Check(TokenType::UNION)) {
            return Error("UNION must follow a group graph pattern");
        } else if (Check(TokenType::LBRACE)) {
            ARROW_ASSIGN_OR_RAISE(auto nested_pattern, ParseWhereClause());

            if (Check(TokenType::UNION)) {
                UnionPattern union_pattern;
                union_pattern.patterns.push_back(
                    std::make_shared<QueryPattern>(std::move(nested_pattern)));
                while (Match(TokenType::UNION)) {
                    ARROW_ASSIGN_OR_RAISE(auto branch, ParseWhereClause());
                    union_pattern.patterns.push_back(
                        std::make_shared<QueryPattern>(std::move(branch)));
                }
                pattern.unions.push_back(std::move(union_pattern));
            } else {
                pattern.Merge(nested_pattern);
            }
        } else if (Match(TokenType::DOT)) {
            // Separator after a non-triple element
        } else {
            if (!pattern.bgp) {
                pattern.bgp = BasicGraphPattern();
            }
            ARROW_RETURN_NOT_OK(ParseTriplesBlock(pattern.bgp->triples));
        }
    }

    ARROW_RETURN_NOT_OK(Expect(TokenType::RBRACE, "Expected '}' to end graph pattern"));

    return pattern;
}

arrow::Status SPARQLParser::ParseTriplesBlock(std::vector<TriplePattern>& out) {
    bool property_list_subject = Check(TokenType::LBRACKET) &&
                                 PeekToken().type != TokenType::RBRACKET;
    ARROW_ASSIGN_OR_RAISE(auto subject, ParseTermOrNode(out));

    // "[ :p :o ] ." is a complete triples block on its own
    bool subject_only = property_list_subject &&
                        (Check(TokenType::DOT) || Check(TokenType::RBRACE));
    if (!subject_only) {
        ARROW_RETURN_NOT_OK(ParsePropertyList(subject, out, TokenType::DOT));
    }

    Match(TokenType::DOT);
    return arrow::Status::OK();
}

arrow::Status SPARQLParser::ParsePropertyList(const RDFTerm& subject,
                                              std::vector<TriplePattern>& out,
                                              TokenType terminator) {
    while (true) {
        ARROW_ASSIGN_OR_RAISE(auto predicate, ParsePredicate());

        // Object list: ?s :p ?o1, ?o2
        while (true) {
            ARROW_ASSIGN_OR_RAISE(auto object, ParseTermOrNode(out));
            out.emplace_back(subject, predicate, std::move(object));
            if (!Match(TokenType::COMMA)) {
                break;
            }
        }

        // Predicate list: ?s :p1 ?o1 ; :p2 ?o2 (trailing ';' allowed)
        if (!Match(TokenType::SEMICOLON)) {
            return arrow::Status::OK();
        }
        while (Match(TokenType::SEMICOLON)) {
        }
        if (Check(terminator) || Check(TokenType::DOT) || Check(TokenType::RBRACE) ||
            Check(TokenType::RBRACKET)) {
            return arrow::Status::OK();
        }
    }
}

arrow::Result<RDFTerm> SPARQLParser::ParseTermOrNode(std::vector<TriplePattern>& out) {
    if (Match(TokenType::LBRACKET)) {
        RDFTerm node = FreshBlankNodeTerm();
        if (!Check(TokenType::RBRACKET)) {
            ARROW_RETURN_NOT_OK(ParsePropertyList(node, out, TokenType::RBRACKET));
        }
        ARROW_RETURN_NOT_OK(Expect(TokenType::RBRACKET, "Expected ']' to end blank node"));
        return node;
    }
    if (Check(TokenType::LPAREN)) {
        return Error("RDF collections are not supported in queries");
    }
    return ParseRDFTerm();
}

arrow::Result<RDFTerm> SPARQLParser::ParsePredicate() {
    if (Check(TokenType::CARET) || Check(TokenType::NOT) || Check(TokenType::LPAREN)) {
        return Error("Property paths are not supported");
    }

    RDFTerm predicate;
    if (Match(TokenType::A)) {
        predicate = Iri(std::string(vocab::kRdfType));
    } else if (Check(TokenType::VARIABLE) || Check(TokenType::IRI_REF) ||
               Check(TokenType::PREFIX_LABEL)) {
        ARROW_ASSIGN_OR_RAISE(predicate, ParseRDFTerm());
    } else {
        return Error("Expected predicate (variable, IRI or 'a')");
    }

    if (IsPathOperator(CurrentToken().type)) {
        return Error("Property paths are not supported");
    }
    return predicate;
}

arrow::Result<RDFTerm> SPARQLParser::ParseRDFTerm() {
    const Token& token = CurrentToken();

    switch (token.type) {
        case TokenType::VARIABLE: {
            ARROW_ASSIGN_OR_RAISE(auto var, ParseVariable());
            return RDFTerm(std::move(var));
        }
        case TokenType::IRI_REF: {
            ARROW_ASSIGN_OR_RAISE(auto iri, ParseIRI());
            return RDFTerm(std::move(iri));
        }
        case TokenType::PREFIX_LABEL: {
            ARROW_ASSIGN_OR_RAISE(auto full_iri, ExpandPrefixedName(token.text));
            Advance();
            return RDFTerm(Iri(std::move(full_iri)));
        }
        case TokenType::STRING_LITERAL:
        case TokenType::INTEGER:
        case TokenType::DECIMAL:
        case TokenType::DOUBLE:
        case TokenType::BOOLEAN: {
            ARROW_ASSIGN_OR_RAISE(auto lit, ParseLiteral());
            return RDFTerm(std::move(lit));
        }
        case TokenType::PLUS:
        case TokenType::MINUS: {
            TokenType next = PeekToken().type;
            if (next != TokenType::INTEGER && next != TokenType::DECIMAL &&
                next != TokenType::DOUBLE) {
                break;
            }
            std::string sign = token.type == TokenType::MINUS ? "-" : "";
            Advance();
            ARROW_ASSIGN_OR_RAISE(auto lit, ParseLiteral());
            lit.value = sign + lit.value;
            return RDFTerm(std::move(lit));
        }
        case TokenType::BLANK_NODE: {
            std::string label = token.text;
            Advance();
            return BlankNodeTerm(label);
        }
        default:
            break;
    }

    return Error("Expected RDF term (variable, IRI, literal, or blank node)");
}

RDFTerm SPARQLParser::BlankNodeTerm(const std::string& label) {
    if (in_template_) {
        return BlankNode(label);
    }
    return Variable("._" + label);
}

RDFTerm SPARQLParser::FreshBlankNodeTerm() {
    std::string label = "anon" + std::to_string(blank_node_counter_++);
    if (in_template_) {
        return BlankNode(label);
    }
    return Variable("." + label);
}

arrow::Result<FilterClause> SPARQLParser::ParseFilterClause() {
    ARROW_RETURN_NOT_OK(Expect(TokenType::FILTER, "Expected FILTER keyword"));

    ARROW_ASSIGN_OR_RAISE(auto expr, ParseExpression());

    return FilterClause(expr);
}

arrow::Result<BindClause> SPARQLParser::ParseBindClause() {
    ARROW_RETURN_NOT_OK(Expect(TokenType::BIND, "Expected BIND keyword"));
    ARROW_RETURN_NOT_OK(Expect(TokenType::LPAREN, "Expected '(' after BIND"));

    ARROW_ASSIGN_OR_RAISE(auto expr, ParseExpression());

    ARROW_RETURN_NOT_OK(Expect(TokenType::AS, "Expected AS in BIND clause"));

    ARROW_ASSIGN_OR_RAISE(auto alias, ParseVariable());

    ARROW_RETURN_NOT_OK(Expect(TokenType::RPAREN, "Expected ')' to close BIND"));

    return BindClause(expr, alias);
}

arrow::Result<ValuesClause> SPARQLParser::ParseValuesClause() {
    ValuesClause values;

    ARROW_RETURN_NOT_OK(Expect(TokenType::VALUES, "Expected VALUES keyword"));

    if (Check(TokenType::VARIABLE)) {
        // VALUES ?x { a b UNDEF }
        ARROW_ASSIGN_OR_RAISE(auto var, ParseVariable());
        values.variables.push_back(std::move(var));

        ARROW_RETURN_NOT_OK(Expect(TokenType::LBRACE, "Expected '{' for VALUES data"));
        while (!Check(TokenType::RBRACE) && !IsAtEnd()) {
            ARROW_ASSIGN_OR_RAISE(auto value, ParseDataValue());
            values.rows.push_back({std::move(value)});
        }
        ARROW_RETURN_NOT_OK(Expect(TokenType::RBRACE, "Expected '}' after VALUES data"));
        return values;
    }

    // VALUES (?x ?y) { (a b) (UNDEF c) }
    ARROW_RETURN_NOT_OK(Expect(TokenType::LPAREN, "Expected '(' or variable after VALUES"));
    while (!Check(TokenType::RPAREN) && !IsAtEnd()) {
        ARROW_ASSIGN_OR_RAISE(auto var, ParseVariable());
        values.variables.push_back(std::move(var));
    }
    ARROW_RETURN_NOT_OK(Expect(TokenType::RPAREN, "Expected ')' after variable list"));

    ARROW_RETURN_NOT_OK(Expect(TokenType::LBRACE, "Expected '{' for VALUES data"));
    while (!Check(TokenType::RBRACE) && !IsAtEnd()) {
        ARROW_RETURN_NOT_OK(Expect(TokenType::LPAREN, "Expected '(' for data row"));

        std::vector<std::optional<RDFTerm>> row;
        while (!Check(TokenType::RPAREN) && !IsAtEnd()) {
            ARROW_ASSIGN_OR_RAISE(auto value, ParseDataValue());
            row.push_back(std::move(value));
        }
        if (row.size() != values.variables.size()) {
            return Error("VALUES data row size does not match variable count");
        }
        ARROW_RETURN_NOT_OK(Expect(TokenType::RPAREN, "Expected ')' after data row"));

        values.rows.push_back(std::move(row));
    }
    ARROW_RETURN_NOT_OK(Expect(TokenType::RBRACE, "Expected '}' after VALUES data"));

    return values;
}

arrow::Result<std::optional<RDFTerm>> SPARQLParser::ParseDataValue() {
    if (Match(TokenType::UNDEF)) {
        return std::optional<RDFTerm>();
    }
    if (Check(TokenType::VARIABLE) || Check(TokenType::BLANK_NODE)) {
        return Error("VALUES data must be IRIs, literals or UNDEF");
    }
    ARROW_ASSIGN_OR_RAISE(auto term, ParseRDFTerm());
    return std::optional<RDFTerm>(std::move(term));
}

// ============================================================================
// Expressions
// ============================================================================

arrow::Result<std::shared_ptr<Expression>> SPARQLParser::ParseExpression() {
    return ParseOrExpression();
}

arrow::Result<std::shared_ptr<Expression>> SPARQLParser::ParseOrExpression() {
    ARROW_ASSIGN_OR_RAISE(auto left, ParseAndExpression());

    while (Match(TokenType::OR)) {
        ARROW_ASSIGN_OR_RAISE(auto right, ParseAndExpression());

        auto or_expr = std::make_shared<Expression>(ExprOperator::Or);
        or_expr->arguments.push_back(left);
        or_expr->arguments.push_back(right);
        left = or_expr;
    }

    return left;
}

arrow::Result<std::shared_ptr<Expression>> SPARQLParser::ParseAndExpression() {
    ARROW_ASSIGN_OR_RAISE(auto left, ParseComparisonExpression());

    while (Match(TokenType::AND)) {
        ARROW_ASSIGN_OR_RAISE(auto right, ParseComparisonExpression());

        auto and_expr = std::make_shared<Expression>(ExprOperator::And);
        and_expr->arguments.push_back(left);
        and_expr->arguments.push_back(right);
        left = and_expr;
    }

    return left;
}

arrow::Result<std::shared_ptr<Expression>> SPARQLParser::ParseComparisonExpression() {
    ARROW_ASSIGN_OR_RAISE(auto left, ParseAdditiveExpression());

    std::optional<ExprOperator> op;
    switch (CurrentToken().type) {
        case TokenType::EQUAL: op = ExprOperator::Equal; break;
        case TokenType::NOT_EQUAL: op = ExprOperator::NotEqual; break;
        case TokenType::LESS_THAN: op = ExprOperator::LessThan; break;
        case TokenType::LESS_EQUAL: op = ExprOperator::LessThanEqual; break;
        case TokenType::GREATER_THAN: op = ExprOperator::GreaterThan; break;
        case TokenType::GREATER_EQUAL: op = ExprOperator::GreaterThanEqual; break;
        default: break;
    }

    if (op && !IsAtEnd()) {
        Advance();
        ARROW_ASSIGN_OR_RAISE(auto right, ParseAdditiveExpression());
        auto expr = std::make_shared<Expression>(*op);
        expr->arguments.push_back(left);
        expr->arguments.push_back(right);
        return expr;
    }

    if (Check(TokenType::NOT_KEYWORD) && PeekToken().type == TokenType::IN) {
        Advance();  // NOT
        Advance();  // IN
        auto expr = std::make_shared<Expression>(ExprOperator::NotIn);
        expr->arguments.push_back(left);
        return ParseExpressionList(expr);
    }
    if (Match(TokenType::IN)) {
        auto expr = std::make_shared<Expression>(ExprOperator::In);
        expr->arguments.push_back(left);
        return ParseExpressionList(expr);
    }

    return left;
}

arrow::Result<std::shared_ptr<Expression>> SPARQLParser::ParseExpressionList(
    std::shared_ptr<Expression> expr) {
    ARROW_RETURN_NOT_OK(Expect(TokenType::LPAREN, "Expected '(' to start IN list"));

    if (!Check(TokenType::RPAREN)) {
        while (true) {
            ARROW_ASSIGN_OR_RAISE(auto value, ParseExpression());
            expr->arguments.push_back(value);
            if (!Match(TokenType::COMMA)) {
                break;
            }
        }
    }

    ARROW_RETURN_NOT_OK(Expect(TokenType::RPAREN, "Expected ')' after IN list"));
    return expr;
}

arrow::Result<std::shared_ptr<Expression>> SPARQLParser::ParseAdditiveExpression() {
    ARROW_ASSIGN_OR_RAISE(auto left, ParseMultiplicativeExpression());

    while (Check(TokenType::PLUS) || Check(TokenType::MINUS)) {
        ExprOperator op = Check(TokenType::PLUS) ? ExprOperator::Plus : ExprOperator::Minus;
        Advance();
        ARROW_ASSIGN_OR_RAISE(auto right, ParseMultiplicativeExpression());

        auto expr = std::make_shared<Expression>(op);
        expr->arguments.push_back(left);
        expr->arguments.push_back(right);
        left = expr;
    }

    return left;
}

arrow::Result<std::shared_ptr<Expression>> SPARQLParser::ParseMultiplicativeExpression() {
    ARROW_ASSIGN_OR_RAISE(auto left, ParseUnaryExpression());

    while (Check(TokenType::MULTIPLY) || Check(TokenType::DIVIDE)) {
        ExprOperator op = Check(TokenType::MULTIPLY) ? ExprOperator::Multiply : ExprOperator::Divide;
        Advance();
        ARROW_ASSIGN_OR_RAISE(auto right, ParseUnaryExpression());

        auto expr = std::make_shared<Expression>(op);
        expr->arguments.push_back(left);
        expr->arguments.push_back(right);
        left = expr;
    }

    return left;
}

arrow::Result<std::shared_ptr<Expression>> SPARQLParser::ParseUnaryExpression() {
    if (Match(TokenType::NOT)) {
        ARROW_ASSIGN_OR_RAISE(auto operand, ParseUnaryExpression());
        auto expr = std::make_shared<Expression>(ExprOperator::Not);
        expr->arguments.push_back(operand);
        return expr;
    }
    if (Match(TokenType::MINUS)) {
        ARROW_ASSIGN_OR_RAISE(auto operand, ParseUnaryExpression());
        auto expr = std::make_shared<Expression>(ExprOperator::Negate);
        expr->arguments.push_back(operand);
        return expr;
    }
    if (Match(TokenType::PLUS)) {
        return ParseUnaryExpression();
    }

    return ParsePrimaryExpression();
}

arrow::Result<std::shared_ptr<Expression>> SPARQLParser::ParsePrimaryExpression() {
    if (Match(TokenType::LPAREN)) {
        ARROW_ASSIGN_OR_RAISE(auto expr, ParseExpression());
        ARROW_RETURN_NOT_OK(Expect(TokenType::RPAREN, "Expected ')' after expression"));
        return expr;
    }

    if (Match(TokenType::EXISTS)) {
        auto expr = std::make_shared<Expression>(ExprOperator::Exists);
        ARROW_ASSIGN_OR_RAISE(expr->exists_pattern, ParseExistsPattern());
        return expr;
    }
    if (Check(TokenType::NOT_KEYWORD) && PeekToken().type == TokenType::EXISTS) {
        Advance();  // NOT
        Advance();  // EXISTS
        auto expr = std::make_shared<Expression>(ExprOperator::NotExists);
        ARROW_ASSIGN_OR_RAISE(expr->exists_pattern, ParseExistsPattern());
        return expr;
    }

    if (BuiltInOperator(CurrentToken().type)) {
        return ParseBuiltInCall();
    }

    if ((Check(TokenType::PREFIX_LABEL) || Check(TokenType::IRI_REF)) &&
        PeekToken().type == TokenType::LPAREN) {
        return Error("Function calls by IRI are not supported");
    }

    ARROW_ASSIGN_OR_RAISE(auto term, ParseRDFTerm());
    return std::make_shared<Expression>(std::move(term));
}

arrow::Result<std::shared_ptr<QueryPattern>> SPARQLParser::ParseExistsPattern() {
    if (!Check(TokenType::LBRACE)) {
        return Error("Expected '{' after EXISTS");
    }
    ARROW_ASSIGN_OR_RAISE(auto pattern, ParseWhereClause());
    return std::make_shared<QueryPattern>(std::move(pattern));
}

arrow::Result<std::shared_ptr<Expression>> SPARQLParser::ParseBuiltInCall() {
    auto op = BuiltInOperator(CurrentToken().type);
    if (!op) {
        return Error("Unknown built-in function");
    }
    std::string name = ToUpper(CurrentToken().text);
    Advance();

    ARROW_RETURN_NOT_OK(Expect(TokenType::LPAREN, "Expected '(' after function name"));

    auto expr = std::make_shared<Expression>(*op);

    if (*op == ExprOperator::Bound) {
        ARROW_ASSIGN_OR_RAISE(auto var, ParseVariable());
        expr->arguments.push_back(std::make_shared<Expression>(RDFTerm(std::move(var))));
    } else if (!Check(TokenType::RPAREN)) {
        while (true) {
            ARROW_ASSIGN_OR_RAISE(auto arg, ParseExpression());
            expr->arguments.push_back(arg);
            if (!Match(TokenType::COMMA)) {
                break;
            }
        }
    }

    auto [min_args, max_args] = BuiltInArity(*op);
    if (expr->arguments.size() < min_args || expr->arguments.size() > max_args) {
        return Error("Wrong number of arguments for " + name);
    }

    ARROW_RETURN_NOT_OK(Expect(TokenType::RPAREN, "Expected ')' after function arguments"));

    return expr;
}

// ============================================================================
// Solution modifiers
// ============================================================================

arrow::Result<std::vector<OrderBy>> SPARQLParser::ParseOrderByClause() {
    std::vector<OrderBy> order_by_list;

    ARROW_RETURN_NOT_OK(Expect(TokenType::ORDER, "Expected ORDER keyword"));
    ARROW_RETURN_NOT_OK(Expect(TokenType::BY, "Expected BY keyword after ORDER"));

    while (true) {
        if (Check(TokenType::ASC) || Check(TokenType::DESC)) {
            OrderDirection direction = Check(TokenType::DESC) ? OrderDirection::Descending
                                                              : OrderDirection::Ascending;
            Advance();
            ARROW_RETURN_NOT_OK(Expect(TokenType::LPAREN, "Expected '(' after ASC/DESC"));
            ARROW_ASSIGN_OR_RAISE(auto expr, ParseExpression());
            ARROW_RETURN_NOT_OK(Expect(TokenType::RPAREN, "Expected ')' after ORDER BY expression"));
            order_by_list.emplace_back(expr, direction);
        } else if (Check(TokenType::VARIABLE)) {
            ARROW_ASSIGN_OR_RAISE(auto var, ParseVariable());
            order_by_list.emplace_back(std::make_shared<Expression>(RDFTerm(std::move(var))),
                                       OrderDirection::Ascending);
        } else if (Match(TokenType::LPAREN)) {
            ARROW_ASSIGN_OR_RAISE(auto expr, ParseExpression());
            ARROW_RETURN_NOT_OK(Expect(TokenType::RPAREN, "Expected ')' after ORDER BY expression"));
            order_by_list.emplace_back(expr, OrderDirection::Ascending);
        } else if (BuiltInOperator(CurrentToken().type)) {
            ARROW_ASSIGN_OR_RAISE(auto expr, ParseBuiltInCall());
            order_by_list.emplace_back(expr, OrderDirection::Ascending);
        } else {
            break;
        }
    }

    if (order_by_list.empty()) {
        return Error("Expected at least one ORDER BY key");
    }

    return order_by_list;
}

arrow::Status SPARQLParser::ParseSolutionModifiers(SolutionModifiers& modifiers) {
    if (Check(TokenType::ORDER)) {
        ARROW_ASSIGN_OR_RAISE(modifiers.order_by, ParseOrderByClause());
    }

    // LIMIT and OFFSET may appear in either order
    while (Check(TokenType::LIMIT) || Check(TokenType::OFFSET)) {
        bool is_limit = Check(TokenType::LIMIT);
        std::optional<size_t>& slot = is_limit ? modifiers.limit : modifiers.offset;
        if (slot) {
            return Error(is_limit ? "Duplicate LIMIT clause" : "Duplicate OFFSET clause");
        }
        Advance();
        if (!Check(TokenType::INTEGER)) {
            return Error(is_limit ? "Expected integer after LIMIT" : "Expected integer after OFFSET");
        }
        auto value = ParseCount(CurrentToken().text);
        if (!value.ok()) {
            return Error(value.status().message());
        }
        slot = *value;
        Advance();
    }

    return arrow::Status::OK();
}

// ============================================================================
// Terms
// ============================================================================

arrow::Result<Variable> SPARQLParser::ParseVariable() {
    const Token& token = CurrentToken();
    if (!Check(TokenType::VARIABLE)) {
        return Error("Expected variable");
    }

    std::string name = token.text.substr(1);
    Advance();

    return Variable(std::move(name));
}

arrow::Result<Iri> SPARQLParser::ParseIRI() {
    const Token& token = CurrentToken();
    if (!Check(TokenType::IRI_REF)) {
        return Error("Expected IRI");
    }

    std::string iri = ExpandRelativeIRI(token.text.substr(1, token.text.size() - 2));
    Advance();

    return Iri(std::move(iri));
}

arrow::Result<Literal> SPARQLParser::ParseLiteral() {
    const Token& token = CurrentToken();

    switch (token.type) {
        case TokenType::STRING_LITERAL: {
            std::string value = token.text;
            Advance();

            if (Check(TokenType::LANG_TAG)) {
                std::string language = ToLower(CurrentToken().text);
                Advance();
                return Literal(std::move(value), std::move(language));
            }
            if (Match(TokenType::DATATYPE_MARKER)) {
                std::string datatype;
                if (Check(TokenType::IRI_REF)) {
                    ARROW_ASSIGN_OR_RAISE(auto dt_iri, ParseIRI());
                    datatype = std::move(dt_iri.value);
                } else if (Check(TokenType::PREFIX_LABEL)) {
                    ARROW_ASSIGN_OR_RAISE(datatype, ExpandPrefixedName(CurrentToken().text));
                    Advance();
                } else {
                    return Error("Expected IRI after '^^'");
                }
                return Literal(std::move(value), "", std::move(datatype));
            }
            return Literal(std::move(value));
        }
        case TokenType::INTEGER: {
            std::string value = token.text;
            Advance();
            return Literal(std::move(value), "", std::string(vocab::kXsdInteger));
        }
        case TokenType::DECIMAL: {
            std::string value = token.text;
            Advance();
            return Literal(std::move(value), "", std::string(vocab::kXsdDecimal));
        }
        case TokenType::DOUBLE: {
            std::string value = token.text;
            Advance();
            return Literal(std::move(value), "", std::string(vocab::kXsdDouble));
        }
        case TokenType::BOOLEAN: {
            std::string value = ToLower(token.text);
            Advance();
            return Literal(std::move(value), "", std::string(vocab::kXsdBoolean));
        }
        default:
            break;
    }

    return Error("Expected literal value");
}

// ============================================================================
// Convenience function
// ============================================================================

arrow::Result<Query> ParseSPARQL(const std::string& query_text) {
    SPARQLTokenizer tokenizer(query_text);
    ARROW_ASSIGN_OR_RAISE(auto tokens, tokenizer.Tokenize());

    SPARQLParser parser(std::move(tokens));
    return parser.Parse();
}

} // namespace sparql
} // namespace semgraph
