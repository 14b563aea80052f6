#include <semgraph/parser/turtle_parser.h>
#include <semgraph/ontology/vocab.h>
#include <cctype>
#include <sstream>

namespace semgraph {

namespace {

bool IsNameStartChar(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' ||
           static_cast<unsigned char>(c) >= 0x80;
}

bool IsNameChar(char c) {
    return IsNameStartChar(c) || std::isdigit(static_cast<unsigned char>(c)) ||
           c == '-' || c == '.';
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void AppendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

bool HasScheme(const std::string& iri) {
    size_t colon = iri.find(':');
    if (colon == std::string::npos || colon == 0) {
        return false;
    }
    if (!std::isalpha(static_cast<unsigned char>(iri[0]))) {
        return false;
    }
    for (size_t i = 1; i < colon; ++i) {
        char c = iri[i];
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

} // namespace

TurtleParser::TurtleParser(const RdfParserConfig& config)
    : config_(config), base_iri_(config.base_iri) {}

arrow::Result<std::vector<Triple>> TurtleParser::Parse(std::string_view text) {
    text_ = text;
    pos_ = 0;
    line_ = 1;
    column_ = 1;
    prefixes_.clear();
    base_iri_ = config_.base_iri;
    triples_.clear();
    triples_processed_ = 0;
    triples_skipped_ = 0;
    blank_node_counter_ = 0;

    while (true) {
        SkipWhitespaceAndComments();
        if (IsAtEnd()) {
            break;
        }

        size_t emitted_before = triples_.size();
        auto status = ParseStatement();
        if (!status.ok()) {
            if (!config_.skip_invalid_triples) {
                return status;
            }
            // Drop the partial statement and resynchronize after the next '.'
            triples_skipped_ += 1;
            triples_processed_ -= triples_.size() - emitted_before;
            triples_.resize(emitted_before);
            SkipToStatementEnd();
        }
    }

    return std::move(triples_);
}

// ============================================================================
// Statements
// ============================================================================

arrow::Status TurtleParser::ParseStatement() {
    if (CurrentChar() == '@') {
        Advance();
        if (MatchKeyword("prefix", false)) {
            return ParsePrefixDirective(false);
        }
        if (MatchKeyword("base", false)) {
            return ParseBaseDirective(false);
        }
        return Error("Unknown directive");
    }
    if (MatchKeyword("PREFIX", true)) {
        return ParsePrefixDirective(true);
    }
    if (MatchKeyword("BASE", true)) {
        return ParseBaseDirective(true);
    }

    ARROW_RETURN_NOT_OK(ParseTriples());
    SkipWhitespaceAndComments();
    return Expect('.', "at end of triples");
}

arrow::Status TurtleParser::ParsePrefixDirective(bool sparql_style) {
    SkipWhitespaceAndComments();

    std::string prefix;
    while (!IsAtEnd() && CurrentChar() != ':') {
        char c = CurrentChar();
        if (!IsNameChar(c)) {
            return Error("Invalid character in prefix name");
        }
        prefix += c;
        Advance();
    }
    ARROW_RETURN_NOT_OK(Expect(':', "after prefix name"));

    SkipWhitespaceAndComments();
    ARROW_ASSIGN_OR_RAISE(auto iri, ParseIriRef());
    prefixes_[prefix] = ResolveIri(iri);

    if (!sparql_style) {
        SkipWhitespaceAndComments();
        ARROW_RETURN_NOT_OK(Expect('.', "after @prefix directive"));
    }
    return arrow::Status::OK();
}

arrow::Status TurtleParser::ParseBaseDirective(bool sparql_style) {
    SkipWhitespaceAndComments();
    ARROW_ASSIGN_OR_RAISE(auto iri, ParseIriRef());
    base_iri_ = ResolveIri(iri);

    if (!sparql_style) {
        SkipWhitespaceAndComments();
        ARROW_RETURN_NOT_OK(Expect('.', "after @base directive"));
    }
    return arrow::Status::OK();
}

arrow::Status TurtleParser::ParseTriples() {
    if (CurrentChar() == '[') {
        ARROW_ASSIGN_OR_RAISE(auto bnode, ParseBlankNodePropertyList());
        SkipWhitespaceAndComments();
        // "[ ... ] ." is a complete statement on its own
        if (CurrentChar() == '.') {
            return arrow::Status::OK();
        }
        return ParsePredicateObjectList(Term(bnode));
    }

    ARROW_ASSIGN_OR_RAISE(auto subject, ParseSubject());
    return ParsePredicateObjectList(subject);
}

arrow::Status TurtleParser::ParsePredicateObjectList(const Term& subject) {
    SkipWhitespaceAndComments();
    ARROW_ASSIGN_OR_RAISE(auto predicate, ParseVerb());
    ARROW_RETURN_NOT_OK(ParseObjectList(subject, predicate));

    while (true) {
        SkipWhitespaceAndComments();
        if (CurrentChar() != ';') {
            break;
        }
        // One or more ';' may precede the next verb, or end the list
        while (CurrentChar() == ';') {
            Advance();
            SkipWhitespaceAndComments();
        }
        char c = CurrentChar();
        if (c == '.' || c == ']' || IsAtEnd()) {
            break;
        }
        ARROW_ASSIGN_OR_RAISE(auto next_predicate, ParseVerb());
        ARROW_RETURN_NOT_OK(ParseObjectList(subject, next_predicate));
    }
    return arrow::Status::OK();
}

arrow::Status TurtleParser::ParseObjectList(const Term& subject, const Iri& predicate) {
    while (true) {
        SkipWhitespaceAndComments();
        ARROW_ASSIGN_OR_RAISE(auto object, ParseObject());
        ARROW_RETURN_NOT_OK(Emit(subject, predicate, std::move(object)));

        SkipWhitespaceAndComments();
        if (CurrentChar() != ',') {
            break;
        }
        Advance();
    }
    return arrow::Status::OK();
}

// ============================================================================
// Terms
// ============================================================================

arrow::Result<Term> TurtleParser::ParseSubject() {
    SkipWhitespaceAndComments();
    char c = CurrentChar();
    if (c == '_' && PeekChar() == ':') {
        ARROW_ASSIGN_OR_RAISE(auto bnode, ParseBlankNodeLabel());
        return Term(bnode);
    }
    if (c == '(') {
        return ParseCollection();
    }
    if (c == '"' || c == '\'' || std::isdigit(static_cast<unsigned char>(c))) {
        return Error("Literal is not allowed as subject");
    }
    ARROW_ASSIGN_OR_RAISE(auto iri, ParseIri());
    return Term(iri);
}

arrow::Result<Iri> TurtleParser::ParseVerb() {
    SkipWhitespaceAndComments();
    // 'a' keyword: followed by whitespace or a term start
    if (CurrentChar() == 'a') {
        char next = PeekChar();
        if (next == ' ' || next == '\t' || next == '\n' || next == '\r' ||
            next == '<' || next == '[' || next == '"' || next == '_') {
            Advance();
            return Iri(std::string(vocab::kRdfType));
        }
    }
    return ParseIri();
}

arrow::Result<Term> TurtleParser::ParseObject() {
    char c = CurrentChar();
    if (c == '<') {
        ARROW_ASSIGN_OR_RAISE(auto iri, ParseIri());
        return Term(iri);
    }
    if (c == '_' && PeekChar() == ':') {
        ARROW_ASSIGN_OR_RAISE(auto bnode, ParseBlankNodeLabel());
        return Term(bnode);
    }
    if (c == '[') {
        ARROW_ASSIGN_OR_RAISE(auto bnode, ParseBlankNodePropertyList());
        return Term(bnode);
    }
    if (c == '(') {
        return ParseCollection();
    }
    if (c == '"' || c == '\'') {
        ARROW_ASSIGN_OR_RAISE(auto lit, ParseRdfLiteral());
        return Term(lit);
    }
    if (std::isdigit(static_cast<unsigned char>(c)) || c == '+' || c == '-' ||
        (c == '.' && std::isdigit(static_cast<unsigned char>(PeekChar())))) {
        ARROW_ASSIGN_OR_RAISE(auto lit, ParseNumber());
        return Term(lit);
    }
    if (MatchKeyword("true", false)) {
        return Term(Literal("true", "", std::string(vocab::kXsdBoolean)));
    }
    if (MatchKeyword("false", false)) {
        return Term(Literal("false", "", std::string(vocab::kXsdBoolean)));
    }
    ARROW_ASSIGN_OR_RAISE(auto iri, ParseIri());
    return Term(iri);
}

arrow::Result<Iri> TurtleParser::ParseIri() {
    if (CurrentChar() == '<') {
        ARROW_ASSIGN_OR_RAISE(auto iri, ParseIriRef());
        return Iri(ResolveIri(iri));
    }
    ARROW_ASSIGN_OR_RAISE(auto expanded, ParsePrefixedName());
    return Iri(std::move(expanded));
}

// IRIREF: <...> with \u escapes
arrow::Result<std::string> TurtleParser::ParseIriRef() {
    if (CurrentChar() != '<') {
        return Error("Expected '<' at start of IRI");
    }
    Advance();

    std::string iri;
    while (!IsAtEnd() && CurrentChar() != '>') {
        char c = CurrentChar();
        if (c == '\n' || c == ' ') {
            return Error("Whitespace inside IRI");
        }
        if (c == '\\') {
            Advance();
            char kind = CurrentChar();
            size_t digits = kind == 'u' ? 4 : (kind == 'U' ? 8 : 0);
            if (digits == 0) {
                return Error("Invalid escape in IRI");
            }
            Advance();
            uint32_t cp = 0;
            for (size_t i = 0; i < digits; ++i) {
                int v = HexValue(CurrentChar());
                if (v < 0) {
                    return Error("Invalid hex digit in IRI escape");
                }
                cp = (cp << 4) | static_cast<uint32_t>(v);
                Advance();
            }
            AppendUtf8(iri, cp);
            continue;
        }
        iri += c;
        Advance();
    }

    if (IsAtEnd()) {
        return Error("Unterminated IRI");
    }
    Advance();  // Skip '>'
    return iri;
}

// PrefixedName: prefix:local, prefix may be empty
arrow::Result<std::string> TurtleParser::ParsePrefixedName() {
    std::string prefix;
    while (!IsAtEnd() && CurrentChar() != ':' && IsNameChar(CurrentChar())) {
        prefix += CurrentChar();
        Advance();
    }
    if (CurrentChar() != ':') {
        if (prefix.empty()) {
            return Error("Expected IRI, prefixed name or literal");
        }
        return Error("Expected ':' in prefixed name '" + prefix + "'");
    }
    Advance();

    std::string local;
    while (!IsAtEnd()) {
        char c = CurrentChar();
        if (c == '\\') {
            // Reserved character escape: \- \. \~ etc.
            Advance();
            local += CurrentChar();
            Advance();
            continue;
        }
        if (c == '%' && HexValue(PeekChar(1)) >= 0 && HexValue(PeekChar(2)) >= 0) {
            local += text_.substr(pos_, 3);
            Advance(3);
            continue;
        }
        if (IsNameChar(c) || c == ':') {
            local += c;
            Advance();
            continue;
        }
        break;
    }
    // A trailing '.' terminates the statement, it is not part of the name
    while (!local.empty() && local.back() == '.') {
        local.pop_back();
        pos_--;
        column_--;
    }

    auto it = prefixes_.find(prefix);
    if (it == prefixes_.end()) {
        return Error("Undefined prefix '" + prefix + "'");
    }
    return it->second + local;
}

arrow::Result<BlankNode> TurtleParser::ParseBlankNodeLabel() {
    Advance(2);  // Skip '_:'
    std::string label;
    while (!IsAtEnd() && IsNameChar(CurrentChar())) {
        label += CurrentChar();
        Advance();
    }
    while (!label.empty() && label.back() == '.') {
        label.pop_back();
        pos_--;
        column_--;
    }
    if (label.empty()) {
        return Error("Empty blank node identifier");
    }
    return LabeledBlankNode(config_, label);
}

arrow::Result<BlankNode> TurtleParser::ParseBlankNodePropertyList() {
    Advance();  // Skip '['
    BlankNode bnode = NewBlankNode();

    SkipWhitespaceAndComments();
    if (CurrentChar() == ']') {
        Advance();
        return bnode;
    }

    ARROW_RETURN_NOT_OK(ParsePredicateObjectList(Term(bnode)));
    SkipWhitespaceAndComments();
    ARROW_RETURN_NOT_OK(Expect(']', "to end blank node property list"));
    return bnode;
}

// Collection ( a b c ) -> rdf:first / rdf:rest chain ending in rdf:nil
arrow::Result<Term> TurtleParser::ParseCollection() {
    Advance();  // Skip '('

    std::vector<Term> items;
    while (true) {
        SkipWhitespaceAndComments();
        if (IsAtEnd()) {
            return Error("Unterminated collection");
        }
        if (CurrentChar() == ')') {
            Advance();
            break;
        }
        ARROW_ASSIGN_OR_RAISE(auto item, ParseObject());
        items.push_back(std::move(item));
    }

    if (items.empty()) {
        return Term(Iri(std::string(vocab::kRdfNil)));
    }

    std::vector<BlankNode> cells;
    cells.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        cells.push_back(NewBlankNode());
    }
    const Iri first(std::string(vocab::kRdfFirst));
    const Iri rest(std::string(vocab::kRdfRest));
    for (size_t i = 0; i < items.size(); ++i) {
        ARROW_RETURN_NOT_OK(Emit(Term(cells[i]), first, items[i]));
        Term next = i + 1 < items.size() ? Term(cells[i + 1])
                                         : Term(Iri(std::string(vocab::kRdfNil)));
        ARROW_RETURN_NOT_OK(Emit(Term(cells[i]), rest, std::move(next)));
    }
    return Term(cells.front());
}

arrow::Result<Literal> TurtleParser::ParseRdfLiteral() {
    ARROW_ASSIGN_OR_RAISE(auto value, ParseString());

    if (CurrentChar() == '@') {
        Advance();
        std::string language;
        while (!IsAtEnd() && (std::isalnum(static_cast<unsigned char>(CurrentChar())) ||
                              CurrentChar() == '-')) {
            language += CurrentChar();
            Advance();
        }
        if (language.empty()) {
            return Error("Empty language tag");
        }
        return Literal(std::move(value), std::move(language), "");
    }
    if (CurrentChar() == '^' && PeekChar() == '^') {
        Advance(2);
        ARROW_ASSIGN_OR_RAISE(auto datatype, ParseIri());
        return Literal(std::move(value), "", std::move(datatype.value));
    }
    return Literal(std::move(value));
}

// Short ("..." '...') and long ("""...""" '''...''') strings with escapes
arrow::Result<std::string> TurtleParser::ParseString() {
    char quote = CurrentChar();
    bool is_long = PeekChar(1) == quote && PeekChar(2) == quote;
    Advance(is_long ? 3 : 1);

    std::string value;
    while (true) {
        if (IsAtEnd()) {
            return Error("Unterminated string literal");
        }
        char c = CurrentChar();
        if (is_long) {
            if (c == quote && PeekChar(1) == quote && PeekChar(2) == quote) {
                Advance(3);
                break;
            }
        } else {
            if (c == quote) {
                Advance();
                break;
            }
            if (c == '\n' || c == '\r') {
                return Error("Line break in short string literal");
            }
        }

        if (c == '\\') {
            Advance();
            char escaped = CurrentChar();
            switch (escaped) {
                case 't': value += '\t'; break;
                case 'b': value += '\b'; break;
                case 'n': value += '\n'; break;
                case 'r': value += '\r'; break;
                case 'f': value += '\f'; break;
                case '"': value += '"'; break;
                case '\'': value += '\''; break;
                case '\\': value += '\\'; break;
                case 'u':
                case 'U': {
                    size_t digits = escaped == 'u' ? 4 : 8;
                    uint32_t cp = 0;
                    for (size_t i = 0; i < digits; ++i) {
                        int v = HexValue(PeekChar(i + 1));
                        if (v < 0) {
                            return Error("Invalid unicode escape");
                        }
                        cp = (cp << 4) | static_cast<uint32_t>(v);
                    }
                    Advance(digits);
                    AppendUtf8(value, cp);
                    break;
                }
                default:
                    return Error("Invalid escape sequence");
            }
            Advance();
            continue;
        }

        value += c;
        Advance();
    }
    return value;
}

arrow::Result<Literal> TurtleParser::ParseNumber() {
    std::string number;
    if (CurrentChar() == '+' || CurrentChar() == '-') {
        number += CurrentChar();
        Advance();
    }

    bool has_digits = false;
    while (std::isdigit(static_cast<unsigned char>(CurrentChar()))) {
        number += CurrentChar();
        Advance();
        has_digits = true;
    }

    bool is_decimal = false;
    if (CurrentChar() == '.' && std::isdigit(static_cast<unsigned char>(PeekChar()))) {
        is_decimal = true;
        number += '.';
        Advance();
        while (std::isdigit(static_cast<unsigned char>(CurrentChar()))) {
            number += CurrentChar();
            Advance();
            has_digits = true;
        }
    }

    bool is_double = false;
    if (CurrentChar() == 'e' || CurrentChar() == 'E') {
        is_double = true;
        number += CurrentChar();
        Advance();
        if (CurrentChar() == '+' || CurrentChar() == '-') {
            number += CurrentChar();
            Advance();
        }
        if (!std::isdigit(static_cast<unsigned char>(CurrentChar()))) {
            return Error("Malformed exponent in numeric literal");
        }
        while (std::isdigit(static_cast<unsigned char>(CurrentChar()))) {
            number += CurrentChar();
            Advance();
        }
    }

    if (!has_digits) {
        return Error("Malformed numeric literal");
    }

    std::string_view datatype = is_double ? vocab::kXsdDouble
                              : is_decimal ? vocab::kXsdDecimal
                                           : vocab::kXsdInteger;
    return Literal(std::move(number), "", std::string(datatype));
}

arrow::Status TurtleParser::Emit(Term subject, Iri predicate, Term object) {
    ARROW_ASSIGN_OR_RAISE(auto triple,
                          Triple::Make(std::move(subject), Term(std::move(predicate)),
                                       std::move(object)));
    triples_.push_back(std::move(triple));
    triples_processed_++;
    return arrow::Status::OK();
}

// ============================================================================
// Character handling
// ============================================================================

char TurtleParser::PeekChar(size_t offset) const {
    if (pos_ + offset >= text_.size()) return '\0';
    return text_[pos_ + offset];
}

void TurtleParser::Advance(size_t n) {
    for (size_t i = 0; i < n && !IsAtEnd(); ++i) {
        if (text_[pos_] == '\n') {
            line_++;
            column_ = 1;
        } else {
            column_++;
        }
        pos_++;
    }
}

void TurtleParser::SkipWhitespaceAndComments() {
    while (!IsAtEnd()) {
        char c = CurrentChar();
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            Advance();
        } else if (c == '#') {
            while (!IsAtEnd() && CurrentChar() != '\n') {
                Advance();
            }
        } else {
            break;
        }
    }
}

bool TurtleParser::MatchKeyword(std::string_view keyword, bool case_insensitive) {
    if (pos_ + keyword.size() > text_.size()) {
        return false;
    }
    for (size_t i = 0; i < keyword.size(); ++i) {
        char a = text_[pos_ + i];
        char b = keyword[i];
        if (case_insensitive) {
            a = static_cast<char>(std::toupper(static_cast<unsigned char>(a)));
            b = static_cast<char>(std::toupper(static_cast<unsigned char>(b)));
        }
        if (a != b) {
            return false;
        }
    }
    // Keyword must not run into a name ("PREFIXED:x" is a prefixed name)
    char after = PeekChar(keyword.size());
    if (IsNameChar(after) || after == ':') {
        return false;
    }
    Advance(keyword.size());
    return true;
}

arrow::Status TurtleParser::Expect(char c, const char* context) {
    if (CurrentChar() != c) {
        return Error(std::string("Expected '") + c + "' " + context);
    }
    Advance();
    return arrow::Status::OK();
}

void TurtleParser::SkipToStatementEnd() {
    bool in_string = false;
    char quote = '\0';
    while (!IsAtEnd()) {
        char c = CurrentChar();
        if (in_string) {
            if (c == '\\') {
                Advance();
            } else if (c == quote) {
                in_string = false;
            }
        } else if (c == '"' || c == '\'') {
            in_string = true;
            quote = c;
        } else if (c == '.') {
            char next = PeekChar();
            if (next == '\0' || next == ' ' || next == '\n' || next == '\r' || next == '\t') {
                Advance();
                return;
            }
        }
        Advance();
    }
}

arrow::Status TurtleParser::Error(const std::string& message) const {
    std::ostringstream oss;
    oss << "Turtle parse error at line " << line_ << ", column " << column_ << ": " << message;
    if (!IsAtEnd()) {
        oss << " (found: '" << CurrentChar() << "')";
    } else {
        oss << " (found: end of input)";
    }
    return arrow::Status::Invalid(oss.str());
}

std::string TurtleParser::ResolveIri(const std::string& iri) const {
    if (base_iri_.empty() || HasScheme(iri)) {
        return iri;
    }
    if (iri.empty()) {
        return base_iri_;
    }
    if (iri[0] == '#') {
        size_t hash = base_iri_.find('#');
        return base_iri_.substr(0, hash) + iri;
    }
    if (base_iri_.back() == '/' || base_iri_.back() == '#') {
        return base_iri_ + iri;
    }
    size_t slash = base_iri_.rfind('/');
    if (slash != std::string::npos) {
        return base_iri_.substr(0, slash + 1) + iri;
    }
    return base_iri_ + "/" + iri;
}

BlankNode TurtleParser::NewBlankNode() {
    return GeneratedBlankNode(config_, blank_node_counter_++);
}

} // namespace semgraph
