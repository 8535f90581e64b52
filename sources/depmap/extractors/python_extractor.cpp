//
// Created by gregorian-rayne on 1/15/26.
//

#include "depmap/extractors/python_extractor.hpp"
#include "depmap/utils/string_utils.hpp"

#include <cctype>
#include <utility>

namespace depmap::extractors {

    namespace {

        // ============================================================================
        // Tokens
        // ============================================================================

        enum class TokenKind {
            Name,
            Dot,
            Comma,
            Star,
            OpenParen,
            CloseParen,
            Semicolon,
            Colon,
            Newline,    ///< End of a logical line
            Other       ///< Literals, operators, other brackets
        };

        struct Token {
            TokenKind kind = TokenKind::Other;
            std::string_view text;
            std::size_t line = 0;
            std::size_t depth = 0;  ///< Bracket nesting level the token sits at
        };

        bool is_name_start(const unsigned char c) {
            return std::isalpha(c) || c == '_' || c >= 0x80;
        }

        bool is_name_char(const unsigned char c) {
            return std::isalnum(c) || c == '_' || c >= 0x80;
        }

        bool is_string_prefix(const std::string_view word) {
            if (word.size() > 2) {
                return false;
            }
            const auto lower = string_utils::to_lower(word);
            return lower == "r" || lower == "u" || lower == "b" || lower == "f" ||
                   lower == "br" || lower == "rb" || lower == "fr" || lower == "rf";
        }

        /**
         * Converts CRLF and lone CR line endings to LF and drops a UTF-8 BOM.
         */
        std::string normalize_source(std::string_view source) {
            if (source.starts_with("\xEF\xBB\xBF")) {
                source.remove_prefix(3);
            }

            std::string out;
            out.reserve(source.size());
            for (std::size_t i = 0; i < source.size(); ++i) {
                if (source[i] == '\r') {
                    out += '\n';
                    if (i + 1 < source.size() && source[i + 1] == '\n') {
                        ++i;
                    }
                } else {
                    out += source[i];
                }
            }
            return out;
        }

        std::string at_line(const std::string& message, const std::size_t line) {
            return message + " at line " + std::to_string(line);
        }

        // ============================================================================
        // Lexer
        // ============================================================================

        class Lexer {
        public:
            explicit Lexer(const std::string& source) : src_(source) {}

            Result<std::vector<Token>, Error> tokenize() {
                while (pos_ < src_.size()) {
                    const char c = src_[pos_];
                    const auto uc = static_cast<unsigned char>(c);

                    if (c == '\n') {
                        if (brackets_.empty()) {
                            emit(TokenKind::Newline, pos_, pos_ + 1);
                        }
                        ++line_;
                        ++pos_;
                        continue;
                    }

                    if (c == ' ' || c == '\t' || c == '\f' || c == '\v') {
                        ++pos_;
                        continue;
                    }

                    if (c == '#') {
                        while (pos_ < src_.size() && src_[pos_] != '\n') {
                            ++pos_;
                        }
                        continue;
                    }

                    if (c == '\\') {
                        if (pos_ + 1 < src_.size() && src_[pos_ + 1] == '\n') {
                            pos_ += 2;
                            ++line_;
                        } else {
                            emit(TokenKind::Other, pos_, pos_ + 1);
                            ++pos_;
                        }
                        continue;
                    }

                    if (c == '"' || c == '\'') {
                        const std::size_t begin = pos_;
                        const std::size_t line = line_;
                        if (auto skipped = skip_string(); skipped.is_err()) {
                            return Result<std::vector<Token>, Error>::failure(skipped.error());
                        }
                        emit(TokenKind::Other, begin, pos_, line);
                        continue;
                    }

                    if (is_name_start(uc)) {
                        const std::size_t begin = pos_;
                        while (pos_ < src_.size() && is_name_char(static_cast<unsigned char>(src_[pos_]))) {
                            ++pos_;
                        }
                        const auto word = src_.substr(begin, pos_ - begin);

                        if (pos_ < src_.size() && (src_[pos_] == '"' || src_[pos_] == '\'') && is_string_prefix(word)) {
                            const std::size_t line = line_;
                            if (auto skipped = skip_string(); skipped.is_err()) {
                                return Result<std::vector<Token>, Error>::failure(skipped.error());
                            }
                            emit(TokenKind::Other, begin, pos_, line);
                        } else {
                            emit(TokenKind::Name, begin, pos_);
                        }
                        continue;
                    }

                    if (std::isdigit(uc) || (c == '.' && pos_ + 1 < src_.size() &&
                                              std::isdigit(static_cast<unsigned char>(src_[pos_ + 1])))) {
                        const std::size_t begin = pos_;
                        while (pos_ < src_.size()) {
                            const auto d = static_cast<unsigned char>(src_[pos_]);
                            if (!std::isalnum(d) && d != '_' && d != '.') {
                                break;
                            }
                            ++pos_;
                        }
                        emit(TokenKind::Other, begin, pos_);
                        continue;
                    }

                    if (auto punct = punctuation(c); punct.is_err()) {
                        return Result<std::vector<Token>, Error>::failure(punct.error());
                    }
                }

                if (!brackets_.empty()) {
                    const auto& [open, line] = brackets_.back();
                    return Result<std::vector<Token>, Error>::failure(Error::parse_failure(
                        at_line(std::string("'") + open + "' was never closed", line)
                    ));
                }

                emit(TokenKind::Newline, src_.size(), src_.size());
                return Result<std::vector<Token>, Error>::success(std::move(tokens_));
            }

        private:
            void emit(const TokenKind kind, const std::size_t begin, const std::size_t end) {
                emit(kind, begin, end, line_);
            }

            void emit(const TokenKind kind, const std::size_t begin, const std::size_t end, const std::size_t line) {
                tokens_.push_back({kind, src_.substr(begin, end - begin), line, brackets_.size()});
            }

            bool next_is(const char c) const {
                return pos_ + 1 < src_.size() && src_[pos_ + 1] == c;
            }

            /**
             * Consumes one punctuation or operator character sequence.
             */
            Result<void, Error> punctuation(const char c) {
                const std::size_t begin = pos_;

                switch (c) {
                    case '.':
                        emit(TokenKind::Dot, begin, ++pos_);
                        break;
                    case ',':
                        emit(TokenKind::Comma, begin, ++pos_);
                        break;
                    case ';':
                        emit(TokenKind::Semicolon, begin, ++pos_);
                        break;
                    case '*':
                        if (next_is('*') || next_is('=')) {
                            pos_ += 2;
                            emit(TokenKind::Other, begin, pos_);
                        } else {
                            emit(TokenKind::Star, begin, ++pos_);
                        }
                        break;
                    case ':':
                        if (next_is('=')) {
                            pos_ += 2;
                            emit(TokenKind::Other, begin, pos_);
                        } else {
                            emit(TokenKind::Colon, begin, ++pos_);
                        }
                        break;
                    case '(':
                    case '[':
                    case '{':
                        emit(c == '(' ? TokenKind::OpenParen : TokenKind::Other, begin, ++pos_);
                        brackets_.emplace_back(c, line_);
                        break;
                    case ')':
                    case ']':
                    case '}': {
                        const char expected = c == ')' ? '(' : (c == ']' ? '[' : '{');
                        if (brackets_.empty()) {
                            return Result<void, Error>::failure(Error::parse_failure(
                                at_line(std::string("unmatched '") + c + "'", line_)
                            ));
                        }
                        if (brackets_.back().first != expected) {
                            return Result<void, Error>::failure(Error::parse_failure(
                                at_line(std::string("closing '") + c + "' does not match '" +
                                        brackets_.back().first + "' opened at line " +
                                        std::to_string(brackets_.back().second), line_)
                            ));
                        }
                        brackets_.pop_back();
                        emit(c == ')' ? TokenKind::CloseParen : TokenKind::Other, begin, ++pos_);
                        break;
                    }
                    default:
                        emit(TokenKind::Other, begin, ++pos_);
                        break;
                }

                return Result<void, Error>::success();
            }

            /**
             * Advances past a string literal whose opening quote is at pos_.
             */
            Result<void, Error> skip_string() {
                const char quote = src_[pos_];
                const bool triple = pos_ + 2 < src_.size() &&
                                    src_[pos_ + 1] == quote && src_[pos_ + 2] == quote;
                const std::size_t start_line = line_;
                pos_ += triple ? 3 : 1;

                while (pos_ < src_.size()) {
                    const char ch = src_[pos_];

                    if (ch == '\\') {
                        ++pos_;
                        if (pos_ < src_.size()) {
                            if (src_[pos_] == '\n') {
                                ++line_;
                            }
                            ++pos_;
                        }
                        continue;
                    }

                    if (ch == '\n') {
                        if (!triple) {
                            break;
                        }
                        ++line_;
                        ++pos_;
                        continue;
                    }

                    if (ch == quote) {
                        if (!triple) {
                            ++pos_;
                            return Result<void, Error>::success();
                        }
                        if (pos_ + 2 < src_.size() && src_[pos_ + 1] == quote && src_[pos_ + 2] == quote) {
                            pos_ += 3;
                            return Result<void, Error>::success();
                        }
                    }

                    ++pos_;
                }

                return Result<void, Error>::failure(Error::parse_failure(at_line(
                    triple ? "unterminated triple-quoted string literal"
                           : "unterminated string literal",
                    start_line
                )));
            }

            std::string_view src_;
            std::size_t pos_ = 0;
            std::size_t line_ = 1;
            std::vector<std::pair<char, std::size_t>> brackets_;
            std::vector<Token> tokens_;
        };

        // ============================================================================
        // Import statement parser
        // ============================================================================

        class ImportParser {
        public:
            ImportParser(const std::vector<Token>& tokens, const ModuleId& origin)
                : tokens_(tokens)
                , origin_(origin) {}

            Result<std::vector<RawImport>, Error> parse() {
                bool at_statement_start = true;

                while (index_ < tokens_.size()) {
                    const Token& token = tokens_[index_];

                    if (at_statement_start && token.kind == TokenKind::Name && token.depth == 0) {
                        if (token.text == "import" || token.text == "from") {
                            ++index_;
                            auto parsed = token.text == "import"
                                              ? parse_import(token.line)
                                              : parse_from(token.line);
                            if (parsed.is_err()) {
                                return Result<std::vector<RawImport>, Error>::failure(parsed.error());
                            }
                            at_statement_start = false;
                            continue;
                        }
                    }

                    switch (token.kind) {
                        case TokenKind::Newline:
                            at_statement_start = true;
                            break;
                        case TokenKind::Semicolon:
                        case TokenKind::Colon:
                            at_statement_start = token.depth == 0;
                            break;
                        default:
                            at_statement_start = false;
                            break;
                    }
                    ++index_;
                }

                return Result<std::vector<RawImport>, Error>::success(std::move(imports_));
            }

        private:
            [[nodiscard]] const Token& peek() const {
                return index_ < tokens_.size() ? tokens_[index_] : tokens_.back();
            }

            [[nodiscard]] bool peek_is(const TokenKind kind) const {
                return peek().kind == kind;
            }

            [[nodiscard]] bool peek_is_keyword(const std::string_view word) const {
                return peek().kind == TokenKind::Name && peek().text == word;
            }

            [[nodiscard]] bool at_statement_end() const {
                return peek_is(TokenKind::Newline) || peek_is(TokenKind::Semicolon);
            }

            static Error malformed(const std::string& what, const std::size_t line) {
                return Error::parse_failure(at_line("malformed import: " + what, line));
            }

            /**
             * Parses `name(.name)*`. Returns an empty string when the next
             * token does not start a name.
             */
            Result<std::string, Error> parse_dotted_name(const std::size_t line) {
                std::string dotted;
                if (!peek_is(TokenKind::Name) || peek_is_keyword("import")) {
                    return Result<std::string, Error>::success(dotted);
                }

                dotted = std::string(peek().text);
                ++index_;
                while (peek_is(TokenKind::Dot)) {
                    ++index_;
                    if (!peek_is(TokenKind::Name)) {
                        return Result<std::string, Error>::failure(
                            malformed("expected name after '.' in '" + dotted + ".'", line)
                        );
                    }
                    dotted += '.';
                    dotted += peek().text;
                    ++index_;
                }
                return Result<std::string, Error>::success(dotted);
            }

            Result<void, Error> parse_alias(const std::size_t line) {
                if (!peek_is_keyword("as")) {
                    return Result<void, Error>::success();
                }
                ++index_;
                if (!peek_is(TokenKind::Name)) {
                    return Result<void, Error>::failure(malformed("expected alias after 'as'", line));
                }
                ++index_;
                return Result<void, Error>::success();
            }

            Result<void, Error> expect_statement_end(const std::size_t line) {
                if (!at_statement_end()) {
                    return Result<void, Error>::failure(
                        malformed("unexpected '" + std::string(peek().text) + "'", line)
                    );
                }
                return Result<void, Error>::success();
            }

            void add(std::string target, const ImportKind kind, const std::size_t depth, const std::size_t line) {
                imports_.push_back({std::move(target), kind, depth, origin_, line});
            }

            // import a.b [as x], c
            Result<void, Error> parse_import(const std::size_t line) {
                while (true) {
                    auto name = parse_dotted_name(line);
                    if (name.is_err()) {
                        return Result<void, Error>::failure(name.error());
                    }
                    if (name.value().empty()) {
                        return Result<void, Error>::failure(malformed("expected module name after 'import'", line));
                    }
                    if (auto alias = parse_alias(line); alias.is_err()) {
                        return alias;
                    }

                    add(std::move(name).value(), ImportKind::Absolute, 0, line);

                    if (!peek_is(TokenKind::Comma)) {
                        break;
                    }
                    ++index_;
                }
                return expect_statement_end(line);
            }

            // from <dots><module> import names | (names) | *
            Result<void, Error> parse_from(const std::size_t line) {
                std::size_t depth = 0;
                while (peek_is(TokenKind::Dot)) {
                    ++depth;
                    ++index_;
                }

                auto module = parse_dotted_name(line);
                if (module.is_err()) {
                    return Result<void, Error>::failure(module.error());
                }
                const std::string base = std::move(module).value();

                if (depth == 0 && base.empty()) {
                    return Result<void, Error>::failure(malformed("expected module name after 'from'", line));
                }
                if (!peek_is_keyword("import")) {
                    return Result<void, Error>::failure(
                        malformed("expected 'import' after 'from " + std::string(depth, '.') + base + "'", line)
                    );
                }
                ++index_;

                if (peek_is(TokenKind::Star)) {
                    ++index_;
                    add(base, ImportKind::Star, depth, line);
                    return expect_statement_end(line);
                }

                const bool parenthesized = peek_is(TokenKind::OpenParen);
                if (parenthesized) {
                    ++index_;
                }

                std::vector<std::string> names;
                while (true) {
                    if (parenthesized && peek_is(TokenKind::CloseParen)) {
                        break;
                    }
                    if (!peek_is(TokenKind::Name)) {
                        return Result<void, Error>::failure(malformed("expected imported name", line));
                    }
                    names.emplace_back(peek().text);
                    ++index_;

                    if (auto alias = parse_alias(line); alias.is_err()) {
                        return alias;
                    }

                    if (!peek_is(TokenKind::Comma)) {
                        break;
                    }
                    ++index_;
                    if (!parenthesized && at_statement_end()) {
                        return Result<void, Error>::failure(
                            malformed("trailing comma not allowed without parentheses", line)
                        );
                    }
                }

                if (parenthesized) {
                    if (!peek_is(TokenKind::CloseParen)) {
                        return Result<void, Error>::failure(malformed("expected ')'", line));
                    }
                    ++index_;
                }

                if (names.empty()) {
                    return Result<void, Error>::failure(malformed("empty import list", line));
                }

                const ImportKind kind = depth > 0 ? ImportKind::Relative : ImportKind::Absolute;
                for (const auto& name : names) {
                    add(string_utils::join_dotted(base, name), kind, depth, line);
                }
                return expect_statement_end(line);
            }

            const std::vector<Token>& tokens_;
            const ModuleId& origin_;
            std::size_t index_ = 0;
            std::vector<RawImport> imports_;
        };

    }  // namespace

    Result<std::vector<RawImport>, Error> PythonImportExtractor::extract(
        const std::string_view source,
        const ModuleId& origin
    ) const {
        const std::string normalized = normalize_source(source);

        Lexer lexer(normalized);
        auto tokens = lexer.tokenize();
        if (tokens.is_err()) {
            return Result<std::vector<RawImport>, Error>::failure(tokens.error().with_context(origin));
        }

        ImportParser parser(tokens.value(), origin);
        auto imports = parser.parse();
        if (imports.is_err()) {
            return Result<std::vector<RawImport>, Error>::failure(imports.error().with_context(origin));
        }
        return imports;
    }

    void register_python_extractor() {
        ExtractorRegistry::instance().register_extractor(std::make_unique<PythonImportExtractor>());
    }

}  // namespace depmap::extractors
