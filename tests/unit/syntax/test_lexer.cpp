// tests/unit/syntax/test_lexer.cpp - Unit tests for the .cnx lexer
//
#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "cnext/syntax/lexer.hpp"
#include "cnext/syntax/token.hpp"

using cnext::FileId;
using cnext::syntax::Lexer;
using cnext::syntax::Token;
using cnext::syntax::TokenKind;

namespace
{

std::vector<Token> lex(std::string_view src)
{
  Lexer lexer(FileId{0}, src);
  return lexer.lex_all();
}

std::vector<TokenKind> kinds(std::string_view src)
{
  std::vector<TokenKind> out;
  for (const auto & t : lex(src)) {
    out.push_back(t.kind);
  }
  return out;
}

}  // namespace

TEST(SyntaxLexer, CommentsProduceNoTokensAndEndsWithEof)
{
  const std::string_view src =
    "// line\n"
    "/* block */\n"
    "u8 x; // trailing\n"
    "u8 /* inline */ y;\n";

  const auto toks = lex(src);
  ASSERT_EQ(toks.size(), 7U);
  EXPECT_EQ(toks[0].text, "u8");
  EXPECT_EQ(toks[1].text, "x");
  EXPECT_EQ(toks[4].text, "y");
  EXPECT_EQ(toks.back().kind, TokenKind::Eof);
}

TEST(SyntaxLexer, CollectsCommentsInSourceOrder)
{
  const std::string_view src =
    "// line\r\n"
    "u8 x; /* block\n   spans */\n"
    "u8 y;\n";

  Lexer lexer(FileId{0}, src);
  (void)lexer.lex_all();
  const auto & comments = lexer.comments();
  ASSERT_EQ(comments.size(), 2U);
  EXPECT_EQ(comments[0].text, "// line");
  EXPECT_EQ(comments[0].range.get_begin().offset(), 0U);
  EXPECT_EQ(comments[1].text, "/* block\n   spans */");
  EXPECT_EQ(comments[1].range.get_begin().offset(), src.find("/*"));
}

TEST(SyntaxLexer, ArrowIsAssignmentAndEqualsIsEquality)
{
  EXPECT_EQ(
    kinds("a <- b = c"), (std::vector<TokenKind>{
                           TokenKind::Identifier, TokenKind::Assign, TokenKind::Identifier,
                           TokenKind::Eq, TokenKind::Identifier, TokenKind::Eof}));
  // `<-` wins over `<` followed by unary minus
  EXPECT_EQ(kinds("a<-1")[1], TokenKind::Assign);
  EXPECT_EQ(kinds("a < -1")[1], TokenKind::Lt);
}

TEST(SyntaxLexer, CompoundAssignments)
{
  const auto toks = kinds("+<- -<- *<- /<- %<- &<- |<- ^<- <<<- >><-");
  const std::vector<TokenKind> expected = {
    TokenKind::PlusAssign, TokenKind::MinusAssign, TokenKind::StarAssign,
    TokenKind::SlashAssign, TokenKind::PercentAssign, TokenKind::AmpAssign,
    TokenKind::PipeAssign, TokenKind::CaretAssign, TokenKind::ShlAssign,
    TokenKind::ShrAssign, TokenKind::Eof};
  EXPECT_EQ(toks, expected);
}

TEST(SyntaxLexer, BasePrefixedIntegerLiterals)
{
  for (std::string_view text : {"0xDEADBEEF", "0b1010", "0o777", "1_000"}) {
    const auto toks = lex(text);
    ASSERT_GE(toks.size(), 1U) << text;
    EXPECT_EQ(toks[0].kind, TokenKind::IntLiteral) << text;
    EXPECT_EQ(toks[0].text, text);
  }
}

TEST(SyntaxLexer, MalformedIntegerIsUnknown)
{
  EXPECT_EQ(lex("0b102")[0].kind, TokenKind::Unknown);
  EXPECT_EQ(lex("0x")[0].kind, TokenKind::Unknown);
}

TEST(SyntaxLexer, FloatLiterals)
{
  EXPECT_EQ(lex("3.25")[0].kind, TokenKind::FloatLiteral);
  EXPECT_EQ(lex("1e3")[0].kind, TokenKind::FloatLiteral);
  // Member access on an integer is not a float
  EXPECT_EQ(lex("x.length")[1].kind, TokenKind::Dot);
}

TEST(SyntaxLexer, DirectiveSpansLine)
{
  const auto toks = lex("#include \"hal.h\"\nu8 x;");
  ASSERT_GE(toks.size(), 2U);
  EXPECT_EQ(toks[0].kind, TokenKind::Directive);
  EXPECT_EQ(toks[0].text.substr(0, 7), "include");
  EXPECT_EQ(toks[1].text, "u8");
}

TEST(SyntaxLexer, QuotedLiteralsExcludeQuotes)
{
  const auto toks = lex("\"hi\\n\" 'a'");
  EXPECT_EQ(toks[0].kind, TokenKind::StringLiteral);
  EXPECT_EQ(toks[0].text, "hi\\n");
  EXPECT_EQ(toks[1].kind, TokenKind::CharLiteral);
  EXPECT_EQ(toks[1].text, "a");
}
