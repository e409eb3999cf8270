// tests/unit/resolution/test_language.cpp - Unit tests for language detection and include scanning
//
#include <gtest/gtest.h>

#include "cnext/resolution/directive_scanner.hpp"
#include "cnext/resolution/language.hpp"

using cnext::FileLanguage;

TEST(LanguageDetection, ExtensionDecides)
{
  EXPECT_EQ(cnext::detect_language("main.cnx", ""), FileLanguage::CNext);
  EXPECT_EQ(cnext::detect_language("impl.c", ""), FileLanguage::C);
  EXPECT_EQ(cnext::detect_language("api.hpp", ""), FileLanguage::Cpp);
  EXPECT_EQ(cnext::detect_language("impl.cc", ""), FileLanguage::Cpp);
}

TEST(LanguageDetection, DotHFallsBackToContent)
{
  EXPECT_EQ(cnext::detect_language("plain.h", "int f(void);\n"), FileLanguage::C);
  EXPECT_EQ(
    cnext::detect_language("ns.h", "namespace hal { int f(); }\n"), FileLanguage::Cpp);
  EXPECT_EQ(
    cnext::detect_language("cls.h", "class Pin {\npublic:\n  int read();\n};\n"),
    FileLanguage::Cpp);
  EXPECT_EQ(cnext::detect_language("en.h", "enum class Mode { A, B };\n"), FileLanguage::Cpp);
}

TEST(LanguageDetection, CommentsDoNotMakeAHeaderCpp)
{
  EXPECT_EQ(
    cnext::detect_language("doc.h", "// this template namespace is prose\nint f(void);\n"),
    FileLanguage::C);
  EXPECT_EQ(
    cnext::detect_language("doc2.h", "/* class Foo; */\nint g(void);\n"), FileLanguage::C);
}

TEST(LanguageDetection, LanguageNamesRoundTripForCache)
{
  for (auto lang : {FileLanguage::CNext, FileLanguage::C, FileLanguage::Cpp,
                    FileLanguage::SystemHeader}) {
    EXPECT_EQ(cnext::language_from_string(cnext::to_string(lang)), lang);
  }
  EXPECT_FALSE(cnext::language_from_string("fortran").has_value());
}

TEST(DirectiveScanner, FindsBothIncludeForms)
{
  const auto incs = cnext::scan_includes(
    "#include <stdio.h>\n"
    "  #  include \"hal.h\"\n"
    "int x;\n");
  ASSERT_EQ(incs.size(), 2U);
  EXPECT_EQ(incs[0].path, "stdio.h");
  EXPECT_TRUE(incs[0].isSystem);
  EXPECT_EQ(incs[0].line, 1U);
  EXPECT_EQ(incs[1].path, "hal.h");
  EXPECT_FALSE(incs[1].isSystem);
  EXPECT_EQ(incs[1].line, 2U);
}

TEST(DirectiveScanner, IgnoresCommentedIncludes)
{
  const auto incs = cnext::scan_includes(
    "// #include \"old.h\"\n"
    "/*\n#include \"older.h\"\n*/\n"
    "#include \"new.h\"\n");
  ASSERT_EQ(incs.size(), 1U);
  EXPECT_EQ(incs[0].path, "new.h");
}

TEST(DirectiveScanner, BothConditionalBranchesContribute)
{
  const auto incs = cnext::scan_includes(
    "#ifdef USE_A\n#include \"a.h\"\n#else\n#include \"b.h\"\n#endif\n");
  EXPECT_EQ(incs.size(), 2U);
}
