#include <gtest/gtest.h>
#include "../docx2tex/math/math_ast.hpp"
#include "../docx2tex/input/input-omml.hpp"
#include "../lib/arena.h"
#include "../lib/log.h"
#include <string>

using namespace docx2tex;

// Test suite for the OMML -> MathNode parser

class OmmlMathParserTest : public ::testing::Test {
protected:
    Arena* arena = nullptr;
    std::unique_ptr<OmmlElement> doc;
    MathDiagnostics diag;

    void SetUp() override {
        log_init(nullptr);
        arena = arena_create_default();
        ASSERT_NE(arena, nullptr);
    }

    void TearDown() override {
        arena_destroy(arena);
    }

    // parse an m:oMath body given without its enclosing element
    MathNode* parse(const std::string& body, int max_depth = MATH_DEFAULT_MAX_DEPTH) {
        std::string error;
        doc = read_omml_xml(
            "<m:oMath xmlns:m=\"http://schemas.openxmlformats.org/officeDocument/2006/math\">" +
            body + "</m:oMath>", &error);
        EXPECT_NE(doc.get(), nullptr) << error;
        if (!doc) return nullptr;
        return parse_omml_formula(doc.get(), arena, diag, max_depth);
    }

    // the single top-level node of a formula
    MathNode* parse_one(const std::string& body) {
        MathNode* root = parse(body);
        if (!root) return nullptr;
        EXPECT_EQ(root->kind, MathNodeKind::GROUP);
        EXPECT_EQ(root->group.count, 1);
        return root->group.count == 1 ? root->group.items[0] : nullptr;
    }

    static std::string text_of(const MathNode* node) {
        std::string out;
        math_node_plain_text(node, out);
        return out;
    }
};

#define RUN(t) "<m:r><m:t>" t "</m:t></m:r>"

TEST_F(OmmlMathParserTest, EmptyFormula) {
    MathNode* root = parse("");
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->kind, MathNodeKind::GROUP);
    EXPECT_EQ(root->group.count, 0);
    EXPECT_TRUE(diag.empty());
}

TEST_F(OmmlMathParserTest, Runs) {
    MathNode* root = parse(RUN("x") RUN("+") RUN("1"));
    ASSERT_NE(root, nullptr);
    ASSERT_EQ(root->group.count, 3);
    EXPECT_EQ(root->group.items[0]->kind, MathNodeKind::RUN);
    EXPECT_STREQ(root->group.items[0]->run.text, "x");
    EXPECT_STREQ(root->group.items[2]->run.text, "1");
}

TEST_F(OmmlMathParserTest, RunProperties) {
    MathNode* node = parse_one(
        "<m:r><m:rPr><m:scr m:val=\"double-struck\"/><m:sty m:val=\"p\"/></m:rPr><m:t>R</m:t></m:r>");
    ASSERT_NE(node, nullptr);
    ASSERT_EQ(node->kind, MathNodeKind::RUN);
    EXPECT_EQ(node->run.style.font, MathFont::DOUBLE_STRUCK);
    EXPECT_TRUE(node->run.style.upright);

    node = parse_one("<m:r><m:rPr><m:nor/></m:rPr><m:t>if</m:t></m:r>");
    ASSERT_NE(node, nullptr);
    EXPECT_TRUE(node->run.style.normal_text);

    node = parse_one("<m:r><m:rPr><m:nor m:val=\"off\"/></m:rPr><m:t>y</m:t></m:r>");
    ASSERT_NE(node, nullptr);
    EXPECT_FALSE(node->run.style.normal_text);
}

TEST_F(OmmlMathParserTest, FunctionNameRun) {
    MathNode* node = parse_one(RUN("sin"));
    ASSERT_NE(node, nullptr);
    EXPECT_TRUE(node->run.style.function);
}

TEST_F(OmmlMathParserTest, Fraction) {
    MathNode* node = parse_one("<m:f><m:num>" RUN("1") "</m:num><m:den>" RUN("2") "</m:den></m:f>");
    ASSERT_NE(node, nullptr);
    ASSERT_EQ(node->kind, MathNodeKind::FRACTION);
    EXPECT_EQ(node->frac.kind, FractionKind::BAR);
    EXPECT_EQ(text_of(node->frac.numer), "1");
    EXPECT_EQ(text_of(node->frac.denom), "2");
    EXPECT_TRUE(diag.empty());
}

TEST_F(OmmlMathParserTest, FractionTypes) {
    MathNode* node = parse_one(
        "<m:f><m:fPr><m:type m:val=\"lin\"/></m:fPr>"
        "<m:num>" RUN("a") "</m:num><m:den>" RUN("b") "</m:den></m:f>");
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->frac.kind, FractionKind::LINEAR);

    // a bar-less fraction in parentheses is a binomial coefficient
    node = parse_one(
        "<m:d><m:e><m:f><m:fPr><m:type m:val=\"noBar\"/></m:fPr>"
        "<m:num>" RUN("n") "</m:num><m:den>" RUN("k") "</m:den></m:f></m:e></m:d>");
    ASSERT_NE(node, nullptr);
    ASSERT_EQ(node->kind, MathNodeKind::FRACTION);
    EXPECT_EQ(node->frac.kind, FractionKind::BINOMIAL);
}

TEST_F(OmmlMathParserTest, MissingDenominatorDegrades) {
    MathNode* node = parse_one("<m:f><m:num>" RUN("1") "</m:num></m:f>");
    ASSERT_NE(node, nullptr);
    ASSERT_EQ(node->kind, MathNodeKind::DEGRADED);
    EXPECT_STREQ(node->degraded.text, "1");
    ASSERT_EQ(diag.size(), 1u);
    EXPECT_EQ(diag.items()[0].element, "m:f");
    EXPECT_EQ(diag.items()[0].reason, "fraction without m:den");
}

TEST_F(OmmlMathParserTest, Radical) {
    MathNode* node = parse_one(
        "<m:rad><m:radPr><m:degHide m:val=\"1\"/></m:radPr><m:deg/><m:e>" RUN("x") "</m:e></m:rad>");
    ASSERT_NE(node, nullptr);
    ASSERT_EQ(node->kind, MathNodeKind::RADICAL);
    EXPECT_EQ(node->radical.degree, nullptr);

    node = parse_one("<m:rad><m:deg>" RUN("3") "</m:deg><m:e>" RUN("x") "</m:e></m:rad>");
    ASSERT_NE(node, nullptr);
    ASSERT_NE(node->radical.degree, nullptr);
    EXPECT_EQ(text_of(node->radical.degree), "3");
}

TEST_F(OmmlMathParserTest, Scripts) {
    MathNode* node = parse_one("<m:sSup><m:e>" RUN("x") "</m:e><m:sup>" RUN("2") "</m:sup></m:sSup>");
    ASSERT_NE(node, nullptr);
    ASSERT_EQ(node->kind, MathNodeKind::SUPERSCRIPT);
    EXPECT_EQ(node->scripts.sub, nullptr);
    EXPECT_EQ(text_of(node->scripts.sup), "2");

    node = parse_one(
        "<m:sSubSup><m:e>" RUN("x") "</m:e><m:sub>" RUN("i") "</m:sub><m:sup>" RUN("2") "</m:sup></m:sSubSup>");
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->kind, MathNodeKind::SUBSUP);

    node = parse_one(
        "<m:sPre><m:sub>" RUN("1") "</m:sub><m:sup>" RUN("2") "</m:sup><m:e>" RUN("X") "</m:e></m:sPre>");
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->kind, MathNodeKind::PRESCRIPT);

    node = parse_one("<m:sSub><m:e>" RUN("x") "</m:e></m:sSub>");
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->kind, MathNodeKind::DEGRADED);
    EXPECT_EQ(diag.size(), 1u);
}

TEST_F(OmmlMathParserTest, NaryDefaultsToIntegral) {
    MathNode* node = parse_one(
        "<m:nary><m:sub>" RUN("0") "</m:sub><m:sup>" RUN("1") "</m:sup><m:e>" RUN("f(x)dx") "</m:e></m:nary>");
    ASSERT_NE(node, nullptr);
    ASSERT_EQ(node->kind, MathNodeKind::NARY);
    EXPECT_EQ(node->nary.op_char, 0x222Bu);
    EXPECT_EQ(node->nary.placement, LimitPlacement::DEFAULT);
    EXPECT_EQ(text_of(node->nary.lower), "0");
    EXPECT_EQ(text_of(node->nary.upper), "1");
    EXPECT_EQ(text_of(node->nary.operand), "f(x)dx");
}

TEST_F(OmmlMathParserTest, NaryProperties) {
    MathNode* node = parse_one(
        "<m:nary><m:naryPr><m:chr m:val=\"&#x2211;\"/><m:limLoc m:val=\"undOvr\"/>"
        "<m:supHide m:val=\"1\"/></m:naryPr>"
        "<m:sub>" RUN("i") "</m:sub><m:sup/><m:e>" RUN("i") "</m:e></m:nary>");
    ASSERT_NE(node, nullptr);
    ASSERT_EQ(node->kind, MathNodeKind::NARY);
    EXPECT_EQ(node->nary.op_char, 0x2211u);
    EXPECT_EQ(node->nary.placement, LimitPlacement::UNDER_OVER);
    EXPECT_NE(node->nary.lower, nullptr);
    EXPECT_EQ(node->nary.upper, nullptr);
}

TEST_F(OmmlMathParserTest, NaryEmptyLimitsAreAbsent) {
    MathNode* node = parse_one("<m:nary><m:sub/><m:sup/><m:e>" RUN("x") "</m:e></m:nary>");
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->nary.lower, nullptr);
    EXPECT_EQ(node->nary.upper, nullptr);
}

TEST_F(OmmlMathParserTest, DelimiterDefaults) {
    MathNode* node = parse_one("<m:d><m:e>" RUN("x") "</m:e></m:d>");
    ASSERT_NE(node, nullptr);
    ASSERT_EQ(node->kind, MathNodeKind::DELIMITED);
    EXPECT_EQ(node->delimited.open_char, (uint32_t)'(');
    EXPECT_EQ(node->delimited.close_char, (uint32_t)')');
    EXPECT_EQ(node->delimited.sep_char, 0u);
    EXPECT_EQ(node->delimited.count, 1);
}

TEST_F(OmmlMathParserTest, DelimiterMarkers) {
    MathNode* node = parse_one(
        "<m:d><m:dPr><m:begChr m:val=\"{\"/><m:endChr m:val=\"\"/></m:dPr>"
        "<m:e>" RUN("a") "</m:e><m:e>" RUN("b") "</m:e></m:d>");
    ASSERT_NE(node, nullptr);
    ASSERT_EQ(node->kind, MathNodeKind::DELIMITED);
    EXPECT_EQ(node->delimited.open_char, (uint32_t)'{');
    EXPECT_EQ(node->delimited.close_char, 0u);
    EXPECT_EQ(node->delimited.sep_char, (uint32_t)'|');
    EXPECT_EQ(node->delimited.count, 2);
}

TEST_F(OmmlMathParserTest, MarkerWithoutValueKeepsDefault) {
    MathNode* node = parse_one(
        "<m:d><m:dPr><m:begChr/><m:endChr/><m:sepChr/></m:dPr>"
        "<m:e>" RUN("a") "</m:e></m:d>");
    ASSERT_NE(node, nullptr);
    ASSERT_EQ(node->kind, MathNodeKind::DELIMITED);
    EXPECT_EQ(node->delimited.open_char, (uint32_t)'(');
    EXPECT_EQ(node->delimited.close_char, (uint32_t)')');
    EXPECT_EQ(node->delimited.sep_char, (uint32_t)'|');
    EXPECT_TRUE(diag.empty());
}

TEST_F(OmmlMathParserTest, MatrixTakesDelimiterMarkers) {
    MathNode* node = parse_one(
        "<m:d><m:e><m:m>"
        "<m:mr><m:e>" RUN("a") "</m:e><m:e>" RUN("b") "</m:e></m:mr>"
        "<m:mr><m:e>" RUN("c") "</m:e><m:e>" RUN("d") "</m:e></m:mr>"
        "</m:m></m:e></m:d>");
    ASSERT_NE(node, nullptr);
    ASSERT_EQ(node->kind, MathNodeKind::MATRIX);
    EXPECT_EQ(node->matrix.rows, 2);
    EXPECT_EQ(node->matrix.cols, 2);
    EXPECT_EQ(node->matrix.open_char, (uint32_t)'(');
    EXPECT_EQ(node->matrix.close_char, (uint32_t)')');
    EXPECT_EQ(text_of(node), "abcd");
}

TEST_F(OmmlMathParserTest, RaggedMatrixDegrades) {
    MathNode* node = parse_one(
        "<m:m>"
        "<m:mr><m:e>" RUN("a") "</m:e><m:e>" RUN("b") "</m:e></m:mr>"
        "<m:mr><m:e>" RUN("c") "</m:e></m:mr>"
        "</m:m>");
    ASSERT_NE(node, nullptr);
    ASSERT_EQ(node->kind, MathNodeKind::DEGRADED);
    EXPECT_STREQ(node->degraded.text, "abc");
    ASSERT_EQ(diag.size(), 1u);
    EXPECT_EQ(diag.items()[0].reason, "ragged matrix: row 2 has 1 cells, expected 2");
}

TEST_F(OmmlMathParserTest, EquationArray) {
    MathNode* node = parse_one("<m:eqArr><m:e>" RUN("x=1") "</m:e><m:e>" RUN("y=2") "</m:e></m:eqArr>");
    ASSERT_NE(node, nullptr);
    ASSERT_EQ(node->kind, MathNodeKind::EQ_ARRAY);
    EXPECT_EQ(node->group.count, 2);
}

TEST_F(OmmlMathParserTest, Accents) {
    MathNode* node = parse_one("<m:acc><m:e>" RUN("x") "</m:e></m:acc>");
    ASSERT_NE(node, nullptr);
    ASSERT_EQ(node->kind, MathNodeKind::ACCENT);
    EXPECT_EQ(node->accent.kind, AccentKind::HAT);

    node = parse_one("<m:acc><m:accPr><m:chr m:val=\"&#x303;\"/></m:accPr><m:e>" RUN("x") "</m:e></m:acc>");
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->accent.kind, AccentKind::TILDE);

    node = parse_one("<m:acc><m:accPr><m:chr m:val=\"&#x20D7;\"/></m:accPr><m:e>" RUN("v") "</m:e></m:acc>");
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->accent.kind, AccentKind::VEC);

    node = parse_one("<m:acc><m:accPr><m:chr m:val=\"&#x2605;\"/></m:accPr><m:e>" RUN("v") "</m:e></m:acc>");
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->accent.kind, AccentKind::UNKNOWN);
    EXPECT_EQ(node->accent.accent_char, 0x2605u);
}

TEST_F(OmmlMathParserTest, BarsAndGroupCharacters) {
    MathNode* node = parse_one("<m:bar><m:e>" RUN("x") "</m:e></m:bar>");
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->accent.kind, AccentKind::OVERLINE);

    node = parse_one("<m:bar><m:barPr><m:pos m:val=\"bot\"/></m:barPr><m:e>" RUN("x") "</m:e></m:bar>");
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->accent.kind, AccentKind::UNDERLINE);

    node = parse_one("<m:groupChr><m:e>" RUN("a+b") "</m:e></m:groupChr>");
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->accent.kind, AccentKind::UNDERBRACE);

    node = parse_one(
        "<m:groupChr><m:groupChrPr><m:chr m:val=\"&#x23DE;\"/><m:pos m:val=\"top\"/></m:groupChrPr>"
        "<m:e>" RUN("a+b") "</m:e></m:groupChr>");
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->accent.kind, AccentKind::OVERBRACE);
}

TEST_F(OmmlMathParserTest, LimitsAndFunctions) {
    MathNode* node = parse_one(
        "<m:func><m:fName><m:limLow><m:e>" RUN("lim") "</m:e><m:lim>" RUN("n") "</m:lim></m:limLow></m:fName>"
        "<m:e>" RUN("a") "</m:e></m:func>");
    ASSERT_NE(node, nullptr);
    ASSERT_EQ(node->kind, MathNodeKind::FUNCTION);
    const MathNode* name = node->func.name;
    ASSERT_EQ(name->kind, MathNodeKind::GROUP);
    ASSERT_EQ(name->group.count, 1);
    const MathNode* limit = name->group.items[0];
    ASSERT_EQ(limit->kind, MathNodeKind::LIMIT);
    EXPECT_FALSE(limit->limit.upper);
    EXPECT_TRUE(math_node_is_function_name(limit->limit.base));

    node = parse_one(
        "<m:limUpp><m:e>" RUN("x") "</m:e><m:lim>" RUN("def") "</m:lim></m:limUpp>");
    ASSERT_NE(node, nullptr);
    ASSERT_EQ(node->kind, MathNodeKind::LIMIT);
    EXPECT_TRUE(node->limit.upper);
}

TEST_F(OmmlMathParserTest, BoxesAndPhantoms) {
    MathNode* node = parse_one("<m:borderBox><m:e>" RUN("E") "</m:e></m:borderBox>");
    ASSERT_NE(node, nullptr);
    ASSERT_EQ(node->kind, MathNodeKind::ENCLOSURE);
    EXPECT_EQ(node->enclosure.kind, EnclosureKind::BOXED);

    node = parse_one("<m:phant><m:phantPr><m:show m:val=\"0\"/></m:phantPr><m:e>" RUN("x") "</m:e></m:phant>");
    ASSERT_NE(node, nullptr);
    ASSERT_EQ(node->kind, MathNodeKind::ENCLOSURE);
    EXPECT_EQ(node->enclosure.kind, EnclosureKind::PHANTOM);

    // a visible phantom is just its content
    node = parse_one("<m:phant><m:e>" RUN("x") "</m:e></m:phant>");
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->kind, MathNodeKind::GROUP);

    // a box is transparent
    node = parse_one("<m:box><m:e>" RUN("y") "</m:e></m:box>");
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(text_of(node), "y");
}

TEST_F(OmmlMathParserTest, UnknownElementDegrades) {
    MathNode* root = parse(RUN("a") "<m:futureThing>" RUN("q") "</m:futureThing>" RUN("b"));
    ASSERT_NE(root, nullptr);
    ASSERT_EQ(root->group.count, 3);
    EXPECT_EQ(root->group.items[0]->kind, MathNodeKind::RUN);
    EXPECT_EQ(root->group.items[1]->kind, MathNodeKind::DEGRADED);
    EXPECT_STREQ(root->group.items[1]->degraded.text, "q");
    EXPECT_EQ(root->group.items[2]->kind, MathNodeKind::RUN);
    ASSERT_EQ(diag.size(), 1u);
    EXPECT_EQ(diag.items()[0].element, "m:futureThing");
}

TEST_F(OmmlMathParserTest, ForeignElementsKeepText) {
    MathNode* root = parse(
        "<w:bookmarkStart xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\"/>"
        "<w:r xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\"><w:t>k</w:t></w:r>");
    ASSERT_NE(root, nullptr);
    ASSERT_EQ(root->group.count, 1);
    EXPECT_EQ(root->group.items[0]->kind, MathNodeKind::RUN);
    EXPECT_STREQ(root->group.items[0]->run.text, "k");
    EXPECT_TRUE(diag.empty());
}

TEST_F(OmmlMathParserTest, DepthLimitTruncates) {
    std::string body = RUN("z");
    for (int i = 0; i < 10; i++) {
        body = "<m:f><m:num>" + body + "</m:num><m:den>" RUN("2") "</m:den></m:f>";
    }
    MathNode* root = parse(body, 4);
    ASSERT_NE(root, nullptr);
    EXPECT_GE(diag.size(), 1u);
    EXPECT_EQ(diag.items()[0].reason, "nesting depth limit reached, subtree truncated");
    // the text of the truncated part survives
    EXPECT_EQ(text_of(root), "z" + std::string(10, '2'));
}

TEST_F(OmmlMathParserTest, DeepNestingWithinDefaultLimit) {
    std::string body = RUN("z");
    for (int i = 0; i < 20; i++) {
        body = "<m:sSup><m:e>" + body + "</m:e><m:sup>" RUN("2") "</m:sup></m:sSup>";
    }
    MathNode* root = parse(body);
    ASSERT_NE(root, nullptr);
    EXPECT_TRUE(diag.empty());
}

TEST_F(OmmlMathParserTest, DumpShowsStructure) {
    MathNode* root = parse("<m:f><m:num>" RUN("1") "</m:num><m:den>" RUN("2") "</m:den></m:f>");
    ASSERT_NE(root, nullptr);
    std::string out;
    math_ast_dump(root, out);
    EXPECT_NE(out.find("FRACTION"), std::string::npos);
    EXPECT_NE(out.find("numer:"), std::string::npos);
    EXPECT_NE(out.find("RUN text='2'"), std::string::npos);
}

TEST_F(OmmlMathParserTest, NodeQueries) {
    MathNode* x = make_math_run(arena, "x");
    MathNode* xy = make_math_run(arena, "xy");
    MathNode* alpha = make_math_run(arena, "\xCE\xB1");
    EXPECT_TRUE(math_node_is_atom(x));
    EXPECT_TRUE(math_node_is_atom(alpha));
    EXPECT_FALSE(math_node_is_atom(xy));
    EXPECT_TRUE(math_node_is_atom(make_math_group(arena, {x})));
    EXPECT_FALSE(math_node_is_atom(make_math_group(arena, {x, xy})));
    EXPECT_FALSE(math_node_is_atom(nullptr));

    EXPECT_EQ(make_math_matrix(arena, {{x, x}, {x}}), nullptr);
    EXPECT_EQ(make_math_matrix(arena, {}), nullptr);

    EXPECT_EQ(math_accent_kind_for(0x0302), AccentKind::HAT);
    EXPECT_EQ(math_accent_kind_for(0x23DF), AccentKind::UNDERBRACE);
    EXPECT_EQ(math_accent_kind_for('z'), AccentKind::UNKNOWN);
    EXPECT_STREQ(math_node_kind_name(MathNodeKind::EQ_ARRAY), "EQ_ARRAY");
}
