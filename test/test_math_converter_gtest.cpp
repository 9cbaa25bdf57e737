#include <gtest/gtest.h>
#include "../docx2tex/math/math_converter.hpp"
#include "../docx2tex/formula_thread_pool.h"
#include "../lib/log.h"
#include <pthread.h>
#include <memory>
#include <string>
#include <vector>

using namespace docx2tex;

// Test suite for the per-formula pipeline and the document-level driver

class MathConverterTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_init(nullptr);
    }

    std::unique_ptr<OmmlElement> read(const std::string& xml) {
        std::string error;
        auto root = read_omml_xml(xml, &error);
        EXPECT_NE(root.get(), nullptr) << error;
        return root;
    }

    // a document holding `count` formulas, every third one a display formula
    static std::string make_document(int count) {
        std::string xml =
            "<w:document xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\""
            " xmlns:m=\"http://schemas.openxmlformats.org/officeDocument/2006/math\"><w:body>";
        for (int i = 0; i < count; i++) {
            std::string body = "<m:sSup><m:e><m:r><m:t>x</m:t></m:r></m:e><m:sup><m:r><m:t>" +
                               std::to_string(i) + "</m:t></m:r></m:sup></m:sSup>";
            if (i % 3 == 0) {
                xml += "<w:p><m:oMathPara><m:oMath>" + body + "</m:oMath></m:oMathPara></w:p>";
            } else {
                xml += "<w:p><m:oMath>" + body + "</m:oMath></w:p>";
            }
        }
        xml += "</w:body></w:document>";
        return xml;
    }
};

TEST_F(MathConverterTest, ConvertsSimpleFormula) {
    auto root = read("<m:oMath><m:f><m:num><m:r><m:t>1</m:t></m:r></m:num>"
                     "<m:den><m:r><m:t>2</m:t></m:r></m:den></m:f></m:oMath>");
    FormulaResult result = convert_formula(root.get(), false, 0);
    EXPECT_EQ(result.latex, "\\frac{1}{2}");
    EXPECT_FALSE(result.degraded);
    EXPECT_TRUE(result.diagnostics.empty());
}

TEST_F(MathConverterTest, DegradedFractionKeepsText) {
    auto root = read("<m:oMath><m:f><m:num><m:r><m:t>1</m:t></m:r></m:num></m:f></m:oMath>");
    FormulaResult result = convert_formula(root.get(), true, 7);
    EXPECT_EQ(result.index, 7);
    EXPECT_TRUE(result.display);
    EXPECT_EQ(result.latex, "1");
    EXPECT_TRUE(result.degraded);
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].formula_index, 7);
    EXPECT_EQ(result.diagnostics[0].element, "m:f");
    EXPECT_EQ(result.diagnostics[0].reason, "fraction without m:den");
}

TEST_F(MathConverterTest, UprightAndItalicRuns) {
    // differential d of an integrand: plain single letter, then a variable
    auto root = read("<m:oMath><m:r><m:rPr><m:sty m:val=\"p\"/></m:rPr><m:t>d</m:t></m:r>"
                     "<m:r><m:t>x</m:t></m:r></m:oMath>");
    FormulaResult result = convert_formula(root.get(), false, 0);
    EXPECT_EQ(result.latex, "\\mathrm{d}x");
    EXPECT_FALSE(result.degraded);

    auto italic = read("<m:oMath><m:r><m:rPr><m:sty m:val=\"i\"/></m:rPr><m:t>abc</m:t></m:r></m:oMath>");
    EXPECT_EQ(convert_formula(italic.get(), false, 0).latex, "\\mathit{abc}");

    auto plain = read("<m:oMath><m:r><m:t>abc</m:t></m:r></m:oMath>");
    EXPECT_EQ(convert_formula(plain.get(), false, 0).latex, "abc");
}

TEST_F(MathConverterTest, FunctionArgumentGetsThinSpace) {
    auto root = read("<m:oMath><m:func><m:fName><m:r><m:rPr><m:sty m:val=\"p\"/></m:rPr><m:t>sin</m:t></m:r></m:fName>"
                     "<m:e><m:r><m:t>x</m:t></m:r></m:e></m:func></m:oMath>");
    FormulaResult result = convert_formula(root.get(), false, 0);
    EXPECT_EQ(result.latex, "\\sin\\,x");
    EXPECT_FALSE(result.degraded);

    // not a known function: plain product, no spacing
    auto other = read("<m:oMath><m:func><m:fName><m:r><m:t>g</m:t></m:r></m:fName>"
                      "<m:e><m:r><m:t>x</m:t></m:r></m:e></m:func></m:oMath>");
    EXPECT_EQ(convert_formula(other.get(), false, 0).latex, "gx");
}

TEST_F(MathConverterTest, DelimiterMarkerWithoutValue) {
    auto root = read("<m:oMath><m:d><m:dPr><m:begChr/><m:endChr/></m:dPr>"
                     "<m:e><m:r><m:t>x</m:t></m:r></m:e></m:d></m:oMath>");
    EXPECT_EQ(convert_formula(root.get(), false, 0).latex, "\\left( x \\right)");

    auto none = read("<m:oMath><m:d><m:dPr><m:begChr m:val=\"\"/><m:endChr m:val=\"\"/></m:dPr>"
                     "<m:e><m:r><m:t>x</m:t></m:r></m:e></m:d></m:oMath>");
    EXPECT_EQ(convert_formula(none.get(), false, 0).latex, "x");
}

TEST_F(MathConverterTest, EmptyFormula) {
    auto root = read("<m:oMath/>");
    FormulaResult result = convert_formula(root.get(), false, 0);
    EXPECT_EQ(result.latex, "{}");
    EXPECT_FALSE(result.degraded);

    FormulaResult missing = convert_formula(nullptr, false, 1);
    EXPECT_EQ(missing.latex, "{}");
}

TEST_F(MathConverterTest, DepthLimitFromOptions) {
    std::string body = "<m:r><m:t>z</m:t></m:r>";
    for (int i = 0; i < 12; i++) {
        body = "<m:rad><m:radPr><m:degHide m:val=\"1\"/></m:radPr><m:e>" + body + "</m:e></m:rad>";
    }
    auto root = read("<m:oMath>" + body + "</m:oMath>");

    FormulaResult full = convert_formula(root.get(), false, 0);
    EXPECT_FALSE(full.degraded);

    MathConvertOptions options;
    options.max_depth = 5;
    FormulaResult cut = convert_formula(root.get(), false, 0, options);
    EXPECT_TRUE(cut.degraded);
    ASSERT_FALSE(cut.diagnostics.empty());
    EXPECT_EQ(cut.diagnostics[0].reason, "nesting depth limit reached, subtree truncated");
    EXPECT_NE(cut.latex.find('z'), std::string::npos);
}

TEST_F(MathConverterTest, ResultsKeepDocumentOrder) {
    auto doc = read(make_document(40));
    std::vector<OmmlFormulaRef> formulas = find_omml_formulas(doc.get());
    ASSERT_EQ(formulas.size(), 40u);

    MathConvertOptions options;
    options.worker_count = 4;
    std::vector<FormulaResult> results = convert_formulas(formulas, options);
    ASSERT_EQ(results.size(), 40u);
    for (int i = 0; i < 40; i++) {
        EXPECT_EQ(results[i].index, i);
        EXPECT_EQ(results[i].display, i % 3 == 0);
        EXPECT_EQ(results[i].latex, "x^{" + std::to_string(i) + "}");
    }
}

TEST_F(MathConverterTest, SerialAndParallelAgree) {
    auto doc = read(make_document(25));
    std::vector<OmmlFormulaRef> formulas = find_omml_formulas(doc.get());

    MathConvertOptions serial;
    serial.worker_count = 1;
    MathConvertOptions parallel;
    parallel.worker_count = 0;

    std::vector<FormulaResult> a = convert_formulas(formulas, serial);
    std::vector<FormulaResult> b = convert_formulas(formulas, parallel);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); i++) {
        EXPECT_EQ(a[i].latex, b[i].latex);
        EXPECT_EQ(a[i].degraded, b[i].degraded);
    }
}

TEST_F(MathConverterTest, OneBadFormulaDoesNotAffectOthers) {
    auto doc = read(
        "<w:body xmlns:m=\"http://schemas.openxmlformats.org/officeDocument/2006/math\">"
        "<m:oMath><m:r><m:t>a</m:t></m:r></m:oMath>"
        "<m:oMath><m:f><m:num><m:r><m:t>b</m:t></m:r></m:num></m:f></m:oMath>"
        "<m:oMath><m:r><m:t>c</m:t></m:r></m:oMath>"
        "</w:body>");
    std::vector<FormulaResult> results = convert_formulas(find_omml_formulas(doc.get()));
    ASSERT_EQ(results.size(), 3u);
    EXPECT_FALSE(results[0].degraded);
    EXPECT_TRUE(results[1].degraded);
    EXPECT_EQ(results[1].diagnostics[0].formula_index, 1);
    EXPECT_FALSE(results[2].degraded);
    EXPECT_EQ(results[2].latex, "c");
}

TEST_F(MathConverterTest, NoFormulas) {
    EXPECT_TRUE(convert_formulas(std::vector<OmmlFormulaRef>()).empty());
}

TEST_F(MathConverterTest, CleanFragment) {
    EXPECT_EQ(clean_math_fragment("  \\frac{ a }{ b }  "), "\\frac{a}{b}");
    EXPECT_EQ(clean_math_fragment("a   +\n b"), "a + b");
    EXPECT_EQ(clean_math_fragment("a\\  b"), "a\\ b");
    EXPECT_EQ(clean_math_fragment("\\{ x \\}"), "\\{ x \\}");
    EXPECT_EQ(clean_math_fragment("   "), "{}");
    EXPECT_EQ(clean_math_fragment(""), "{}");
}

TEST_F(MathConverterTest, WrapFragment) {
    EXPECT_EQ(wrap_math_fragment("x", false), "$x$");
    EXPECT_EQ(wrap_math_fragment("x", true), "\\[ x \\]");
    EXPECT_EQ(wrap_math_fragment("x", true, MathWrapStyle::EQUATION), "\\begin{equation} x \\end{equation}");
    EXPECT_EQ(wrap_math_fragment("x", false, MathWrapStyle::EQUATION), "$x$");
}

// ============================================================================
// Worker pool
// ============================================================================

struct CounterTask {
    pthread_mutex_t* mutex;
    int* counter;
};

static void increment_task(void* data) {
    CounterTask* task = (CounterTask*)data;
    pthread_mutex_lock(task->mutex);
    (*task->counter)++;
    pthread_mutex_unlock(task->mutex);
}

TEST(FormulaThreadPoolTest, RunsEveryTask) {
    FormulaThreadPool* pool = formula_pool_create(3);
    ASSERT_NE(pool, nullptr);
    EXPECT_EQ(pool->num_threads, 3);

    pthread_mutex_t mutex = PTHREAD_MUTEX_INITIALIZER;
    int counter = 0;
    CounterTask task{&mutex, &counter};
    for (int i = 0; i < 100; i++) {
        ASSERT_TRUE(formula_pool_enqueue(pool, increment_task, &task));
    }
    formula_pool_wait_all(pool);
    EXPECT_EQ(counter, 100);
    EXPECT_EQ(formula_pool_get_queued_count(pool), 0);
    EXPECT_EQ(formula_pool_get_active_count(pool), 0);
    formula_pool_destroy(pool);
}

TEST(FormulaThreadPoolTest, DefaultsToOnlineCpus) {
    FormulaThreadPool* pool = formula_pool_create(0);
    ASSERT_NE(pool, nullptr);
    EXPECT_GE(pool->num_threads, 1);
    formula_pool_wait_all(pool);
    formula_pool_destroy(pool);
}

TEST(FormulaThreadPoolTest, RejectsNullArguments) {
    EXPECT_FALSE(formula_pool_enqueue(nullptr, increment_task, nullptr));
    FormulaThreadPool* pool = formula_pool_create(1);
    ASSERT_NE(pool, nullptr);
    EXPECT_FALSE(formula_pool_enqueue(pool, nullptr, nullptr));
    formula_pool_destroy(pool);
    formula_pool_destroy(nullptr);
}
