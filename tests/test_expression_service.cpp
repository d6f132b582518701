#include <QtTest>
#include "formula/ExpressionService.h"
#include <QAtomicInt>
#include <QJsonDocument>
#include <QThread>
#include <memory>
#include <vector>

using namespace Formula;

class TestExpressionService : public QObject {
    Q_OBJECT

private slots:
    // Core operations
    void testEvaluate();
    void testSyntaxErrorIsReported();
    void testParsedTreeIsReusable();
    void testValidate();
    void testLimitsAreApplied();

    // Catalogue
    void testFunctionCatalogue();
    void testCatalogueJson();

    // Editor support
    void testHighlight();
    void testHighlightInvalidInput();
    void testSuggestionsOrdering();
    void testSuggestionsInsideCall();
    void testVariableSuggestions();

    // Threading
    void testConcurrentEvaluation();

private:
    ExpressionService m_service;
};

void TestExpressionService::testEvaluate() {
    EvaluationContext ctx;
    ctx.fields["price"] = 10;
    ctx.fields["quantity"] = 5;

    EvaluationResult r = m_service.evaluate("price * quantity", ctx);
    QVERIFY(r.success);
    QCOMPARE(r.value.toDouble(), 50.0);
    QCOMPARE(r.type, ValueType::Number);

    // Context built from JSON
    const QJsonObject json = QJsonDocument::fromJson(
        R"({"fields": {"name": "Ada", "tags": ["a", "b"]},
            "datasets": {"rates": [{"code": "EUR", "rate": 1.1}]}})").object();
    const EvaluationContext fromJson = EvaluationContext::fromJson(json);
    QCOMPARE(m_service.evaluate("name & ':' & JOIN(tags, '|')", fromJson).value.toString(),
             QString("Ada:a|b"));
    QCOMPARE(m_service.evaluate("LOOKUP('rates', 'code', 'EUR', 'rate')", fromJson)
                 .value.toDouble(), 1.1);

    // Variables, user and system sections
    const QJsonObject full = QJsonDocument::fromJson(
        R"({"fields": {"days": 3},
            "variables": {"totalDays": 5},
            "user": {"name": "Grace", "roles": ["approver"]},
            "system": {"now": "2024-03-15T10:30:00", "today": "2024-03-15"}})").object();
    const EvaluationContext ctx = EvaluationContext::fromJson(full);
    QCOMPARE(m_service.evaluate("$totalDays > days", ctx).value, QVariant(true));
    QCOMPARE(m_service.evaluate("user.name & '/' & FIRST(user.roles)", ctx).value.toString(),
             QString("Grace/approver"));
    QCOMPARE(m_service.evaluate("today", ctx).type, ValueType::Date);
    QCOMPARE(m_service.evaluate("DATEDIFF(today, now, 'hours')", ctx).value.toDouble(), 10.0);

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("not a valid date"));
    const EvaluationContext badClock = EvaluationContext::fromJson(
        QJsonDocument::fromJson(R"({"system": {"now": "soon"}})").object());
    QCOMPARE(m_service.evaluate("now", badClock).value.toString(), QString("soon"));
}

void TestExpressionService::testSyntaxErrorIsReported() {
    EvaluationResult r = m_service.evaluate("1 +");
    QVERIFY(!r.success);
    QCOMPARE(r.error.kind, EvaluationError::Kind::Syntax);
    QCOMPARE(r.error.position, 3);

    r = m_service.evaluate("'unterminated");
    QVERIFY(!r.success);
    QCOMPARE(r.error.kind, EvaluationError::Kind::Syntax);
}

void TestExpressionService::testParsedTreeIsReusable() {
    ParseResult parsed = m_service.parse("amount * (1 + rate)");
    QVERIFY(parsed.success);

    EvaluationContext a;
    a.fields["amount"] = 100;
    a.fields["rate"] = 0.5;
    EvaluationContext b;
    b.fields["amount"] = 10;
    b.fields["rate"] = 1;

    QCOMPARE(m_service.evaluate(parsed.ast, a).value.toDouble(), 150.0);
    QCOMPARE(m_service.evaluate(parsed.ast, b).value.toDouble(), 20.0);
    QCOMPARE(m_service.evaluate(parsed.ast, a).value.toDouble(), 150.0);
}

void TestExpressionService::testValidate() {
    ValidationResult v = m_service.validate("ROUND(total, 2)", {"total"});
    QVERIFY(v.valid);
    QCOMPARE(v.referencedFields, QStringList({"total"}));
    QCOMPARE(v.referencedFunctions, QStringList({"ROUND"}));

    v = m_service.validate("ROUND(totl, 2)", {"total"});
    QVERIFY(!v.valid);
    QCOMPARE(v.errors[0].type, QString("unknown_field"));
}

void TestExpressionService::testLimitsAreApplied() {
    EngineLimits limits;
    limits.maxFormulaLength = 20;
    ExpressionService service(limits);
    QCOMPARE(service.limits().maxFormulaLength, 20);
    QCOMPARE(service.limits().maxNodeCount, 5000);

    EvaluationResult r = service.evaluate("1 + 2 + 3 + 4 + 5 + 6 + 7");
    QVERIFY(!r.success);
    QCOMPARE(r.error.kind, EvaluationError::Kind::Syntax);
    QVERIFY(r.error.message.contains("too long"));

    ValidationResult v = service.validate("1 + 2 + 3 + 4 + 5 + 6 + 7");
    QVERIFY(!v.valid);
    QCOMPARE(v.errors[0].type, QString("syntax"));
}

void TestExpressionService::testFunctionCatalogue() {
    QCOMPARE(m_service.functionCount(), FunctionRegistry::builtins().count());
    QCOMPARE(m_service.listFunctions().size(), m_service.functionCount());
    QCOMPARE(&m_service.registry(), &FunctionRegistry::builtins());

    const FunctionDefinition *def = m_service.function("vlookup");
    QVERIFY(def);
    QCOMPARE(def->category, QString("lookup"));
    QVERIFY(m_service.function("missing") == nullptr);

    const QVector<FunctionDefinition> text = m_service.functionsByCategory("text");
    QVERIFY(!text.isEmpty());
    for (const FunctionDefinition &d : text)
        QCOMPARE(d.category, QString("text"));
}

void TestExpressionService::testCatalogueJson() {
    const QJsonArray catalogue = m_service.functionCatalogueJson();
    QCOMPARE(catalogue.size(), m_service.functionCount());
    for (const QJsonValue &entry : catalogue) {
        const QJsonObject obj = entry.toObject();
        QVERIFY(!obj["name"].toString().isEmpty());
        QVERIFY(obj["signature"].toString().startsWith(obj["name"].toString() + "("));
        QVERIFY(!obj["examples"].toArray().isEmpty());
    }
}

void TestExpressionService::testHighlight() {
    const QVector<HighlightToken> tokens = m_service.highlight("SUM(price, 'x') > 2");
    QCOMPARE(tokens.size(), 8);

    QCOMPARE(tokens[0].type, QString("function"));
    QCOMPARE(tokens[0].start, 0);
    QCOMPARE(tokens[0].end, 3);
    QCOMPARE(tokens[1].type, QString("punctuation"));
    QCOMPARE(tokens[2].type, QString("field"));
    QCOMPARE(tokens[2].text, QString("price"));
    QCOMPARE(tokens[3].type, QString("punctuation"));

    // String spans include their quotes
    QCOMPARE(tokens[4].type, QString("literal"));
    QCOMPARE(tokens[4].text, QString("x"));
    QCOMPARE(tokens[4].start, 11);
    QCOMPARE(tokens[4].end, 14);

    QCOMPARE(tokens[6].type, QString("operator"));
    QCOMPARE(tokens[6].start, 16);
    QCOMPARE(tokens[7].type, QString("literal"));
    QCOMPARE(tokens[7].end, 19);

    const QVector<HighlightToken> keywords = m_service.highlight("flag == TRUE");
    QCOMPARE(keywords.size(), 3);
    QCOMPARE(keywords[0].type, QString("field"));
    QCOMPARE(keywords[2].type, QString("literal"));
}

void TestExpressionService::testHighlightInvalidInput() {
    QVERIFY(m_service.highlight("a + 'open").isEmpty());
    QVERIFY(m_service.highlight("a # b").isEmpty());
    QVERIFY(m_service.highlight("").isEmpty());
}

void TestExpressionService::testSuggestionsOrdering() {
    const QVector<Suggestion> s =
        m_service.suggestions("su", 2, {"subtotal", "total"});
    QStringList labels;
    for (const Suggestion &item : s)
        labels << item.label;
    QCOMPARE(labels, QStringList({"subtotal", "SUM", "SUMIF"}));

    QCOMPARE(s[0].kind, Suggestion::Field);
    QCOMPARE(s[0].insertText, QString("subtotal"));
    QCOMPARE(s[1].kind, Suggestion::Function);
    QCOMPARE(s[1].insertText, QString("SUM("));
    QCOMPARE(s[1].cursorOffset, 1);
    QCOMPARE(s[1].category, QString("math"));
    QVERIFY(!s[1].description.isEmpty());
}

void TestExpressionService::testSuggestionsInsideCall() {
    const QString source = "ROUND(pr";
    const QVector<Suggestion> s =
        m_service.suggestions(source, source.length(), {"price", "quantity"});
    QCOMPARE(s.size(), 2);
    QCOMPARE(s[0].label, QString("price"));
    QCOMPARE(s[1].label, QString("PROPER"));

    // Cursor in the middle of a word only uses the text before it
    const QVector<Suggestion> mid = m_service.suggestions("quantity", 1, {"quantity"});
    QCOMPARE(mid.size(), 1);
    QCOMPARE(mid[0].label, QString("quantity"));
}

void TestExpressionService::testVariableSuggestions() {
    const QVector<Suggestion> s =
        m_service.suggestions("1 + $us", 7, {"$user", "user", "$tenant"});
    QCOMPARE(s.size(), 1);
    QCOMPARE(s[0].label, QString("$user"));
    QCOMPARE(s[0].kind, Suggestion::Variable);

    // Empty partial offers everything
    const QVector<Suggestion> all = m_service.suggestions("1 + ", 4, {"user"});
    QCOMPARE(all.size(), m_service.functionCount() + 1);
}

void TestExpressionService::testConcurrentEvaluation() {
    const ParseResult shared = m_service.parse("SUM(values) * factor + LEN(label)");
    QVERIFY(shared.success);

    QAtomicInt failures(0);
    std::vector<std::unique_ptr<QThread>> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back(QThread::create([this, t, &shared, &failures] {
            for (int i = 0; i < 200; ++i) {
                EvaluationContext ctx;
                ctx.fields["values"] = QVariantList{1, 2, i};
                ctx.fields["factor"] = t;
                ctx.fields["label"] = QString(t, QLatin1Char('x'));

                const double expected = (3 + i) * t + t;
                const EvaluationResult a = m_service.evaluate(shared.ast, ctx);
                const EvaluationResult b =
                    m_service.evaluate("SUM(values) * factor + LEN(label)", ctx);
                if (!a.success || !b.success ||
                    a.value.toDouble() != expected ||
                    b.value.toDouble() != expected)
                    failures.fetchAndAddRelaxed(1);
            }
        }));
    }
    for (auto &thread : threads)
        thread->start();
    for (auto &thread : threads)
        QVERIFY(thread->wait(30000));

    QCOMPARE(failures.loadRelaxed(), 0);
}

QTEST_MAIN(TestExpressionService)
#include "test_expression_service.moc"
