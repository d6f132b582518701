#include <QtTest>
#include "formula/FormulaParser.h"
#include "formula/FormulaValidator.h"
#include "formula/FunctionRegistry.h"

using namespace Formula;

class TestFormulaValidator : public QObject {
    Q_OBJECT

private slots:
    // References
    void testFieldAndFunctionReferences();
    void testMemberRootIsReferenced();
    void testComputedIndexIsWalked();
    void testObjectKeysAreNotFields();
    void testKeywordsAreNotFields();
    void testDuplicatesReportedOnce();

    // Issues
    void testUnknownFunction();
    void testUnknownFieldWithPosition();
    void testDottedKnownNames();
    void testContextNamesAreKnown();
    void testNoFieldCheckWithoutKnownSet();
    void testSyntaxError();
    void testNotCallable();
    void testDoesNotEvaluate();
    void testAnalyzeParsedTree();

private:
    FormulaValidator m_validator{FunctionRegistry::builtins()};
};

void TestFormulaValidator::testFieldAndFunctionReferences() {
    ValidationResult r = m_validator.validate("ROUND(price * quantity, 2) + tax");
    QVERIFY(r.valid);
    QVERIFY(r.errors.isEmpty());
    QCOMPARE(r.referencedFields, QStringList({"price", "quantity", "tax"}));
    QCOMPARE(r.referencedFunctions, QStringList({"ROUND"}));
}

void TestFormulaValidator::testMemberRootIsReferenced() {
    ValidationResult r = m_validator.validate("order.customer.name & items.first.sku");
    QVERIFY(r.valid);
    QCOMPARE(r.referencedFields, QStringList({"order", "items"}));
}

void TestFormulaValidator::testComputedIndexIsWalked() {
    ValidationResult r = m_validator.validate("rows[index].amount");
    QCOMPARE(r.referencedFields, QStringList({"rows", "index"}));
}

void TestFormulaValidator::testObjectKeysAreNotFields() {
    ValidationResult r = m_validator.validate("{total: amount, 'label': 'x'}");
    QVERIFY(r.valid);
    QCOMPARE(r.referencedFields, QStringList({"amount"}));
}

void TestFormulaValidator::testKeywordsAreNotFields() {
    ValidationResult r = m_validator.validate("IF(flag == true, null, FALSE)");
    QCOMPARE(r.referencedFields, QStringList({"flag"}));
    QCOMPARE(r.referencedFunctions, QStringList({"IF"}));
}

void TestFormulaValidator::testDuplicatesReportedOnce() {
    ValidationResult r = m_validator.validate("sum(a) + SUM(a, b) + Sum(b)");
    QVERIFY(r.valid);
    QCOMPARE(r.referencedFields, QStringList({"a", "b"}));
    QCOMPARE(r.referencedFunctions, QStringList({"SUM"}));
}

void TestFormulaValidator::testUnknownFunction() {
    ValidationResult r = m_validator.validate("1 + frobnicate(x)");
    QVERIFY(!r.valid);
    QCOMPARE(r.errors.size(), 1);
    QCOMPARE(r.errors[0].type, QString("unknown_function"));
    QCOMPARE(r.errors[0].message, QString("Unknown function 'FROBNICATE'"));
    QCOMPARE(r.errors[0].position, 4);
    QCOMPARE(r.referencedFunctions, QStringList({"FROBNICATE"}));

    r = m_validator.validate("UNKNOWNFUNC(1)");
    QVERIFY(!r.valid);
    QCOMPARE(r.errors[0].type, QString("unknown_function"));
    QVERIFY(r.errors[0].message.contains("UNKNOWNFUNC"));
    QCOMPARE(r.errors[0].position, 0);
}

void TestFormulaValidator::testUnknownFieldWithPosition() {
    const QSet<QString> known = {"price", "quantity"};
    ValidationResult r = m_validator.validate("price * qty", known);
    QVERIFY(!r.valid);
    QCOMPARE(r.errors.size(), 1);
    QCOMPARE(r.errors[0].type, QString("unknown_field"));
    QCOMPARE(r.errors[0].message, QString("Unknown field 'qty'"));
    QCOMPARE(r.errors[0].position, 8);

    QVERIFY(m_validator.validate("price * quantity", known).valid);
}

void TestFormulaValidator::testDottedKnownNames() {
    const QSet<QString> known = {"order.total", "order.discount"};
    QVERIFY(m_validator.validate("order.total - order.discount", known).valid);

    // A prefix match needs the dot separator
    ValidationResult r = m_validator.validate("ord", known);
    QVERIFY(!r.valid);
    QCOMPARE(r.errors[0].type, QString("unknown_field"));
}

void TestFormulaValidator::testContextNamesAreKnown() {
    const QSet<QString> known = {"total"};
    ValidationResult r =
        m_validator.validate("IF(user.name == '', $rate * total, DATEDIFF(today, Now))", known);
    QVERIFY2(r.valid, r.errors.isEmpty() ? "" : qPrintable(r.errors[0].message));
    QCOMPARE(r.referencedFields, QStringList({"user", "$rate", "total", "today", "Now"}));

    r = m_validator.validate("users + 1", known);
    QVERIFY(!r.valid);
    QCOMPARE(r.errors[0].type, QString("unknown_field"));
}

void TestFormulaValidator::testNoFieldCheckWithoutKnownSet() {
    ValidationResult r = m_validator.validate("anything + whatever");
    QVERIFY(r.valid);
    QCOMPARE(r.referencedFields.size(), 2);
}

void TestFormulaValidator::testSyntaxError() {
    ValidationResult r = m_validator.validate("SUM(1, ");
    QVERIFY(!r.valid);
    QCOMPARE(r.errors.size(), 1);
    QCOMPARE(r.errors[0].type, QString("syntax"));
    QCOMPARE(r.errors[0].position, 7);
    QVERIFY(r.referencedFields.isEmpty());
    QVERIFY(r.referencedFunctions.isEmpty());

    r = m_validator.validate("1 + + 2");
    QVERIFY(!r.valid);
    QCOMPARE(r.errors.size(), 1);
    QCOMPARE(r.errors[0].type, QString("syntax"));
    QCOMPARE(r.errors[0].position, 4);

    r = m_validator.validate("");
    QVERIFY(!r.valid);
    QCOMPARE(r.errors[0].message, QString("Empty expression"));
}

void TestFormulaValidator::testNotCallable() {
    ValidationResult r = m_validator.validate("items.first(x)");
    QVERIFY(!r.valid);
    QCOMPARE(r.errors.size(), 1);
    QCOMPARE(r.errors[0].type, QString("unknown_function"));
    QCOMPARE(r.errors[0].message, QString("Expression is not callable"));
    QCOMPARE(r.errors[0].position, 0);
    QCOMPARE(r.referencedFields, QStringList({"items", "x"}));
}

void TestFormulaValidator::testDoesNotEvaluate() {
    // Runtime failures are not validation failures
    QVERIFY(m_validator.validate("1 / 0").valid);
    QVERIFY(m_validator.validate("'a' - 1").valid);
    QVERIFY(m_validator.validate("ROUND()").valid);
}

void TestFormulaValidator::testAnalyzeParsedTree() {
    ParseResult parsed = FormulaParser().parse("LOOKUP('rates', 'code', currency, 'rate') * amount");
    QVERIFY(parsed.success);

    const QSet<QString> known = {"currency"};
    ValidationResult r = m_validator.analyze(parsed.ast, &known);
    QVERIFY(!r.valid);
    QCOMPARE(r.referencedFunctions, QStringList({"LOOKUP"}));
    QCOMPARE(r.referencedFields, QStringList({"currency", "amount"}));
    QCOMPARE(r.errors.size(), 1);
    QCOMPARE(r.errors[0].message, QString("Unknown field 'amount'"));
}

QTEST_MAIN(TestFormulaValidator)
#include "test_formula_validator.moc"
