#include <QtTest>
#include "formula/CalculatedFields.h"
#include "formula/ExpressionService.h"

using namespace Formula;

class TestCalculatedFields : public QObject {
    Q_OBJECT

private slots:
    // Graph
    void testDependencyOrder();
    void testDependenciesAndEdges();
    void testCycleMembersExcluded();
    void testSelfReference();
    void testDuplicateIdLaterWins();

    // Recalculation
    void testRecalculateInOrder();
    void testCycleValuesUntouched();
    void testFallbackOnFailure();
    void testFailureWithoutFallbackKeepsValue();
    void testLookupAgainstDataset();

private:
    static CalculatedFieldConfig field(const QString &id, const QString &formula,
                                       const QVariant &fallback = QVariant());
    static QVector<CalculatedFieldConfig> invoiceFields();

    ExpressionService m_service;
};

CalculatedFieldConfig TestCalculatedFields::field(const QString &id,
                                                  const QString &formula,
                                                  const QVariant &fallback) {
    CalculatedFieldConfig config;
    config.id = id;
    config.formula = formula;
    config.fallbackValue = fallback;
    return config;
}

// Declared out of order on purpose
QVector<CalculatedFieldConfig> TestCalculatedFields::invoiceFields() {
    return {field("total", "subtotal + tax"),
            field("tax", "subtotal * 0.2"),
            field("subtotal", "quantity * price")};
}

void TestCalculatedFields::testDependencyOrder() {
    const CalculationGraph graph = buildDependencyGraph(invoiceFields(), m_service);
    QCOMPARE(graph.order, QStringList({"subtotal", "tax", "total"}));
    QVERIFY(graph.cycles.isEmpty());
    QCOMPARE(graph.nodes.size(), 3);
}

void TestCalculatedFields::testDependenciesAndEdges() {
    const CalculationGraph graph = buildDependencyGraph(invoiceFields(), m_service);

    QCOMPARE(graph.nodes["total"].dependencies, QStringList({"subtotal", "tax"}));
    QCOMPARE(graph.nodes["subtotal"].dependencies, QStringList({"quantity", "price"}));

    QStringList readersOfSubtotal = graph.edges["subtotal"];
    readersOfSubtotal.sort();
    QCOMPARE(readersOfSubtotal, QStringList({"tax", "total"}));
    QCOMPARE(graph.edges["tax"], QStringList({"total"}));
    QVERIFY(graph.edges["total"].isEmpty());

    // Plain inputs are not graph nodes
    QVERIFY(!graph.edges.contains("quantity"));
}

void TestCalculatedFields::testCycleMembersExcluded() {
    const QVector<CalculatedFieldConfig> configs = {
        field("a", "b + 1"), field("b", "a + 1"),
        field("c", "x * 2"), field("d", "c + a")};

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Circular dependency between"));
    const CalculationGraph graph = buildDependencyGraph(configs, m_service);
    QCOMPARE(graph.cycles, QStringList({"a", "b"}));
    QCOMPARE(graph.order, QStringList({"c", "d"}));
}

void TestCalculatedFields::testSelfReference() {
    const QVector<CalculatedFieldConfig> configs = {
        field("counter", "counter + 1"), field("double", "counter * 2")};

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Circular dependency between"));
    const CalculationGraph graph = buildDependencyGraph(configs, m_service);
    QCOMPARE(graph.cycles, QStringList({"counter"}));
    QCOMPARE(graph.order, QStringList({"double"}));
}

void TestCalculatedFields::testDuplicateIdLaterWins() {
    const QVector<CalculatedFieldConfig> configs = {
        field("x", "1"), field("y", "x + 1"), field("x", "10")};

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Duplicate calculated field"));
    const CalculationGraph graph = buildDependencyGraph(configs, m_service);
    QCOMPARE(graph.nodes.size(), 2);
    QCOMPARE(graph.nodes["x"].formula, QString("10"));
    QCOMPARE(graph.order, QStringList({"x", "y"}));
}

void TestCalculatedFields::testRecalculateInOrder() {
    QVariantMap values;
    values["quantity"] = 2;
    values["price"] = 50;

    const QVariantMap results =
        recalculateAll(invoiceFields(), values, {}, m_service);
    QCOMPARE(results["subtotal"].toDouble(), 100.0);
    QCOMPARE(results["tax"].toDouble(), 20.0);
    QCOMPARE(results["total"].toDouble(), 120.0);

    // Inputs pass through untouched
    QCOMPARE(results["quantity"].toInt(), 2);
    QCOMPARE(results.size(), 5);
}

void TestCalculatedFields::testCycleValuesUntouched() {
    const QVector<CalculatedFieldConfig> configs = {
        field("a", "b + 1"), field("b", "a + 1"),
        field("c", "x * 2"), field("d", "c + a")};
    QVariantMap values;
    values["x"] = 3;
    values["a"] = 5;

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Circular dependency between"));
    const QVariantMap results = recalculateAll(configs, values, {}, m_service);
    QCOMPARE(results["c"].toDouble(), 6.0);
    QCOMPARE(results["d"].toDouble(), 11.0);
    QCOMPARE(results["a"].toInt(), 5);
    QVERIFY(!results.contains("b"));
}

void TestCalculatedFields::testFallbackOnFailure() {
    const QVector<CalculatedFieldConfig> configs = {
        field("ratio", "numerator / denominator", 0.0),
        field("percent", "ratio * 100")};
    QVariantMap values;
    values["numerator"] = 1;
    values["denominator"] = 0;

    const QVariantMap results = recalculateAll(configs, values, {}, m_service);
    QCOMPARE(results["ratio"].toDouble(), 0.0);
    // The fallback feeds later fields
    QCOMPARE(results["percent"].toDouble(), 0.0);
    QVERIFY(results["percent"].isValid());
}

void TestCalculatedFields::testFailureWithoutFallbackKeepsValue() {
    const QVector<CalculatedFieldConfig> configs = {
        field("label", "'a' - 1"), field("shout", "UPPER(label)")};
    QVariantMap values;
    values["label"] = "old";

    const QVariantMap results = recalculateAll(configs, values, {}, m_service);
    QCOMPARE(results["label"].toString(), QString("old"));
    QCOMPARE(results["shout"].toString(), QString("OLD"));
}

void TestCalculatedFields::testLookupAgainstDataset() {
    const QVector<CalculatedFieldConfig> configs = {
        field("converted", "amount * rate"),
        field("rate", "LOOKUP('rates', 'code', currency, 'rate')")};

    QHash<QString, DatasetRows> datasets;
    QVariantMap eur;
    eur["code"] = "EUR";
    eur["rate"] = 2;
    QVariantMap gbp;
    gbp["code"] = "GBP";
    gbp["rate"] = 3;
    datasets["rates"] = DatasetRows{eur, gbp};

    QVariantMap values;
    values["amount"] = 10;
    values["currency"] = "GBP";

    const CalculationGraph graph = buildDependencyGraph(configs, m_service);
    QCOMPARE(graph.order, QStringList({"rate", "converted"}));
    QCOMPARE(graph.nodes["rate"].dependencies, QStringList({"currency"}));

    const QVariantMap results = recalculateAll(configs, values, datasets, m_service);
    QCOMPARE(results["rate"].toDouble(), 3.0);
    QCOMPARE(results["converted"].toDouble(), 30.0);
}

QTEST_MAIN(TestCalculatedFields)
#include "test_calculated_fields.moc"
