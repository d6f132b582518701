#include <QtTest>
#include "formula/FormulaTokenizer.h"

using namespace Formula;

class TestFormulaTokenizer : public QObject {
    Q_OBJECT

private slots:
    // Token kinds
    void testSimpleExpression();
    void testIdentifierCharacters();
    void testNumberForms();
    void testOperatorsGreedy();
    void testStrictEqualitySpellings();
    void testPunctuation();

    // Strings
    void testStringEscapes();
    void testUnicodeString();

    // Positions
    void testPositionsLinesColumns();
    void testEmptyInput();

    // Errors
    void testUnterminatedString();
    void testNewlineInString();
    void testInvalidCharacter();
    void testExponentWithoutDigits();
};

static QVector<FormulaToken::Type> typesOf(const FormulaTokenList &tokens) {
    QVector<FormulaToken::Type> out;
    for (const FormulaToken &t : tokens)
        out.append(t.type);
    return out;
}

void TestFormulaTokenizer::testSimpleExpression() {
    bool ok = false;
    auto tokens = FormulaTokenizer::tokenize("price * 2", &ok);
    QVERIFY(ok);
    QCOMPARE(tokens.size(), 4);
    QCOMPARE(tokens[0].type, FormulaToken::Identifier);
    QCOMPARE(tokens[0].text, QString("price"));
    QCOMPARE(tokens[1].type, FormulaToken::Star);
    QCOMPARE(tokens[2].type, FormulaToken::Number);
    QCOMPARE(tokens[2].text, QString("2"));
    QCOMPARE(tokens[3].type, FormulaToken::End);
}

void TestFormulaTokenizer::testIdentifierCharacters() {
    bool ok = false;
    auto tokens = FormulaTokenizer::tokenize("$user _tmp a1 true", &ok);
    QVERIFY(ok);
    QCOMPARE(tokens.size(), 5);
    QCOMPARE(tokens[0].text, QString("$user"));
    QCOMPARE(tokens[1].text, QString("_tmp"));
    QCOMPARE(tokens[2].text, QString("a1"));
    // Keywords stay identifiers until parsing
    QCOMPARE(tokens[3].type, FormulaToken::Identifier);
    QCOMPARE(tokens[3].text, QString("true"));
}

void TestFormulaTokenizer::testNumberForms() {
    bool ok = false;
    auto tokens = FormulaTokenizer::tokenize("123 45.67 .5 1e10 2.5E-3", &ok);
    QVERIFY(ok);
    QCOMPARE(tokens.size(), 6);
    QStringList texts;
    for (int i = 0; i < 5; ++i) {
        QCOMPARE(tokens[i].type, FormulaToken::Number);
        texts << tokens[i].text;
    }
    QCOMPARE(texts, QStringList({"123", "45.67", ".5", "1e10", "2.5E-3"}));
}

void TestFormulaTokenizer::testOperatorsGreedy() {
    bool ok = false;
    auto tokens = FormulaTokenizer::tokenize("a**2<=b&&c||!d!=e>=f", &ok);
    QVERIFY(ok);
    QVector<FormulaToken::Type> expected = {
        FormulaToken::Identifier, FormulaToken::StarStar, FormulaToken::Number,
        FormulaToken::LessEqual, FormulaToken::Identifier, FormulaToken::AmpAmp,
        FormulaToken::Identifier, FormulaToken::PipePipe, FormulaToken::Bang,
        FormulaToken::Identifier, FormulaToken::BangEqual, FormulaToken::Identifier,
        FormulaToken::GreaterEqual, FormulaToken::Identifier, FormulaToken::End};
    QCOMPARE(typesOf(tokens), expected);
}

void TestFormulaTokenizer::testStrictEqualitySpellings() {
    bool ok = false;
    auto tokens = FormulaTokenizer::tokenize("a === b !== c == d", &ok);
    QVERIFY(ok);
    QCOMPARE(tokens[1].type, FormulaToken::EqualEqual);
    QCOMPARE(tokens[1].text, QString("==="));
    QCOMPARE(tokens[3].type, FormulaToken::BangEqual);
    QCOMPARE(tokens[3].text, QString("!=="));
    QCOMPARE(tokens[5].type, FormulaToken::EqualEqual);
    QCOMPARE(tokens[5].text, QString("=="));
}

void TestFormulaTokenizer::testPunctuation() {
    bool ok = false;
    auto tokens = FormulaTokenizer::tokenize("f([1], {a: 2}) ? x.y : z & w", &ok);
    QVERIFY(ok);
    QVector<FormulaToken::Type> expected = {
        FormulaToken::Identifier, FormulaToken::LParen, FormulaToken::LBracket,
        FormulaToken::Number, FormulaToken::RBracket, FormulaToken::Comma,
        FormulaToken::LBrace, FormulaToken::Identifier, FormulaToken::Colon,
        FormulaToken::Number, FormulaToken::RBrace, FormulaToken::RParen,
        FormulaToken::Question, FormulaToken::Identifier, FormulaToken::Dot,
        FormulaToken::Identifier, FormulaToken::Colon, FormulaToken::Identifier,
        FormulaToken::Amp, FormulaToken::Identifier, FormulaToken::End};
    QCOMPARE(typesOf(tokens), expected);
    QVERIFY(tokens[1].isPunctuation());
    QVERIFY(tokens[18].isOperator());
}

void TestFormulaTokenizer::testStringEscapes() {
    bool ok = false;
    auto tokens = FormulaTokenizer::tokenize(R"('it\'s' "say \"hi\"" 'a\nb\tc' 'back\\slash')", &ok);
    QVERIFY(ok);
    QCOMPARE(tokens.size(), 5);
    QCOMPARE(tokens[0].type, FormulaToken::String);
    QCOMPARE(tokens[0].text, QString("it's"));
    QCOMPARE(tokens[1].text, QString("say \"hi\""));
    QCOMPARE(tokens[2].text, QString("a\nb\tc"));
    QCOMPARE(tokens[3].text, QString("back\\slash"));
}

void TestFormulaTokenizer::testUnicodeString() {
    const QString text = QString::fromUtf8("héllo wörld 😀 日本語");
    bool ok = false;
    auto tokens = FormulaTokenizer::tokenize("'" + text + "'", &ok);
    QVERIFY(ok);
    QCOMPARE(tokens.size(), 2);
    QCOMPARE(tokens[0].text, text);
}

void TestFormulaTokenizer::testPositionsLinesColumns() {
    bool ok = false;
    auto tokens = FormulaTokenizer::tokenize("a +\n  bb", &ok);
    QVERIFY(ok);
    QCOMPARE(tokens[0].position, 0);
    QCOMPARE(tokens[1].position, 2);
    QCOMPARE(tokens[2].position, 6);
    QCOMPARE(tokens[2].line, 2);
    QCOMPARE(tokens[2].column, 3);
    QCOMPARE(tokens[3].type, FormulaToken::End);
    QCOMPARE(tokens[3].position, 8);
}

void TestFormulaTokenizer::testEmptyInput() {
    bool ok = false;
    auto tokens = FormulaTokenizer::tokenize("   ", &ok);
    QVERIFY(ok);
    QCOMPARE(tokens.size(), 1);
    QCOMPARE(tokens[0].type, FormulaToken::End);
}

void TestFormulaTokenizer::testUnterminatedString() {
    bool ok = true;
    LexError err;
    auto tokens = FormulaTokenizer::tokenize("x & 'abc", &ok, &err);
    QVERIFY(!ok);
    QVERIFY(tokens.isEmpty());
    QVERIFY(err.message.contains("Unterminated"));
    QCOMPARE(err.position, 4);
}

void TestFormulaTokenizer::testNewlineInString() {
    bool ok = true;
    LexError err;
    FormulaTokenizer::tokenize("'abc\ndef'", &ok, &err);
    QVERIFY(!ok);
    QVERIFY(err.message.contains("Unterminated"));
}

void TestFormulaTokenizer::testInvalidCharacter() {
    bool ok = true;
    LexError err;
    FormulaTokenizer::tokenize("a # b", &ok, &err);
    QVERIFY(!ok);
    QCOMPARE(err.position, 2);
    QCOMPARE(err.column, 3);
    QVERIFY(err.message.contains("#"));
}

void TestFormulaTokenizer::testExponentWithoutDigits() {
    bool ok = true;
    LexError err;
    FormulaTokenizer::tokenize("1e+", &ok, &err);
    QVERIFY(!ok);
    QVERIFY(err.message.contains("exponent"));
}

QTEST_MAIN(TestFormulaTokenizer)
#include "test_formula_tokenizer.moc"
