#include "TestSupport.h"

#include "core/ValueCoercion.h"

using ValueCoercion::Interpretation;

namespace {
const QString kNbsp(QChar(0x00A0));
}

TEST(ValueCoercion, PrecedenceExamples) {
    EXPECT_EQ(ValueCoercion::coerce("\"5\""), JsonValue("5"));
    EXPECT_EQ(ValueCoercion::coerce("5"), JsonValue(5));
    EXPECT_EQ(ValueCoercion::coerce("true"), JsonValue(true));
    EXPECT_EQ(ValueCoercion::coerce("banana"), JsonValue("banana"));
    EXPECT_EQ(ValueCoercion::coerce("{\"a\":1}"), JsonValue(JsonObject{{"a", 1}}));
}

TEST(ValueCoercion, ValidJsonWinsFirst) {
    EXPECT_EQ(ValueCoercion::interpret("null").interpretation, Interpretation::Json);
    EXPECT_EQ(ValueCoercion::interpret("false").interpretation, Interpretation::Json);
    EXPECT_EQ(ValueCoercion::interpret("  [1, 2]\n").value, parseJson("[1,2]"));
    EXPECT_EQ(ValueCoercion::interpret(" 42 ").value, JsonValue(42));
    EXPECT_TRUE(ValueCoercion::coerce("5").isInteger());
}

TEST(ValueCoercion, QuotedStringAfterTrimming) {
    ValueCoercion::Result result = ValueCoercion::interpret(kNbsp + "\"x\"" + kNbsp);
    EXPECT_EQ(result.interpretation, Interpretation::QuotedString);
    EXPECT_EQ(result.value, JsonValue("x"));
}

TEST(ValueCoercion, LiteralsAfterTrimming) {
    ValueCoercion::Result null = ValueCoercion::interpret(kNbsp + "null");
    EXPECT_EQ(null.interpretation, Interpretation::Null);
    EXPECT_TRUE(null.value.isNull());

    ValueCoercion::Result flag = ValueCoercion::interpret("false" + kNbsp);
    EXPECT_EQ(flag.interpretation, Interpretation::Boolean);
    EXPECT_EQ(flag.value, JsonValue(false));
}

TEST(ValueCoercion, LooseNumbers) {
    EXPECT_EQ(ValueCoercion::coerce("+5"), JsonValue(5));
    EXPECT_EQ(ValueCoercion::coerce("007"), JsonValue(7));
    EXPECT_EQ(ValueCoercion::coerce(".5"), JsonValue(0.5));
    EXPECT_EQ(ValueCoercion::coerce("5."), JsonValue(5.0));
    EXPECT_EQ(ValueCoercion::coerce("0x1F"), JsonValue(31));
    EXPECT_EQ(ValueCoercion::coerce("0b101"), JsonValue(5));
    EXPECT_EQ(ValueCoercion::coerce("0o17"), JsonValue(15));
    EXPECT_EQ(ValueCoercion::interpret("+5").interpretation, Interpretation::Number);
}

TEST(ValueCoercion, NonFiniteNumbersStayText) {
    EXPECT_EQ(ValueCoercion::coerce("Infinity"), JsonValue("Infinity"));
    EXPECT_EQ(ValueCoercion::coerce("NaN"), JsonValue("NaN"));
    EXPECT_EQ(ValueCoercion::coerce("1e400"), JsonValue("1e400"));
}

TEST(ValueCoercion, UnderflowIsZero) {
    ValueCoercion::Result tiny = ValueCoercion::interpret("+1e-400");
    EXPECT_EQ(tiny.interpretation, Interpretation::Number);
    EXPECT_EQ(tiny.value, JsonValue(0.0));
    EXPECT_EQ(ValueCoercion::coerce("+.0001e-400"), JsonValue(0.0));
    EXPECT_EQ(ValueCoercion::coerce("-1e-400"), JsonValue(0.0));
    EXPECT_EQ(ValueCoercion::coerce("+1e400"), JsonValue("+1e400"));
}

TEST(ValueCoercion, BareTextIsTrimmedString) {
    ValueCoercion::Result result = ValueCoercion::interpret("  hello world \n");
    EXPECT_EQ(result.interpretation, Interpretation::BareString);
    EXPECT_EQ(result.value, JsonValue("hello world"));
    EXPECT_EQ(ValueCoercion::coerce("0x"), JsonValue("0x"));
    EXPECT_EQ(ValueCoercion::coerce("1,000"), JsonValue("1,000"));
}

TEST(ValueCoercion, EmptyTextIsEmptyString) {
    EXPECT_EQ(ValueCoercion::coerce(QString()), JsonValue(""));
    EXPECT_EQ(ValueCoercion::coerce("   "), JsonValue(""));
}

TEST(ValueCoercion, BrokenQuotedTextFallsThroughToString) {
    EXPECT_EQ(ValueCoercion::coerce("\"a\" \"b\""), JsonValue("\"a\" \"b\""));
    EXPECT_EQ(ValueCoercion::coerce("\""), JsonValue("\""));
    EXPECT_EQ(ValueCoercion::coerce("\"unterminated"), JsonValue("\"unterminated"));
}

TEST(ValueCoercion, BrokenJsonIsKeptAsText) {
    EXPECT_EQ(ValueCoercion::coerce("{\"a\": 1,}"), JsonValue("{\"a\": 1,}"));
    EXPECT_EQ(ValueCoercion::coerce("[1, 2"), JsonValue("[1, 2"));
}

TEST(ValueCoercion, InterpretationNames) {
    EXPECT_EQ(ValueCoercion::interpretationName(Interpretation::Json), QStringLiteral("json"));
    EXPECT_EQ(ValueCoercion::interpretationName(Interpretation::BareString),
              QStringLiteral("bare-string"));
}
