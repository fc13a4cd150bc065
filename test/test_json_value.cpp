#include "TestSupport.h"

#include "core/JsonValue.h"

TEST(JsonValue, DefaultIsNull) {
    JsonValue value;
    EXPECT_TRUE(value.isNull());
    EXPECT_EQ(value.type(), JsonValue::Type::Null);
    EXPECT_EQ(value, JsonValue(nullptr));
}

TEST(JsonValue, ScalarAccessors) {
    EXPECT_TRUE(JsonValue(true).toBool());
    EXPECT_TRUE(JsonValue(7).isInteger());
    EXPECT_EQ(JsonValue(7).toInteger(), 7);
    EXPECT_FALSE(JsonValue(1.5).isInteger());
    EXPECT_DOUBLE_EQ(JsonValue(1.5).toDouble(), 1.5);
    EXPECT_EQ(JsonValue("text").toString(), QStringLiteral("text"));
    EXPECT_EQ(JsonValue(QStringLiteral("text")), JsonValue("text"));
}

TEST(JsonValue, AccessorsFallBackOnWrongType) {
    JsonValue text("5");
    EXPECT_EQ(text.toInteger(-1), -1);
    EXPECT_FALSE(text.toBool());
    EXPECT_TRUE(text.toArray().isEmpty());
    EXPECT_TRUE(text.toObject().isEmpty());
    EXPECT_TRUE(JsonValue(5).toString().isEmpty());
}

TEST(JsonValue, NumbersCompareByValue) {
    EXPECT_EQ(JsonValue(5), JsonValue(5.0));
    EXPECT_NE(JsonValue(5), JsonValue(5.5));
    EXPECT_NE(JsonValue(5), JsonValue("5"));
    EXPECT_NE(JsonValue(0), JsonValue(false));
}

TEST(JsonValue, TypeNames) {
    EXPECT_EQ(JsonValue::typeName(JsonValue::Type::Null), QStringLiteral("null"));
    EXPECT_EQ(JsonValue::typeName(JsonValue::Type::Bool), QStringLiteral("boolean"));
    EXPECT_EQ(JsonValue::typeName(JsonValue::Type::Number), QStringLiteral("number"));
    EXPECT_EQ(JsonValue::typeName(JsonValue::Type::String), QStringLiteral("string"));
    EXPECT_EQ(JsonValue::typeName(JsonValue::Type::Array), QStringLiteral("array"));
    EXPECT_EQ(JsonValue::typeName(JsonValue::Type::Object), QStringLiteral("object"));
}

TEST(JsonValue, CopiesShareContainers) {
    JsonValue array(JsonArray{1, 2, 3});
    JsonValue copy = array;
    EXPECT_TRUE(copy.sharesDataWith(array));

    JsonValue rebuilt(JsonArray{1, 2, 3});
    EXPECT_EQ(rebuilt, array);
    EXPECT_FALSE(rebuilt.sharesDataWith(array));
}

TEST(JsonValue, ArrayBuiltFromVectorDoesNotTrackLaterChanges) {
    JsonArray elements{1, 2};
    JsonValue value(elements);
    elements.append(3);
    EXPECT_EQ(value.toArray().size(), 2);
}

TEST(JsonObject, InsertKeepsFirstPosition) {
    JsonObject object;
    object.insert("b", 1);
    object.insert("a", 2);
    object.insert("b", 3);
    EXPECT_EQ(object.keys(), QStringList({"b", "a"}));
    EXPECT_EQ(object.value("b"), JsonValue(3));
    EXPECT_EQ(object.size(), 2);
}

TEST(JsonObject, LookupOfMissingKey) {
    JsonObject object{{"a", 1}};
    EXPECT_TRUE(object.contains("a"));
    EXPECT_FALSE(object.contains("z"));
    EXPECT_EQ(object.find("z"), nullptr);
    EXPECT_TRUE(object.value("z").isNull());
    EXPECT_EQ(object.indexOf("z"), -1);
}

TEST(JsonObject, EqualityIgnoresMemberOrder) {
    JsonObject first{{"a", 1}, {"b", "x"}};
    JsonObject second{{"b", "x"}, {"a", 1}};
    EXPECT_EQ(first, second);
    EXPECT_EQ(JsonValue(first), JsonValue(second));
    EXPECT_NE(first, (JsonObject{{"a", 1}}));
}
