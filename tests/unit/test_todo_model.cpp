#include <gtest/gtest.h>

#include <QJsonObject>

#include "IdUtils.hpp"
#include "Todo.hpp"
#include "TodoPatch.hpp"

TEST(TodoTest, FromTitleStartsOpenWithFreshId) {
    const Todo todo = Todo::fromTitle("Learn Qt");

    EXPECT_EQ(todo.title, "Learn Qt");
    EXPECT_FALSE(todo.completed);
    EXPECT_FALSE(todo.id.isNull());
    EXPECT_EQ(todo.id.toString(QUuid::WithoutBraces).size(), 36);
}

TEST(TodoTest, FromTitleGeneratesDistinctIds) {
    EXPECT_NE(Todo::fromTitle("a").id, Todo::fromTitle("a").id);
}

TEST(TodoTest, ToJsonUsesCanonicalId) {
    const Todo todo = Todo::fromTitle("write docs");
    const QJsonObject json = todo.toJson();

    EXPECT_EQ(json.size(), 3);
    EXPECT_EQ(json.value("id").toString(), todo.id.toString(QUuid::WithoutBraces));
    EXPECT_EQ(json.value("title").toString(), "write docs");
    EXPECT_TRUE(json.value("completed").isBool());
    EXPECT_FALSE(json.value("completed").toBool());
}

TEST(TodoPatchTest, EmptyObjectChangesNothing) {
    const auto patch = parseTodoPatch(QJsonObject{});
    ASSERT_TRUE(patch.has_value());
    EXPECT_TRUE(patch->isEmpty());

    Todo todo = Todo::fromTitle("keep");
    const Todo before = todo;
    patch->applyTo(todo);
    EXPECT_EQ(todo, before);
}

TEST(TodoPatchTest, FalseIsDistinctFromAbsent) {
    const auto patch = parseTodoPatch(QJsonObject{{"completed", false}});
    ASSERT_TRUE(patch.has_value());
    ASSERT_TRUE(patch->completed.has_value());
    EXPECT_FALSE(*patch->completed);
    EXPECT_FALSE(patch->title.has_value());

    Todo todo = Todo::fromTitle("t");
    todo.completed = true;
    patch->applyTo(todo);
    EXPECT_FALSE(todo.completed);
    EXPECT_EQ(todo.title, "t");
}

TEST(TodoPatchTest, EmptyTitleIsAPresentValue) {
    const auto patch = parseTodoPatch(QJsonObject{{"title", ""}});
    ASSERT_TRUE(patch.has_value());
    ASSERT_TRUE(patch->title.has_value());
    EXPECT_TRUE(patch->title->isEmpty());
}

TEST(TodoPatchTest, NullCountsAsAbsent) {
    const auto patch = parseTodoPatch(
        QJsonObject{{"title", QJsonValue::Null}, {"completed", QJsonValue::Null}});
    ASSERT_TRUE(patch.has_value());
    EXPECT_TRUE(patch->isEmpty());
}

TEST(TodoPatchTest, UnknownKeysAreIgnored) {
    const auto patch =
        parseTodoPatch(QJsonObject{{"priority", 3}, {"completed", true}});
    ASSERT_TRUE(patch.has_value());
    EXPECT_TRUE(patch->completed.value_or(false));
}

TEST(TodoPatchTest, RejectsWrongTypes) {
    QString error;

    EXPECT_FALSE(parseTodoPatch(QJsonObject{{"title", 42}}, &error).has_value());
    EXPECT_TRUE(error.contains("title"));

    EXPECT_FALSE(
        parseTodoPatch(QJsonObject{{"completed", "yes"}}, &error).has_value());
    EXPECT_TRUE(error.contains("completed"));
}

TEST(IdUtilsTest, AcceptsCanonicalForm) {
    const QUuid id = QUuid::createUuid();
    const auto parsed = parseTodoId(id.toString(QUuid::WithoutBraces));

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, id);
}

TEST(IdUtilsTest, AcceptsUpperCaseHex) {
    const QUuid id = QUuid::createUuid();
    const auto parsed = parseTodoId(id.toString(QUuid::WithoutBraces).toUpper());

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, id);
}

TEST(IdUtilsTest, AcceptsNilUuid) {
    const auto parsed = parseTodoId("00000000-0000-0000-0000-000000000000");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->isNull());
}

TEST(IdUtilsTest, RejectsOtherFormats) {
    const QString canonical = QUuid::createUuid().toString(QUuid::WithoutBraces);

    EXPECT_FALSE(parseTodoId("").has_value());
    EXPECT_FALSE(parseTodoId("42").has_value());
    EXPECT_FALSE(parseTodoId("{" + canonical + "}").has_value());
    EXPECT_FALSE(parseTodoId(QUuid::createUuid().toString(QUuid::Id128)).has_value());
    EXPECT_FALSE(parseTodoId(canonical + "0").has_value());
    EXPECT_FALSE(parseTodoId("zzzzzzzz-zzzz-zzzz-zzzz-zzzzzzzzzzzz").has_value());

    QString misplacedDash = canonical;
    misplacedDash[8] = QLatin1Char('0');
    misplacedDash[9] = QLatin1Char('-');
    EXPECT_FALSE(parseTodoId(misplacedDash).has_value());
}
