#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "json_utils.h"

using namespace std;
using namespace rapidjson;

const char *json_ok =  "{" \
				"\"power_on_time\": { \"hours\": 12345 }, " \
				"\"model_name\": \"ST4000NM0035\", " \
				"\"smart_support\": { \"available\": true }, " \
				"\"ata_smart_attributes\": { \"table\": [ 1, 2 ] }, " \
				"\"temperature\": \"hot\", " \
				"\"rate\": 7200.5 " \
			"} ";

TEST(JsonGetters, Int64)
{
	Document doc;
	doc.Parse(json_ok);
	ASSERT_FALSE(doc.HasParseError());

	const Value *power = JSONGetObject(doc, "power_on_time");
	ASSERT_TRUE(power != NULL);
	long long hours = 0;
	ASSERT_TRUE(JSONHasInt64(*power, "hours", hours));
	ASSERT_EQ(hours, 12345);
	ASSERT_EQ(JSONGetInt64(*power, "minutes", -1), -1);
}

TEST(JsonGetters, WrongType)
{
	Document doc;
	doc.Parse(json_ok);

	long long value = 99;
	ASSERT_FALSE(JSONHasInt64(doc, "temperature", value));
	ASSERT_EQ(value, 99);
	ASSERT_EQ(JSONGetString(doc, "rate", "none"), "none");
	ASSERT_TRUE(JSONGetObject(doc, "model_name") == NULL);
	ASSERT_TRUE(JSONGetArray(doc, "power_on_time") == NULL);
}

TEST(JsonGetters, StringBoolArray)
{
	Document doc;
	doc.Parse(json_ok);

	ASSERT_EQ(JSONGetString(doc, "model_name"), "ST4000NM0035");
	ASSERT_EQ(JSONGetString(doc, "missing"), "");

	const Value *support = JSONGetObject(doc, "smart_support");
	ASSERT_TRUE(support != NULL);
	ASSERT_TRUE(JSONGetBool(*support, "available", false));
	ASSERT_FALSE(JSONGetBool(*support, "enabled", false));

	const Value *attrs = JSONGetObject(doc, "ata_smart_attributes");
	ASSERT_TRUE(attrs != NULL);
	const Value *table = JSONGetArray(*attrs, "table");
	ASSERT_TRUE(table != NULL);
	ASSERT_EQ(table->Size(), 2U);
}

TEST(JsonStringEscape, Quotes)
{
	ASSERT_EQ(R"(say \"hi\")", JSONescape(R"(say "hi")"));
}

TEST(JsonStringEscape, BackslashAndNewline)
{
	ASSERT_EQ(R"(a\\b\nc)", JSONescape("a\\b\nc"));
}
