// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "pg/Array.hxx"
#include "pg/ArrayScanner.hxx"

#include <gtest/gtest.h>

#include <array>
#include <bit>
#include <cmath>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <stdio.h>
#include <string.h>

static void
check_decode(const char *input, const char *const* expected)
{
	const auto a = Pg::DecodeArray(input);

	unsigned i = 0;
	for (const auto &v : a) {
		if (expected[i] == NULL) {
			fprintf(stderr, "decode '%s': too many elements in result ('%s')\n",
				input, v.c_str());
			FAIL();
		}

		if (strcmp(v.c_str(), expected[i]) != 0) {
			fprintf(stderr, "decode '%s': element %u differs: '%s', but '%s' expected\n",
				input, i, v.c_str(), expected[i]);
			FAIL();
		}

		++i;
	}

	if (expected[i] != NULL) {
		fprintf(stderr, "decode '%s': not enough elements in result ('%s')\n",
			input, expected[i]);
		FAIL();
	}
}

TEST(PgTest, DecodeArray)
{
	const char *zero[] = {NULL};
	const char *empty[] = {"", NULL};
	const char *one[] = {"foo", NULL};
	const char *two[] = {"foo", "bar", NULL};
	const char *null[] = {"foo", "", "bar", NULL};
	const char *special[] = {"foo", "\"\\", NULL};
	const char *spaces[] = {"foo bar", "baz", NULL};

	check_decode(nullptr, zero);
	check_decode("", zero);
	check_decode("{}", zero);
	check_decode("{\"\"}", empty);
	check_decode("{foo}", one);
	check_decode("{\"foo\"}", one);
	check_decode("{foo,bar}", two);
	check_decode("{foo,\"bar\"}", two);
	check_decode("{foo,NULL,bar}", null);
	check_decode("{foo,\"\\\"\\\\\"}", special);
	check_decode("{ foo bar , baz }", spaces);
}

TEST(PgTest, DecodeArrayMalformed)
{
	EXPECT_THROW(Pg::DecodeArray("{foo,,bar}"), std::invalid_argument);
	EXPECT_THROW(Pg::DecodeArray("{foo"), std::invalid_argument);
	EXPECT_THROW(Pg::DecodeArray("{\"foo}"), std::invalid_argument);
	EXPECT_THROW(Pg::DecodeArray("{foo}}"), std::invalid_argument);
	EXPECT_THROW(Pg::DecodeArray("foo"), std::invalid_argument);
}

TEST(PgTest, DecodeIntArray)
{
	std::vector<int> v;
	Pg::DecodeArray("{1,2,3}", v);
	EXPECT_EQ(v, (std::vector<int>{1, 2, 3}));

	Pg::DecodeArray(" { -4 , 5 } ", v);
	EXPECT_EQ(v, (std::vector<int>{-4, 5}));

	v = {9, 9, 9, 9, 9};
	Pg::DecodeArray("{1,2}", v);
	EXPECT_EQ(v, (std::vector<int>{1, 2}));

	Pg::DecodeArray("{}", v);
	EXPECT_TRUE(v.empty());
}

TEST(PgTest, DecodeGrowable)
{
	std::vector<unsigned> v;
	Pg::DecodeArray("{1,2,3,4,5,6,7,8,9,10}", v);
	ASSERT_EQ(v.size(), 10u);
	for (unsigned i = 0; i < v.size(); ++i)
		EXPECT_EQ(v[i], i + 1);
}

TEST(PgTest, DecodeNestedArray)
{
	std::vector<std::vector<int>> v;
	Pg::DecodeArray("{{1,2},{3},{}}", v);
	ASSERT_EQ(v.size(), 3u);
	EXPECT_EQ(v[0], (std::vector<int>{1, 2}));
	EXPECT_EQ(v[1], (std::vector<int>{3}));
	EXPECT_TRUE(v[2].empty());

	std::array<std::vector<int>, 2> a;
	Pg::DecodeArray("{{1},{2,3}}", a);
	EXPECT_EQ(a[0], (std::vector<int>{1}));
	EXPECT_EQ(a[1], (std::vector<int>{2, 3}));
}

TEST(PgTest, DecodeFixedArray)
{
	std::array<int, 2> a{5, 6};
	Pg::DecodeArray("{1,2,3}", a);
	EXPECT_EQ(a, (std::array<int, 2>{1, 2}));

	Pg::DecodeArray("{7}", a);
	EXPECT_EQ(a, (std::array<int, 2>{7, 0}));

	Pg::DecodeArray("{}", a);
	EXPECT_EQ(a, (std::array<int, 2>{0, 0}));

	/* excess nested arrays are skipped, too */
	std::array<std::vector<int>, 1> b;
	Pg::DecodeArray("{{1},{2,{3}},{4}}", b);
	EXPECT_EQ(b[0], (std::vector<int>{1}));

	int c[3] = {1, 1, 1};
	Pg::DecodeArray("{4,5}", c);
	EXPECT_EQ(c[0], 4);
	EXPECT_EQ(c[1], 5);
	EXPECT_EQ(c[2], 0);

	int d[2][2];
	Pg::DecodeArray("{{1,2},{3}}", d);
	EXPECT_EQ(d[0][0], 1);
	EXPECT_EQ(d[0][1], 2);
	EXPECT_EQ(d[1][0], 3);
	EXPECT_EQ(d[1][1], 0);
}

TEST(PgTest, DecodeCArrayPointer)
{
	int e[2] = {1, 1};
	Pg::DecodeArray("{8,9}", &e);
	EXPECT_EQ(e[0], 8);
	EXPECT_EQ(e[1], 9);

	int (*p)[2] = nullptr;
	EXPECT_THROW(Pg::DecodeArray("{1}", p), Pg::InvalidArrayDestination);
}

TEST(PgTest, DecodeStringArray)
{
	std::vector<std::string> v;
	Pg::DecodeArray(R"({"a,b","{}","x\"y","a\\b",t,f,"NULL"})", v);
	EXPECT_EQ(v, (std::vector<std::string>{
				"a,b", "{}", "x\"y", "a\\b", "t", "f", "NULL",
			}));

	Pg::DecodeArray(R"({"\u00e4"})", v);
	EXPECT_EQ(v, (std::vector<std::string>{"\xc3\xa4"}));
}

TEST(PgTest, DecodeBoolArray)
{
	std::vector<bool> v;
	Pg::DecodeArray("{t,f,t}", v);
	EXPECT_EQ(v, (std::vector<bool>{true, false, true}));

	EXPECT_THROW(Pg::DecodeArray("{true}", v), Pg::ArrayTypeError);
	EXPECT_THROW(Pg::DecodeArray("{\"t\"}", v), Pg::ArrayTypeError);
}

TEST(PgTest, DecodeFloatArray)
{
	std::vector<double> v;
	Pg::DecodeArray("{1.5,-2,3e2}", v);
	EXPECT_EQ(v, (std::vector<double>{1.5, -2, 300}));

	/* PostgreSQL's spelling of non-finite float values */
	Pg::DecodeArray("{Infinity,-Infinity,NaN}", v);
	ASSERT_EQ(v.size(), 3u);
	EXPECT_TRUE(std::isinf(v[0]));
	EXPECT_GT(v[0], 0);
	EXPECT_TRUE(std::isinf(v[1]));
	EXPECT_LT(v[1], 0);
	EXPECT_TRUE(std::isnan(v[2]));
}

TEST(PgTest, DecodeNullable)
{
	std::vector<std::optional<int>> v;
	Pg::DecodeArray("{1,NULL,3,null,Null}", v);
	ASSERT_EQ(v.size(), 5u);
	EXPECT_EQ(v[0], 1);
	EXPECT_FALSE(v[1]);
	EXPECT_EQ(v[2], 3);
	EXPECT_FALSE(v[3]);
	EXPECT_FALSE(v[4]);

	std::vector<std::unique_ptr<int>> p;
	Pg::DecodeArray("{NULL,5}", p);
	ASSERT_EQ(p.size(), 2u);
	EXPECT_EQ(p[0], nullptr);
	ASSERT_NE(p[1], nullptr);
	EXPECT_EQ(*p[1], 5);

	/* "NULLX" is not NULL */
	std::vector<std::optional<std::string>> s;
	Pg::DecodeArray("{NULLX,\"NULL\"}", s);
	ASSERT_EQ(s.size(), 2u);
	EXPECT_EQ(s[0], "NULLX");
	EXPECT_EQ(s[1], "NULL");

	std::optional<std::vector<int>> o;
	Pg::DecodeArray("{1}", o);
	ASSERT_TRUE(o);
	EXPECT_EQ(*o, (std::vector<int>{1}));

	Pg::DecodeArray("NULL", o);
	EXPECT_FALSE(o);
}

TEST(PgTest, DecodeNullIntoVector)
{
	std::vector<std::vector<int>> v{{1}, {2}};
	Pg::DecodeArray("{NULL,{3}}", v);
	ASSERT_EQ(v.size(), 2u);
	EXPECT_TRUE(v[0].empty());
	EXPECT_EQ(v[1], (std::vector<int>{3}));
}

TEST(PgTest, DecodeBinary)
{
	std::vector<std::vector<std::byte>> v;
	Pg::DecodeArray(R"({"aGVsbG8=",NULL})", v);
	ASSERT_EQ(v.size(), 2u);
	ASSERT_EQ(v[0].size(), 5u);
	EXPECT_EQ(memcmp(v[0].data(), "hello", 5), 0);
	EXPECT_TRUE(v[1].empty());

	EXPECT_THROW(Pg::DecodeArray(R"({"!!"})", v), Pg::ArrayTypeError);
	EXPECT_THROW(Pg::DecodeArray("{aGVsbG8=}", v), Pg::ArrayTypeError);
}

TEST(PgTest, DecodeScalar)
{
	int i = 0;
	Pg::DecodeArray("42", i);
	EXPECT_EQ(i, 42);

	Pg::DecodeArray("  7  ", i);
	EXPECT_EQ(i, 7);

	std::string s;
	Pg::DecodeArray("\"hello\"", s);
	EXPECT_EQ(s, "hello");

	try {
		Pg::DecodeArray("{1,2}", i);
		FAIL();
	} catch (const Pg::ArrayTypeError &e) {
		EXPECT_STREQ(e.what(), "cannot decode array into value of type int");
	}
}

TEST(PgTest, DecodeTypeError)
{
	std::vector<int> v;

	try {
		Pg::DecodeArray("{1,x,3,y}", v);
		FAIL();
	} catch (const Pg::ArrayTypeError &e) {
		/* the first error wins */
		EXPECT_STREQ(e.what(), "cannot decode x into value of type int");
	}

	/* the other elements were decoded nonetheless */
	EXPECT_EQ(v, (std::vector<int>{1, 0, 3, 0}));

	EXPECT_THROW(Pg::DecodeArray("{\"1\"}", v), Pg::ArrayTypeError);
	EXPECT_THROW(Pg::DecodeArray("{t}", v), Pg::ArrayTypeError);
	EXPECT_THROW(Pg::DecodeArray("{1.5}", v), Pg::ArrayTypeError);
	EXPECT_THROW(Pg::DecodeArray("{{1}}", v), Pg::ArrayTypeError);

	std::vector<std::int8_t> small;
	EXPECT_THROW(Pg::DecodeArray("{300}", small), Pg::ArrayTypeError);
	Pg::DecodeArray("{-128,127}", small);
	EXPECT_EQ(small, (std::vector<std::int8_t>{-128, 127}));

	std::vector<unsigned> u;
	EXPECT_THROW(Pg::DecodeArray("{-1}", u), Pg::ArrayTypeError);
}

TEST(PgTest, DecodeUnsupported)
{
	struct Foo {};

	std::vector<Foo> v;
	EXPECT_THROW(Pg::DecodeArray("{1}", v), Pg::ArrayTypeError);

	/* NULL is accepted by every type */
	Pg::DecodeArray("{NULL,NULL}", v);
	EXPECT_EQ(v.size(), 2u);
}

static Pg::ArraySyntaxError
DecodeSyntaxError(const char *input)
{
	std::vector<std::string> v;

	try {
		Pg::DecodeArray(input, v);
	} catch (const Pg::ArraySyntaxError &e) {
		return e;
	}

	ADD_FAILURE() << "no syntax error in '" << input << "'";
	return {"", 0};
}

TEST(PgTest, DecodeSyntaxError)
{
	EXPECT_EQ(DecodeSyntaxError("{a,,b}").GetOffset(), 3u);
	EXPECT_EQ(DecodeSyntaxError("{a,b").GetOffset(), 4u);
	EXPECT_EQ(DecodeSyntaxError("{\"a\"b}").GetOffset(), 4u);
	EXPECT_EQ(DecodeSyntaxError("").GetOffset(), 0u);
	EXPECT_EQ(DecodeSyntaxError("   ").GetOffset(), 3u);

	const auto e = DecodeSyntaxError("{a} x");
	EXPECT_EQ(e.GetOffset(), 4u);
	EXPECT_STREQ(e.what(), "invalid character 'x' after top-level value");

	EXPECT_EQ(DecodeSyntaxError("{a}}").GetOffset(), 3u);
	EXPECT_EQ(DecodeSyntaxError("\"a\"b").GetOffset(), 3u);

	const auto q = DecodeSyntaxError(R"({"\u12"})");
	EXPECT_EQ(q.GetOffset(), 1u);
	EXPECT_STREQ(q.what(), "malformed quoted literal");
}

TEST(PgTest, DecodeSyntaxErrorPrecedence)
{
	/* a syntax error wins over a type error found earlier */
	std::vector<int> v;
	EXPECT_THROW(Pg::DecodeArray("{x,}", v), Pg::ArraySyntaxError);
}

TEST(PgTest, DecodeSkippedMalformed)
{
	/* elements beyond the fixed length are discarded, but
	   must still be well-formed */
	std::array<int, 1> a;
	EXPECT_THROW(Pg::DecodeArray(R"({1,"\uZZZZ"})", a),
		     Pg::ArraySyntaxError);
	EXPECT_THROW(Pg::DecodeArray(R"({1,{"\u12"}})", a),
		     Pg::ArraySyntaxError);

	/* the same for arrays skipped after a type error */
	int i;
	EXPECT_THROW(Pg::DecodeArray(R"({"\uZZZZ"})", i),
		     Pg::ArraySyntaxError);

	Pg::DecodeArray(R"({1,"A"})", a);
	EXPECT_EQ(a[0], 1);
}

TEST(PgTest, DecodeNestingLimit)
{
	const std::size_t max = Pg::ArrayScanner::MAX_DEPTH;

	/* the maximum depth is accepted; the innermost arrays do not
	   fit into a string */
	std::vector<std::string> v;
	EXPECT_THROW(Pg::DecodeArray(std::string(max, '{') + std::string(max, '}'), v),
		     Pg::ArrayTypeError);

	const auto e = DecodeSyntaxError((std::string(max + 1, '{') +
					  std::string(max + 1, '}')).c_str());
	EXPECT_EQ(e.GetOffset(), max);
	EXPECT_STREQ(e.what(), "exceeded maximum nesting depth");
}

TEST(PgTest, DecodeTrailingSpace)
{
	std::vector<int> v;
	Pg::DecodeArray("{1}   ", v);
	EXPECT_EQ(v, (std::vector<int>{1}));
}

TEST(PgTest, DecodeNullDestination)
{
	std::vector<int> *p = nullptr;
	EXPECT_THROW(Pg::DecodeArray("{1}", p), Pg::InvalidArrayDestination);

	std::vector<int> v;
	Pg::DecodeArray("{1}", &v);
	EXPECT_EQ(v, (std::vector<int>{1}));
}

TEST(PgTest, DecodeEscapedStructure)
{
	std::vector<std::string> v;

	Pg::DecodeArray(R"({"hello\\world"})", v);
	EXPECT_EQ(v, (std::vector<std::string>{"hello\\world"}));

	Pg::DecodeArray(R"({"hello\{world"})", v);
	EXPECT_EQ(v, (std::vector<std::string>{"hello{world"}));

	Pg::DecodeArray(R"({"hello\}world"})", v);
	EXPECT_EQ(v, (std::vector<std::string>{"hello}world"}));

	Pg::DecodeArray(R"({hello,"there world"})", v);
	EXPECT_EQ(v, (std::vector<std::string>{"hello", "there world"}));

	Pg::DecodeArray(R"({"null", NULL})", v);
	EXPECT_EQ(v, (std::vector<std::string>{"null", ""}));
}

TEST(PgTest, DecodeNullIntoBool)
{
	std::vector<bool> v;
	Pg::DecodeArray("{t, NULL}", v);
	EXPECT_EQ(v, (std::vector<bool>{true, false}));
}

TEST(PgTest, DecodeRecord)
{
	struct Record {
		int a;
	};

	Record r{};
	EXPECT_THROW(Pg::DecodeArray("{1}", r), Pg::ArrayTypeError);
	EXPECT_THROW(Pg::DecodeArray("{1}", &r), Pg::ArrayTypeError);
}

TEST(PgTest, DecodePresized)
{
	std::vector<int> v;
	v.reserve(10);
	Pg::DecodeArray("{1}", v);
	EXPECT_EQ(v, (std::vector<int>{1}));

	std::array<int, 10> a;
	a.fill(-1);
	Pg::DecodeArray("{1}", a);
	EXPECT_EQ(a[0], 1);
	for (std::size_t i = 1; i < a.size(); ++i)
		EXPECT_EQ(a[i], 0);
}

/**
 * An allocator which counts the allocations of a container.
 */
template<typename T>
struct CountingAllocator {
	using value_type = T;

	std::size_t *n_allocations;

	explicit CountingAllocator(std::size_t &_n_allocations) noexcept
		:n_allocations(&_n_allocations) {}

	template<typename U>
	CountingAllocator(const CountingAllocator<U> &src) noexcept
		:n_allocations(src.n_allocations) {}

	T *allocate(std::size_t n) {
		++*n_allocations;
		return std::allocator<T>{}.allocate(n);
	}

	void deallocate(T *p, std::size_t n) noexcept {
		std::allocator<T>{}.deallocate(p, n);
	}

	bool operator==(const CountingAllocator &) const noexcept = default;
};

TEST(PgTest, DecodeGrowth)
{
	constexpr std::size_t n = 100000;

	std::string input = "{";
	for (std::size_t i = 0; i < n; ++i) {
		if (i > 0)
			input.push_back(',');
		input += std::to_string(i);
	}
	input.push_back('}');

	std::size_t n_allocations = 0;
	const CountingAllocator<unsigned> allocator(n_allocations);
	std::vector<unsigned, CountingAllocator<unsigned>> v(allocator);

	Pg::DecodeArray(input, v);
	ASSERT_EQ(v.size(), n);
	EXPECT_EQ(v.front(), 0u);
	EXPECT_EQ(v.back(), n - 1);

	/* the capacity grows geometrically */
	EXPECT_GT(n_allocations, 0u);
	EXPECT_LE(n_allocations, static_cast<std::size_t>(2 * std::bit_width(n)));
}
