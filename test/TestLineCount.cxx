/*
 * Unit tests for src/LineCount.cxx
 */

#include "LineCount.hxx"
#include "io/MemoryReader.hxx"
#include "util/Exception.hxx"
#include "TemporaryDirectory.hxx"

#include <gtest/gtest.h>

#include <string>
#include <system_error>
#include <vector>

using std::string_view_literals::operator""sv;

TEST(LineCount, Memory)
{
	MemoryReader empty{""sv};
	EXPECT_EQ(CountLines(empty), 0U);

	MemoryReader one{"foo"sv};
	EXPECT_EQ(CountLines(one), 1U);

	MemoryReader three{"foo\nbar\n\n"sv};
	EXPECT_EQ(CountLines(three), 3U);
}

class LineCountFiles : public ::testing::Test {
protected:
	TemporaryDirectory dir;

	std::vector<std::string> paths;

	std::vector<const char *> GetPaths() const {
		std::vector<const char *> result;
		for (const auto &i : paths)
			result.push_back(i.c_str());
		return result;
	}
};

TEST_F(LineCountFiles, TerminatedLines)
{
	paths.push_back(dir.CreateFile("a", "1\n2\n"));
	paths.push_back(dir.CreateFile("b", ""));
	paths.push_back(dir.CreateFile("c", "3\n4\n5\n"));

	const auto p = GetPaths();
	EXPECT_EQ(CountLinesChained(p), 5U);
	EXPECT_EQ(CountLinesSeparately(p), 5U);
}

TEST_F(LineCountFiles, UnterminatedLastLine)
{
	paths.push_back(dir.CreateFile("a", "1\n2"));
	paths.push_back(dir.CreateFile("b", "3\n"));

	const auto p = GetPaths();

	/* "2" and "3" are one line in the concatenated stream */
	EXPECT_EQ(CountLinesChained(p), 2U);
	EXPECT_EQ(CountLinesSeparately(p), 3U);
}

TEST_F(LineCountFiles, MissingFile)
{
	paths.push_back(dir.CreateFile("a", "1\n"));
	paths.push_back((dir.GetPath() / "missing").string());

	const auto p = GetPaths();
	EXPECT_THROW(CountLinesChained(p), std::system_error);
	EXPECT_THROW(CountLinesSeparately(p), std::system_error);
}

TEST_F(LineCountFiles, ReadError)
{
	paths.push_back(dir.CreateFile("a", "1\n"));
	paths.push_back(dir.GetPath().string());

	const auto p = GetPaths();

	try {
		CountLinesChained(p);
		FAIL() << "exception expected";
	} catch (...) {
		const auto msg = GetFullMessage(std::current_exception());
		EXPECT_EQ(msg.rfind("Failed to read \"" + paths[1] + "\"; ", 0), 0U)
			<< msg;
	}
}
