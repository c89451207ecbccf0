#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include "line_splitter.hpp"

static std::vector<std::string> DrainLines(LineSplitter &lines) {
	std::vector<std::string> out;
	std::string line;
	while (lines.NextLine(line))
		out.push_back(line);
	return out;
}

TEST_CASE("LineSplitter: complete lines are available before Finish", "[line_splitter]") {
	LineSplitter lines;
	std::string data = "<a> <b> <c> .\n<d> <e> <f> .\n";
	lines.Feed(data.data(), data.size());
	REQUIRE(DrainLines(lines) == std::vector<std::string> {"<a> <b> <c> .", "<d> <e> <f> ."});
	REQUIRE_FALSE(lines.Finished());
}

TEST_CASE("LineSplitter: a line spanning two reads is joined", "[line_splitter]") {
	LineSplitter lines;
	std::string long_line(5000, 'x');
	std::string data = long_line + "\nshort\n";
	lines.Feed(data.data(), 4096);
	REQUIRE(DrainLines(lines).empty());
	lines.Feed(data.data() + 4096, data.size() - 4096);
	REQUIRE(DrainLines(lines) == std::vector<std::string> {long_line, "short"});
}

TEST_CASE("LineSplitter: CRLF terminators are removed", "[line_splitter]") {
	LineSplitter lines;
	std::string data = "first\r\nsecond\r";
	lines.Feed(data.data(), 9);
	lines.Feed(data.data() + 9, data.size() - 9);
	lines.Finish();
	REQUIRE(DrainLines(lines) == std::vector<std::string> {"first", "second"});
}

TEST_CASE("LineSplitter: final line without newline needs Finish", "[line_splitter]") {
	LineSplitter lines;
	std::string data = "one\ntwo";
	lines.Feed(data.data(), data.size());
	REQUIRE(DrainLines(lines) == std::vector<std::string> {"one"});
	lines.Finish();
	REQUIRE(DrainLines(lines) == std::vector<std::string> {"two"});
	REQUIRE(DrainLines(lines).empty());
}

TEST_CASE("LineSplitter: empty lines are kept, empty input gives nothing", "[line_splitter]") {
	LineSplitter lines;
	std::string data = "\n\nx\n";
	lines.Feed(data.data(), data.size());
	lines.Finish();
	REQUIRE(DrainLines(lines) == std::vector<std::string> {"", "", "x"});

	LineSplitter empty;
	empty.Finish();
	REQUIRE(DrainLines(empty).empty());
}
