#include <catch2/catch.hpp>

#include <string>

#include "freebase_literal.hpp"

TEST_CASE("GetLiteralKind: URI, STRING, TEXT and OTHER tokens", "[literal][kind]") {
	REQUIRE(GetLiteralKind("<http://rdf.freebase.com/ns/m.02mjmr>") == LiteralKind::URI);
	REQUIRE(GetLiteralKind("\"Hanna Bieluszko\"") == LiteralKind::STRING);
	REQUIRE(GetLiteralKind("\"Hanna Bieluszko\"@en") == LiteralKind::TEXT);
	REQUIRE(GetLiteralKind("\"1972\"^^<http://www.w3.org/2001/XMLSchema#gYear>") == LiteralKind::TEXT);
	REQUIRE(GetLiteralKind("_:b0") == LiteralKind::OTHER);
	REQUIRE(GetLiteralKind("42") == LiteralKind::OTHER);
}

TEST_CASE("GetLiteralKind: empty and single character tokens", "[literal][kind]") {
	REQUIRE(GetLiteralKind("") == LiteralKind::OTHER);
	REQUIRE(GetLiteralKind("\"") == LiteralKind::OTHER);
	REQUIRE(GetLiteralKind("<") == LiteralKind::URI);
	REQUIRE(GetLiteralKind("\"\"") == LiteralKind::STRING);
}

TEST_CASE("LiteralKindToString names every kind", "[literal][kind]") {
	REQUIRE(std::string(LiteralKindToString(LiteralKind::URI)) == "URI");
	REQUIRE(std::string(LiteralKindToString(LiteralKind::STRING)) == "STRING");
	REQUIRE(std::string(LiteralKindToString(LiteralKind::TEXT)) == "TEXT");
	REQUIRE(std::string(LiteralKindToString(LiteralKind::OTHER)) == "OTHER");
}

TEST_CASE("CleanUri strips brackets and lower-cases", "[literal][uri]") {
	std::string token = "<http://rdf.freebase.com/ns/M.02MJMR>";
	std::string clean = CleanUri(token);
	REQUIRE(clean == "http://rdf.freebase.com/ns/m.02mjmr");
	REQUIRE(CleanUri(clean) == clean);
	REQUIRE(CleanUri("m.02mjmr") == "m.02mjmr");
	REQUIRE(CleanUri("<>") == "");
	REQUIRE(CleanUri("<") == "<");
	REQUIRE(CleanUri("") == "");
}

TEST_CASE("NormalizeObjectValue: URI tokens", "[literal][normalize]") {
	REQUIRE(NormalizeObjectValue("<http://rdf.freebase.com/ns/People.Person>") ==
	        "http://rdf.freebase.com/ns/people.person");
}

TEST_CASE("NormalizeObjectValue: STRING tokens lose their quotes", "[literal][normalize]") {
	REQUIRE(NormalizeObjectValue("\"abc\"") == "abc");
	REQUIRE(NormalizeObjectValue("\"\"") == "");
	// Escapes in plain strings are not N-Triples decoded
	REQUIRE(NormalizeObjectValue("\"a\\tb\"") == "a\\tb");
}

TEST_CASE("NormalizeObjectValue: STRING tokens with MQL key escapes", "[literal][normalize]") {
	REQUIRE(NormalizeObjectValue("\"Barack_Hussein_Obama$002C_Jr$002E\"") == "Barack_Hussein_Obama,_Jr.");
	REQUIRE(NormalizeObjectValue("\"price$0024\"") == "price$");
}

TEST_CASE("NormalizeObjectValue: TEXT tokens are unescaped and keep their suffix", "[literal][normalize]") {
	REQUIRE(NormalizeObjectValue("\"Hanna Bieluszko\"@en") == "\"Hanna Bieluszko\"@en");
	REQUIRE(NormalizeObjectValue("\"Say \\\"hi\\\"\\n\"@en") == "\"Say \"hi\"\n\"@en");
	REQUIRE(NormalizeObjectValue("\"Z\\u00FCrich\"@de") == "\"Z\xC3\xBCrich\"@de");
	REQUIRE(NormalizeObjectValue("\"\\uD83D\\uDE00\"@en") == "\"\xF0\x9F\x98\x80\"@en");
	REQUIRE(NormalizeObjectValue("\"1972\"^^<http://www.w3.org/2001/XMLSchema#gYear>") ==
	        "\"1972\"^^<http://www.w3.org/2001/XMLSchema#gYear>");
}

TEST_CASE("NormalizeObjectValue: OTHER tokens pass through", "[literal][normalize]") {
	REQUIRE(NormalizeObjectValue("_:b0") == "_:b0");
	REQUIRE(NormalizeObjectValue("") == "");
	REQUIRE(NormalizeObjectValue("\"") == "\"");
}

TEST_CASE("UndoMqlKeyEscape decodes four digit groups", "[literal][mql]") {
	REQUIRE(UndoMqlKeyEscape("Barack_Hussein_Obama$002C_Jr$002E") == "Barack_Hussein_Obama,_Jr.");
	REQUIRE(UndoMqlKeyEscape("no_escapes") == "no_escapes");
	REQUIRE(UndoMqlKeyEscape("$0041$0042C") == "ABC");
	REQUIRE(UndoMqlKeyEscape("Z$00FCrich") == "Z\xC3\xBCrich");
	REQUIRE(UndoMqlKeyEscape("$00e9t$00E9") == "\xC3\xA9t\xC3\xA9");
}

TEST_CASE("UndoMqlKeyEscape keeps malformed groups verbatim", "[literal][mql]") {
	REQUIRE(UndoMqlKeyEscape("foo$1bar") == "foo$1bar");
	REQUIRE(UndoMqlKeyEscape("foo$12") == "foo$12");
	REQUIRE(UndoMqlKeyEscape("trailing$") == "trailing$");
	REQUIRE(UndoMqlKeyEscape("$$0041") == "$A");
	REQUIRE(UndoMqlKeyEscape("a$zzzz$002E") == "a$zzzz.");
}

TEST_CASE("UndoMqlKeyEscape joins surrogate pairs", "[literal][mql]") {
	// U+1F600 escaped as a UTF-16 surrogate pair
	REQUIRE(UndoMqlKeyEscape("smile$D83D$DE00!") == "smile\xF0\x9F\x98\x80!");
	// Unpaired halves are not valid code points
	REQUIRE(UndoMqlKeyEscape("x$D83Dy") == "x$D83Dy");
	REQUIRE(UndoMqlKeyEscape("x$DE00") == "x$DE00");
	REQUIRE(UndoMqlKeyEscape("x$D83D$0041") == "x$D83DA");
}
