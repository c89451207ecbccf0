#pragma once
#include <cstdint>
#include <string>

// Splits one N-Triples line into raw subject, predicate and object tokens.
// The object token is kept exactly as written, including quotes, escapes and
// any @lang or ^^<datatype> suffix.
bool SplitTripleLine(const std::string &line, std::string &subject, std::string &predicate, std::string &object);

// True for blank lines and '#' comment lines.
bool IsSkippableLine(const std::string &line);

// Decodes N-Triples string escapes. Malformed escapes are copied verbatim.
std::string UnescapeNTriplesString(const std::string &s);

void AppendUtf8Codepoint(std::string &out, uint32_t cp);

// UTF-16 surrogate halves; they are not code points on their own
bool IsHighSurrogate(uint32_t cp);
bool IsLowSurrogate(uint32_t cp);
uint32_t CombineSurrogates(uint32_t high, uint32_t low);

// Parses exactly `length` hex digits starting at pos. Fails when fewer than
// `length` characters remain before end or a digit is not hexadecimal.
bool ParseHexDigits(const char *pos, const char *end, size_t length, uint32_t &out);
