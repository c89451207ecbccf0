#include "include/parse_triple.hpp"
#include <cctype>

bool ParseHexDigits(const char *pos, const char *end, size_t length, uint32_t &out) {
	out = 0;
	if (pos > end || static_cast<size_t>(end - pos) < length)
		return false;
	for (size_t j = 0; j < length; ++j) {
		char hc = pos[j];
		uint32_t val;
		if (hc >= '0' && hc <= '9')
			val = hc - '0';
		else if (hc >= 'A' && hc <= 'F')
			val = hc - 'A' + 10;
		else if (hc >= 'a' && hc <= 'f')
			val = hc - 'a' + 10;
		else
			return false;
		out = (out << 4) | val;
	}
	return true;
}

bool IsHighSurrogate(uint32_t cp) {
	return cp >= 0xD800 && cp <= 0xDBFF;
}

bool IsLowSurrogate(uint32_t cp) {
	return cp >= 0xDC00 && cp <= 0xDFFF;
}

uint32_t CombineSurrogates(uint32_t high, uint32_t low) {
	return 0x10000 + ((high - 0xD800) << 10) + (low - 0xDC00);
}

void AppendUtf8Codepoint(std::string &out, uint32_t cp) {
	if (cp <= 0x7F)
		out.push_back(static_cast<char>(cp));
	else if (cp <= 0x7FF) {
		out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
		out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
	} else if (cp <= 0xFFFF) {
		out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
		out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
	} else {
		out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
		out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
	}
}

std::string UnescapeNTriplesString(const std::string &s) {
	std::string out;
	out.reserve(s.size());
	const char *p = s.data();
	const char *end = p + s.size();

	while (p < end) {
		char c = *p;
		if (c != '\\' || p + 1 >= end) {
			out.push_back(c);
			++p;
			continue;
		}
		char e = *(p + 1);
		uint32_t cp;
		switch (e) {
		case 't':
			out.push_back('\t');
			p += 2;
			break;
		case 'b':
			out.push_back('\b');
			p += 2;
			break;
		case 'n':
			out.push_back('\n');
			p += 2;
			break;
		case 'r':
			out.push_back('\r');
			p += 2;
			break;
		case 'f':
			out.push_back('\f');
			p += 2;
			break;
		case '"':
		case '\'':
		case '\\':
			out.push_back(e);
			p += 2;
			break;
		case 'u':
			if (!ParseHexDigits(p + 2, end, 4, cp)) {
				out.append(p, 2);
				p += 2;
			} else if (IsHighSurrogate(cp)) {
				// Characters outside the BMP may be written as a \uXXXX\uXXXX pair
				uint32_t low;
				if (end - p >= 12 && p[6] == '\\' && p[7] == 'u' && ParseHexDigits(p + 8, end, 4, low) &&
				    IsLowSurrogate(low)) {
					AppendUtf8Codepoint(out, CombineSurrogates(cp, low));
					p += 12;
				} else {
					out.append(p, 6);
					p += 6;
				}
			} else if (IsLowSurrogate(cp)) {
				out.append(p, 6);
				p += 6;
			} else {
				AppendUtf8Codepoint(out, cp);
				p += 6;
			}
			break;
		case 'U':
			if (ParseHexDigits(p + 2, end, 8, cp) && cp <= 0x10FFFF && !IsHighSurrogate(cp) && !IsLowSurrogate(cp)) {
				AppendUtf8Codepoint(out, cp);
				p += 10;
			} else {
				out.append(p, 2);
				p += 2;
			}
			break;
		default:
			out.append(p, 2);
			p += 2;
			break;
		}
	}
	return out;
}

bool IsSkippableLine(const std::string &line) {
	for (char c : line) {
		if (isspace(static_cast<unsigned char>(c)))
			continue;
		return c == '#';
	}
	return true;
}

bool SplitTripleLine(const std::string &line, std::string &subject, std::string &predicate, std::string &object) {
	subject.clear();
	predicate.clear();
	object.clear();

	enum class State {
		Start,
		SubjectIRI,
		SubjectBlank,
		PredicateIRI,
		ObjectIRI,
		ObjectBlank,
		ObjectLiteral,
		ObjectLiteralEscaped,
		AfterLiteral,
		LangTag,
		DatatypeIRI,
		End
	};

	const char *p = line.data();
	const char *end = p + line.size();

	auto skip_ws = [&]() {
		while (p < end && isspace(static_cast<unsigned char>(*p)))
			++p;
	};

	// Positions p on the first character of the predicate IRI.
	auto begin_predicate = [&]() -> bool {
		skip_ws();
		return p < end && *p == '<';
	};

	skip_ws();
	State state = State::Start;
	const char *token_start = nullptr;

	while (p < end) {
		char c = *p;
		switch (state) {
		case State::Start:
			token_start = p;
			if (c == '<') {
				state = State::SubjectIRI;
				++p;
			} else if (c == '_' && p + 1 < end && *(p + 1) == ':') {
				state = State::SubjectBlank;
				p += 2;
			} else
				return false;
			break;

		case State::SubjectIRI:
			++p;
			if (c == '>') {
				subject.assign(token_start, p - token_start);
				if (!begin_predicate())
					return false;
				token_start = p++;
				state = State::PredicateIRI;
			}
			break;

		case State::SubjectBlank:
			if (isspace(static_cast<unsigned char>(c))) {
				subject.assign(token_start, p - token_start);
				if (!begin_predicate())
					return false;
				token_start = p++;
				state = State::PredicateIRI;
			} else
				++p;
			break;

		case State::PredicateIRI:
			++p;
			if (c == '>') {
				predicate.assign(token_start, p - token_start);
				skip_ws();
				if (p >= end)
					return false;
				token_start = p;
				if (*p == '<') {
					state = State::ObjectIRI;
					++p;
				} else if (*p == '_' && p + 1 < end && *(p + 1) == ':') {
					state = State::ObjectBlank;
					p += 2;
				} else if (*p == '"') {
					state = State::ObjectLiteral;
					++p;
				} else
					return false;
			}
			break;

		case State::ObjectIRI:
			++p;
			if (c == '>') {
				object.assign(token_start, p - token_start);
				state = State::End;
			}
			break;

		case State::ObjectBlank:
			if (isspace(static_cast<unsigned char>(c)) || c == '.') {
				object.assign(token_start, p - token_start);
				state = State::End;
			} else
				++p;
			break;

		case State::ObjectLiteral:
			if (c == '\\')
				state = State::ObjectLiteralEscaped;
			else if (c == '"')
				state = State::AfterLiteral;
			++p;
			break;

		case State::ObjectLiteralEscaped:
			// Escapes stay in the raw token; only skip the escaped character.
			state = State::ObjectLiteral;
			++p;
			break;

		case State::AfterLiteral:
			if (c == '@') {
				state = State::LangTag;
				++p;
			} else if (c == '^' && p + 1 < end && *(p + 1) == '^') {
				p += 2;
				if (p >= end || *p != '<')
					return false;
				state = State::DatatypeIRI;
				++p;
			} else if (isspace(static_cast<unsigned char>(c)) || c == '.') {
				object.assign(token_start, p - token_start);
				state = State::End;
			} else
				return false;
			break;

		case State::LangTag:
			if (isspace(static_cast<unsigned char>(c)) || c == '.') {
				if (*(p - 1) == '@')
					return false;
				object.assign(token_start, p - token_start);
				state = State::End;
			} else
				++p;
			break;

		case State::DatatypeIRI:
			++p;
			if (c == '>') {
				object.assign(token_start, p - token_start);
				state = State::End;
			}
			break;

		case State::End:
			skip_ws();
			if (p < end && *p == '.')
				++p;
			skip_ws();
			return p == end;
		}
	}

	switch (state) {
	case State::End:
		return true;
	case State::ObjectBlank:
	case State::AfterLiteral:
		object.assign(token_start, end - token_start);
		return true;
	case State::LangTag:
		if (*(end - 1) == '@')
			return false;
		object.assign(token_start, end - token_start);
		return true;
	default:
		return false;
	}
}
