#include "include/freebase_literal.hpp"
#include "include/parse_triple.hpp"
#include <cctype>
#include <cstdint>

const char *LiteralKindToString(LiteralKind kind) {
	switch (kind) {
	case LiteralKind::URI:
		return "URI";
	case LiteralKind::STRING:
		return "STRING";
	case LiteralKind::TEXT:
		return "TEXT";
	case LiteralKind::OTHER:
		return "OTHER";
	}
	return "OTHER";
}

LiteralKind GetLiteralKind(const std::string &token) {
	if (token.empty())
		return LiteralKind::OTHER;
	switch (token.front()) {
	case '<':
		return LiteralKind::URI;
	case '"':
		// A lone quote is neither a plain nor a tagged literal
		if (token.size() < 2)
			return LiteralKind::OTHER;
		if (token.back() == '"')
			return LiteralKind::STRING;
		return LiteralKind::TEXT;
	default:
		return LiteralKind::OTHER;
	}
}

std::string CleanUri(const std::string &token) {
	if (token.size() < 2 || token.front() != '<')
		return token;
	size_t length = token.size() - 1;
	if (token.back() == '>')
		--length;
	std::string uri = token.substr(1, length);
	for (auto &c : uri)
		c = (char)tolower(static_cast<unsigned char>(c));
	return uri;
}

std::string UndoMqlKeyEscape(const std::string &s) {
	size_t pos = s.find('$');
	if (pos == std::string::npos)
		return s;

	std::string out(s, 0, pos);
	out.reserve(s.size());
	const char *base = s.data();

	// pos always points at a '$'; each group runs up to the next '$'
	while (pos != std::string::npos) {
		size_t next = s.find('$', pos + 1);
		const char *group = base + pos + 1;
		const char *group_end = base + (next == std::string::npos ? s.size() : next);

		uint32_t cp;
		if (!ParseHexDigits(group, group_end, 4, cp) || IsLowSurrogate(cp)) {
			out.append(base + pos, group_end);
			pos = next;
			continue;
		}

		if (IsHighSurrogate(cp)) {
			// Characters outside the BMP are escaped as two consecutive groups
			uint32_t low = 0;
			bool paired = group_end == group + 4 && next != std::string::npos;
			size_t after = paired ? s.find('$', next + 1) : std::string::npos;
			const char *low_end = base + (after == std::string::npos ? s.size() : after);
			if (paired && ParseHexDigits(base + next + 1, low_end, 4, low) && IsLowSurrogate(low)) {
				AppendUtf8Codepoint(out, CombineSurrogates(cp, low));
				out.append(base + next + 5, low_end);
				pos = after;
			} else {
				out.append(base + pos, group_end);
				pos = next;
			}
			continue;
		}

		AppendUtf8Codepoint(out, cp);
		out.append(group + 4, group_end);
		pos = next;
	}
	return out;
}

std::string NormalizeObjectValue(const std::string &token) {
	switch (GetLiteralKind(token)) {
	case LiteralKind::URI:
		return CleanUri(token);
	case LiteralKind::STRING: {
		std::string value = token.substr(1, token.size() - 2);
		if (value.find('$') != std::string::npos)
			return UndoMqlKeyEscape(value);
		return value;
	}
	case LiteralKind::TEXT:
		return UnescapeNTriplesString(token);
	default:
		return token;
	}
}
