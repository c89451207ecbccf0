#include "include/freebase_row.hpp"
#include "include/freebase_literal.hpp"
#include "include/parse_triple.hpp"

bool ParseFreebaseLine(const std::string &line, const bool normalize, FreebaseRow &row) {
	std::string subject;
	if (!SplitTripleLine(line, subject, row.predicate, row.object))
		return false;
	row.subject = CleanUri(subject);
	row.object_kind = LiteralKindToString(GetLiteralKind(row.object));
	row.value = normalize ? NormalizeObjectValue(row.object) : row.object;
	return true;
}
