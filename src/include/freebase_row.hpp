#ifndef FREEBASE_ROW_H
#define FREEBASE_ROW_H

#include <string>

/*
    Holder for a single triple of a Freebase dump
*/
struct FreebaseRow {
	std::string subject;     // cleaned subject URI
	std::string predicate;   // raw predicate token
	std::string object;      // raw object token
	std::string object_kind; // LiteralKindToString of the object
	std::string value;       // normalized object, or the raw object when not normalizing
};

// Splits and normalizes one N-Triples line. Returns false for malformed lines.
bool ParseFreebaseLine(const std::string &line, const bool normalize, FreebaseRow &row);

#endif // FREEBASE_ROW_H
