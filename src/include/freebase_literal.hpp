#ifndef FREEBASE_LITERAL_H
#define FREEBASE_LITERAL_H

#include <string>

/*
    Syntactic shape of an N-Triples object token as found in Freebase dumps.
    URI     <http://rdf.freebase.com/ns/m.02mjmr>
    STRING  "Hanna Bieluszko"
    TEXT    "Hanna Bieluszko"@en, "1972"^^<http://www.w3.org/2001/XMLSchema#gYear>
    OTHER   anything else, including blank nodes and the empty token
*/
enum class LiteralKind { URI, STRING, TEXT, OTHER };

const char *LiteralKindToString(LiteralKind kind);

// Looks at the first character, and the last one for quoted tokens.
LiteralKind GetLiteralKind(const std::string &token);

// Strips the angle brackets of a URI token and lower-cases it (ASCII only).
// Tokens not starting with '<' are returned unchanged.
std::string CleanUri(const std::string &token);

/*
    Canonical value of an object token:
      URI     -> CleanUri
      STRING  -> contents between the quotes, with MQL key escapes undone
      TEXT    -> N-Triples unescaped, quotes and suffix kept
      OTHER   -> token unchanged
*/
std::string NormalizeObjectValue(const std::string &token);

// Reverses MQL key escaping, where "$XXXX" stands for the code point U+XXXX,
// e.g. "Barack_Hussein_Obama$002C_Jr$002E" -> "Barack_Hussein_Obama,_Jr."
// A group that is not four hex digits is kept as written, '$' included.
std::string UndoMqlKeyEscape(const std::string &s);

#endif // FREEBASE_LITERAL_H
