#include <cstdint>
#include <cstring>
#include <iostream>
#include <string>
#include "include/freebase_node.hpp"
#include "include/freebase_row.hpp"
#include "include/parse_triple.hpp"

using namespace std;

// Reads N-Triples on stdin and prints one block per run of lines sharing a subject.
//   freebase_node_dump [--strict] < freebase-rdf.nt
int main(int argc, char **argv) {
	bool strict = false;
	for (int i = 1; i < argc; i++) {
		if (strcmp(argv[i], "--strict") == 0) {
			strict = true;
		} else {
			cerr << "Usage: " << argv[0] << " [--strict] < input.nt\n";
			return 2;
		}
	}

	FreebaseNode node("");
	bool have_node = false;
	FreebaseRow row;
	string line;
	uint64_t line_number = 0;
	uint64_t skipped = 0;
	uint64_t nodes = 0;

	while (getline(cin, line)) {
		line_number++;
		if (!line.empty() && line.back() == '\r')
			line.pop_back();
		if (IsSkippableLine(line))
			continue;
		if (!ParseFreebaseLine(line, true, row)) {
			cerr << "Skipping malformed line " << line_number << "\n";
			skipped++;
			continue;
		}
		if (!have_node || node.Uri() != row.subject) {
			if (have_node) {
				cout << node.ToString();
				nodes++;
			}
			node = FreebaseNode(row.subject);
			have_node = true;
		}
		node.AddPredicateValue(row.predicate, row.value);
	}
	if (have_node) {
		cout << node.ToString();
		nodes++;
	}

	cerr << "Wrote " << nodes << " nodes from " << line_number << " lines, skipped " << skipped << "\n";
	return (strict && skipped > 0) ? 1 : 0;
}
