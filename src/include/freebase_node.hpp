#ifndef FREEBASE_NODE_H
#define FREEBASE_NODE_H

#include <map>
#include <string>
#include <vector>

/*
    A node of the Freebase knowledge graph: a topic, a compound value type
    or a piece of schema, identified by its URI. Collects the
    (predicate, value) facts stated about it. Predicates are kept sorted,
    values in the order they were added.

    Not synchronized; one owner fills a node before handing it off.
*/
class FreebaseNode {
public:
	using PredicateValueMap = std::map<std::string, std::vector<std::string>>;

	explicit FreebaseNode(std::string uri);

	// Appends a value for the predicate. Duplicates are kept.
	FreebaseNode &AddPredicateValue(const std::string &predicate, const std::string &value);

	const std::string &Uri() const {
		return _uri;
	}
	// Owned by the node; callers should not modify it directly.
	PredicateValueMap &PredicateValues() {
		return _predicate_values;
	}
	const PredicateValueMap &PredicateValues() const {
		return _predicate_values;
	}

	size_t Size() const;
	bool Empty() const {
		return _predicate_values.empty();
	}

	// One "uri\tpredicate\tvalue\t.\n" line per fact; empty for a node without facts.
	std::string ToString() const;

private:
	std::string _uri;
	PredicateValueMap _predicate_values;
};

#endif // FREEBASE_NODE_H
