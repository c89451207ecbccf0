#include "include/freebase_node.hpp"
#include <utility>

FreebaseNode::FreebaseNode(std::string uri) : _uri(std::move(uri)) {
}

FreebaseNode &FreebaseNode::AddPredicateValue(const std::string &predicate, const std::string &value) {
	_predicate_values[predicate].push_back(value);
	return *this;
}

size_t FreebaseNode::Size() const {
	size_t count = 0;
	for (const auto &entry : _predicate_values)
		count += entry.second.size();
	return count;
}

std::string FreebaseNode::ToString() const {
	std::string out;
	for (const auto &entry : _predicate_values) {
		for (const auto &value : entry.second) {
			out.append(_uri).append("\t").append(entry.first).append("\t");
			out.append(value).append("\t").append(".\n");
		}
	}
	return out;
}
