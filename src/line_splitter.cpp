#include "include/line_splitter.hpp"

void LineSplitter::Feed(const char *data, size_t size) {
	_pending.erase(0, _pending_offset);
	_pending_offset = 0;
	_pending.append(data, size);
}

bool LineSplitter::NextLine(std::string &line) {
	auto newline = _pending.find('\n', _pending_offset);
	if (newline != std::string::npos) {
		line.assign(_pending, _pending_offset, newline - _pending_offset);
		_pending_offset = newline + 1;
	} else if (_finished && _pending_offset < _pending.size()) {
		line.assign(_pending, _pending_offset, std::string::npos);
		_pending_offset = _pending.size();
	} else {
		return false;
	}
	if (!line.empty() && line.back() == '\r')
		line.pop_back();
	return true;
}
