#ifndef LINE_SPLITTER_H
#define LINE_SPLITTER_H

#include <string>

/*
    Cuts a byte stream that arrives in arbitrary chunks into lines.
    Terminators ("\n" or "\r\n") are removed. After Finish(), a trailing
    line without terminator is returned as well.
*/
class LineSplitter {
public:
	void Feed(const char *data, size_t size);
	void Finish() {
		_finished = true;
	}

	// Returns false when no complete line is buffered
	bool NextLine(std::string &line);

	bool Finished() const {
		return _finished;
	}

private:
	std::string _pending;
	size_t _pending_offset = 0;
	bool _finished = false;
};

#endif // LINE_SPLITTER_H
