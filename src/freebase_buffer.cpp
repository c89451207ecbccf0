#include "include/freebase_buffer.hpp"
#include "include/parse_triple.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

FreebaseBuffer::FreebaseBuffer(std::string path, duckdb::FileSystem *fs, const bool strict_parsing,
                               const bool normalize)
    : _fs(fs), _file_path(std::move(path)), _strict_parsing(strict_parsing), _normalize(normalize) {
	if (!fs) {
		throw std::runtime_error("FreebaseBuffer requires a valid DuckDB FileSystem pointer");
	}
}

FreebaseBuffer::~FreebaseBuffer() {
}

/*
    Opens the file. Only needs to be called once.
*/
void FreebaseBuffer::StartParse() {
	try {
		_file_handle = _fs->OpenFile(_file_path, duckdb::FileFlags::FILE_FLAGS_READ);
	} catch (std::exception &ex) {
		throw std::runtime_error("Could not open RDF file: " + _file_path + ": " + ex.what());
	}
}

/*
    Returns the next line, reading more of the file as needed.
    Returns false once the file is exhausted.
*/
bool FreebaseBuffer::NextLine(std::string &line) {
	char buffer[PARSING_CHUNK_SIZE];
	while (!_lines.NextLine(line)) {
		if (_lines.Finished())
			return false;
		int64_t res = _file_handle->Read(buffer, PARSING_CHUNK_SIZE);
		if (res > 0)
			_lines.Feed(buffer, (size_t)res);
		if (res < (int64_t)PARSING_CHUNK_SIZE)
			_lines.Finish();
	}
	return true;
}

void FreebaseBuffer::PopulateChunk(duckdb::DataChunk &output) {
	if (!_file_handle) {
		throw std::runtime_error("PopulateChunk invoked before StartParse");
	}
	duckdb::idx_t count = 0;
	std::string line;
	FreebaseRow row;
	while (count < STANDARD_VECTOR_SIZE && NextLine(line)) {
		_line_number++;
		if (IsSkippableLine(line))
			continue;
		if (!ParseFreebaseLine(line, _normalize, row)) {
			if (_strict_parsing)
				throw std::runtime_error("Malformed N-Triples in " + _file_path + ", at line " +
				                         std::to_string(_line_number));
			std::cerr << "Skipping malformed line " << _line_number << " of " << _file_path << "\n";
			continue;
		}
		writeToVector(output.data[0], count, row.subject);
		writeToVector(output.data[1], count, row.predicate);
		writeToVector(output.data[2], count, row.object);
		writeToVector(output.data[3], count, row.object_kind);
		writeToVector(output.data[4], count, row.value);
		count++;
	}
	output.SetCardinality(count);
}

void FreebaseBuffer::writeToVector(duckdb::Vector &vec, duckdb::idx_t row_idx, const std::string &field) {
	auto str = duckdb::StringVector::AddString(vec, field);
	duckdb::FlatVector::GetData<duckdb::string_t>(vec)[row_idx] = str;
}
