#ifndef FREEBASE_BUFFER_H
#define FREEBASE_BUFFER_H

#include "duckdb.hpp"
#include "duckdb/common/file_system.hpp"
#include "freebase_row.hpp"
#include "line_splitter.hpp"
#include <memory>
#include <string>

/*
    Reads an N-Triples file line by line through the DuckDB FileSystem and
    fills DataChunks with one row per triple.
*/
class FreebaseBuffer {
public:
	FreebaseBuffer(std::string path, duckdb::FileSystem *fs, const bool strict_parsing = true,
	               const bool normalize = true);

	~FreebaseBuffer();

	void StartParse();
	void PopulateChunk(duckdb::DataChunk &output);

private:
	constexpr static size_t PARSING_CHUNK_SIZE = 4096;
	bool NextLine(std::string &line);
	void writeToVector(duckdb::Vector &vec, duckdb::idx_t row_idx, const std::string &field);

private:
	duckdb::FileSystem *_fs = nullptr;
	std::unique_ptr<duckdb::FileHandle> _file_handle;
	std::string _file_path;
	LineSplitter _lines;
	uint64_t _line_number = 0;
	bool _strict_parsing = true;
	bool _normalize = true;
};

#endif // FREEBASE_BUFFER_H
