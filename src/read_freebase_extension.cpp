#define DUCKDB_EXTENSION_MAIN

#include "include/read_freebase_extension.hpp"
#include "duckdb.hpp"
#include "include/freebase_buffer.hpp"
#include "include/freebase_literal.hpp"
#include "include/freebase_node.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/vector_operations/unary_executor.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/function/table_function.hpp"
#include <duckdb/parser/parsed_data/create_table_function_info.hpp>
#include "duckdb/common/file_system.hpp"

using namespace std;

namespace duckdb {

struct FreebaseReaderBindData : public TableFunctionData {
	string file_path;
	bool strict_parsing = true;
	bool normalize = true;
};

struct FreebaseReaderLocalState : public LocalTableFunctionState {
	std::unique_ptr<FreebaseBuffer> fb;
};

static bool GetBoolParameter(TableFunctionBindInput &input, const string &name, bool default_value) {
	auto param = input.named_parameters.find(name);
	if (param == input.named_parameters.end() || param->second.IsNull()) {
		return default_value;
	}
	return param->second.GetValue<bool>();
}

static unique_ptr<FunctionData> FreebaseReaderBind(ClientContext &context, TableFunctionBindInput &input,
                                                   vector<LogicalType> &return_types, vector<string> &names) {
	auto result = make_uniq<FreebaseReaderBindData>();
	if (input.inputs[0].IsNull()) {
		throw BinderException("read_freebase requires a file path");
	}
	auto &fs = FileSystem::GetFileSystem(context);
	result->file_path = fs.ExpandPath(input.inputs[0].GetValue<string>());
	result->strict_parsing = GetBoolParameter(input, "strict_parsing", true);
	result->normalize = GetBoolParameter(input, "normalize", true);
	names = {"subject", "predicate", "object", "object_kind", "value"};
	return_types = {LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::VARCHAR,
	                LogicalType::VARCHAR};
	return std::move(result);
}

static unique_ptr<LocalTableFunctionState> FreebaseReaderInit(ExecutionContext &context, TableFunctionInitInput &input,
                                                              GlobalTableFunctionState *global_state) {
	auto &bind_data = input.bind_data->Cast<FreebaseReaderBindData>();
	auto state = make_uniq<FreebaseReaderLocalState>();
	auto &fs = FileSystem::GetFileSystem(context.client);
	auto _fb = make_uniq<FreebaseBuffer>(bind_data.file_path, &fs, bind_data.strict_parsing, bind_data.normalize);
	try {
		_fb->StartParse();
	} catch (const std::runtime_error &re) {
		cerr << "Exception in FreebaseReaderInit: " << re.what() << "\n";
		throw IOException(re.what());
	}
	state->fb = std::move(_fb);
	return std::move(state);
}

static void FreebaseReaderFunc(ClientContext &context, TableFunctionInput &input, DataChunk &output) {
	auto &state = input.local_state->Cast<FreebaseReaderLocalState>();
	try {
		state.fb->PopulateChunk(output);
	} catch (const std::runtime_error &error) {
		throw SyntaxException(error.what());
	}
}

template <std::string (*OP)(const std::string &)>
static void StringTransformFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	UnaryExecutor::Execute<string_t, string_t>(args.data[0], result, args.size(), [&](string_t input) {
		return StringVector::AddString(result, OP(input.GetString()));
	});
}

static void LiteralKindFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	UnaryExecutor::Execute<string_t, string_t>(args.data[0], result, args.size(), [&](string_t input) {
		return StringVector::AddString(result, LiteralKindToString(GetLiteralKind(input.GetString())));
	});
}

// freebase_node_serialize(uri, predicates, values): NULL in any argument gives NULL,
// NULL list elements are skipped together with their counterpart
static void NodeSerializeFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	for (idx_t row_idx = 0; row_idx < args.size(); row_idx++) {
		auto uri = args.GetValue(0, row_idx);
		auto predicates = args.GetValue(1, row_idx);
		auto values = args.GetValue(2, row_idx);
		if (uri.IsNull() || predicates.IsNull() || values.IsNull()) {
			result.SetValue(row_idx, Value(LogicalType::VARCHAR));
			continue;
		}
		auto &predicate_list = ListValue::GetChildren(predicates);
		auto &value_list = ListValue::GetChildren(values);
		if (predicate_list.size() != value_list.size()) {
			throw InvalidInputException("freebase_node_serialize: got " + to_string(predicate_list.size()) +
			                            " predicates but " + to_string(value_list.size()) + " values");
		}
		FreebaseNode node(StringValue::Get(uri));
		for (idx_t i = 0; i < predicate_list.size(); i++) {
			if (predicate_list[i].IsNull() || value_list[i].IsNull()) {
				continue;
			}
			node.AddPredicateValue(StringValue::Get(predicate_list[i]), StringValue::Get(value_list[i]));
		}
		result.SetValue(row_idx, Value(node.ToString()));
	}
	if (args.AllConstant()) {
		result.SetVectorType(VectorType::CONSTANT_VECTOR);
	}
}

static void LoadInternal(ExtensionLoader &loader) {
	TableFunction tf("read_freebase", {LogicalType::VARCHAR}, FreebaseReaderFunc, FreebaseReaderBind, nullptr,
	                 FreebaseReaderInit);
	tf.named_parameters["strict_parsing"] = LogicalType::BOOLEAN;
	tf.named_parameters["normalize"] = LogicalType::BOOLEAN;
	loader.RegisterFunction(tf);

	loader.RegisterFunction(
	    ScalarFunction("freebase_literal_kind", {LogicalType::VARCHAR}, LogicalType::VARCHAR, LiteralKindFunction));
	loader.RegisterFunction(ScalarFunction("freebase_clean_uri", {LogicalType::VARCHAR}, LogicalType::VARCHAR,
	                                       StringTransformFunction<CleanUri>));
	loader.RegisterFunction(ScalarFunction("freebase_normalize", {LogicalType::VARCHAR}, LogicalType::VARCHAR,
	                                       StringTransformFunction<NormalizeObjectValue>));
	loader.RegisterFunction(ScalarFunction("freebase_unescape_key", {LogicalType::VARCHAR}, LogicalType::VARCHAR,
	                                       StringTransformFunction<UndoMqlKeyEscape>));

	ScalarFunction serialize("freebase_node_serialize",
	                         {LogicalType::VARCHAR, LogicalType::LIST(LogicalType::VARCHAR),
	                          LogicalType::LIST(LogicalType::VARCHAR)},
	                         LogicalType::VARCHAR, NodeSerializeFunction);
	serialize.null_handling = FunctionNullHandling::SPECIAL_HANDLING;
	loader.RegisterFunction(serialize);
}

void ReadFreebaseExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}
std::string ReadFreebaseExtension::Name() {
	return "read_freebase";
}

std::string ReadFreebaseExtension::Version() const {
#ifdef EXT_VERSION_READ_FREEBASE
	return EXT_VERSION_READ_FREEBASE;
#else
	return "0.0.1-unknown";
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(read_freebase, loader) {
	duckdb::LoadInternal(loader);
}
}

#ifndef DUCKDB_EXTENSION_MAIN
#error DUCKDB_EXTENSION_MAIN not defined
#endif
