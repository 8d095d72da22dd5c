#include "tilemosaic/catalog.h"

#include "aixlog.hpp"

#include <arrow/api.h>
#include <arrow/io/memory.h>
#include <parquet/arrow/reader.h>
#include <parquet/exception.h>

namespace tilemosaic {

namespace {

void check_status(const arrow::Status &status, const std::string &what) {
    if (!status.ok()) {
        throw malformed_input_error(what + ": " + status.ToString());
    }
}

nlohmann::json array_to_json(const arrow::Array &array);

nlohmann::json scalar_to_json(const arrow::Scalar &scalar) {
    if (!scalar.is_valid) {
        return nullptr;
    }
    switch (scalar.type->id()) {
        case arrow::Type::BOOL:
            return static_cast<const arrow::BooleanScalar &>(scalar).value;
        case arrow::Type::INT8:
            return static_cast<const arrow::Int8Scalar &>(scalar).value;
        case arrow::Type::INT16:
            return static_cast<const arrow::Int16Scalar &>(scalar).value;
        case arrow::Type::INT32:
            return static_cast<const arrow::Int32Scalar &>(scalar).value;
        case arrow::Type::INT64:
            return static_cast<const arrow::Int64Scalar &>(scalar).value;
        case arrow::Type::UINT8:
            return static_cast<const arrow::UInt8Scalar &>(scalar).value;
        case arrow::Type::UINT16:
            return static_cast<const arrow::UInt16Scalar &>(scalar).value;
        case arrow::Type::UINT32:
            return static_cast<const arrow::UInt32Scalar &>(scalar).value;
        case arrow::Type::UINT64:
            return static_cast<const arrow::UInt64Scalar &>(scalar).value;
        case arrow::Type::FLOAT:
            return static_cast<const arrow::FloatScalar &>(scalar).value;
        case arrow::Type::DOUBLE:
            return static_cast<const arrow::DoubleScalar &>(scalar).value;
        case arrow::Type::STRING:
        case arrow::Type::LARGE_STRING: {
            const auto &text = static_cast<const arrow::BaseBinaryScalar &>(scalar);
            return text.value ? text.value->ToString() : std::string();
        }
        case arrow::Type::BINARY:
        case arrow::Type::LARGE_BINARY:
        case arrow::Type::FIXED_SIZE_BINARY: {
            const auto &blob = static_cast<const arrow::BaseBinaryScalar &>(scalar);
            std::vector<std::uint8_t> bytes;
            if (blob.value) {
                bytes.assign(blob.value->data(), blob.value->data() + blob.value->size());
            }
            return nlohmann::json::binary(std::move(bytes));
        }
        case arrow::Type::LIST:
        case arrow::Type::LARGE_LIST:
        case arrow::Type::FIXED_SIZE_LIST: {
            const auto &list = static_cast<const arrow::BaseListScalar &>(scalar);
            return list.value ? array_to_json(*list.value) : nlohmann::json::array();
        }
        case arrow::Type::STRUCT: {
            const auto &record = static_cast<const arrow::StructScalar &>(scalar);
            const auto &type = static_cast<const arrow::StructType &>(*scalar.type);
            nlohmann::json out = nlohmann::json::object();
            for (int i = 0; i < type.num_fields() && i < static_cast<int>(record.value.size()); ++i) {
                out[type.field(i)->name()] = scalar_to_json(*record.value[i]);
            }
            return out;
        }
        case arrow::Type::DICTIONARY: {
            const auto encoded = static_cast<const arrow::DictionaryScalar &>(scalar).GetEncodedValue();
            check_status(encoded.status(), "Unable to decode dictionary cell");
            return scalar_to_json(**encoded);
        }
        default:
            return scalar.ToString();
    }
}

nlohmann::json array_to_json(const arrow::Array &array) {
    nlohmann::json out = nlohmann::json::array();
    for (int64_t i = 0; i < array.length(); ++i) {
        const auto cell = array.GetScalar(i);
        check_status(cell.status(), "Unable to read list element");
        out.push_back(scalar_to_json(**cell));
    }
    return out;
}

}  // namespace

ParquetTableReader::ParquetTableReader(std::shared_ptr<Fetcher> fetcher) : _fetcher(std::move(fetcher)) {}

std::vector<nlohmann::json> ParquetTableReader::readRows(const std::string &locator) {
    LOG(INFO) << "Fetching feature table " << locator << "\n";
    const std::string bytes = _fetcher->fetch(locator);
    LOG(INFO) << "Downloaded " << bytes.size() << " bytes from " << locator << "\n";
    std::vector<nlohmann::json> rows = decode(bytes);
    LOG(INFO) << "Decoded " << rows.size() << " rows from " << locator << "\n";
    return rows;
}

std::vector<nlohmann::json> ParquetTableReader::decode(const std::string &bytes) {
    // non-owning view; `bytes` outlives the reader
    auto buffer = std::make_shared<arrow::Buffer>(reinterpret_cast<const std::uint8_t *>(bytes.data()),
                                                  static_cast<int64_t>(bytes.size()));
    auto input = std::make_shared<arrow::io::BufferReader>(buffer);

    std::shared_ptr<arrow::Table> table;
    try {
        parquet::arrow::FileReaderBuilder builder;
        check_status(builder.Open(input), "Unable to open parquet file");
        std::unique_ptr<parquet::arrow::FileReader> reader;
        check_status(builder.memory_pool(arrow::default_memory_pool())->Build(&reader),
                     "Unable to create parquet reader");
        check_status(reader->ReadTable(&table), "Unable to read parquet table");
    } catch (const parquet::ParquetException &ex) {
        throw malformed_input_error(std::string("Invalid parquet file: ") + ex.what());
    }

    std::vector<nlohmann::json> rows(static_cast<std::size_t>(table->num_rows()), nlohmann::json::object());
    for (int c = 0; c < table->num_columns(); ++c) {
        const std::string &name = table->schema()->field(c)->name();
        std::size_t row = 0;
        for (const auto &chunk : table->column(c)->chunks()) {
            for (int64_t i = 0; i < chunk->length(); ++i, ++row) {
                const auto cell = chunk->GetScalar(i);
                check_status(cell.status(), "Unable to read column " + name);
                rows[row][name] = scalar_to_json(**cell);
            }
        }
    }
    return rows;
}

}  // namespace tilemosaic
