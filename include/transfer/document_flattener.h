#ifndef DOCUMENT_FLATTENER_H
#define DOCUMENT_FLATTENER_H

#include "engines/relational_connection.h"
#include "transfer/transfer_parameters.h"
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

struct FlattenOptions {
  bool flattenNested = true;
  std::string separator = "_";
  ArrayHandling arrayHandling = ArrayHandling::Serialize;
  // Dotted source paths ("address.city").
  std::vector<std::string> includeFields;
  std::vector<std::string> excludeFields;
  std::map<std::string, std::string> fieldMappings;

  static FlattenOptions fromParameters(const DocumentTransferParameters &p);
};

// One leaf of a flattened document. type is empty for null values.
struct FlatField {
  std::string sourcePath;
  std::string column;
  json value;
  std::optional<ColumnType> type;
};

struct DocumentSchema {
  std::vector<ColumnDefinition> columns;
  std::map<std::string, size_t> index;

  void add(ColumnDefinition column);
  bool empty() const { return columns.empty(); }
  std::vector<std::string> columnNames() const;
};

struct RowMapping {
  bool mapped = false;
  Row row;
  std::string reason;
  std::vector<std::string> unknownColumns;
};

// Turns relaxed extended JSON documents into flat relational rows.
class DocumentFlattener {
  FlattenOptions options_;

public:
  explicit DocumentFlattener(FlattenOptions options);

  // Returns fields in document order. When two paths produce the same column
  // name the first one wins.
  std::vector<FlatField> flatten(const json &document) const;

  // Non-object documents in the sample are ignored. Integer and Float widen
  // to Float; any other disagreement widens to Text. All-null columns are
  // Text.
  DocumentSchema inferSchema(const std::vector<json> &sample) const;

  RowMapping mapDocument(const json &document,
                         const DocumentSchema &schema) const;

  // Unwraps relaxed extended JSON wrappers ($oid, $date, $numberLong, ...)
  // into a plain scalar and reports its column type.
  static json normalizeScalar(const json &value,
                              std::optional<ColumnType> &type);
  static bool isExtendedJsonValue(const json &value);
  static std::string sanitizeColumnName(const std::string &name);
  static std::string formatEpochMillis(int64_t millis);

private:
  void walk(const std::string &path, const std::string &column,
            const json &value, std::vector<FlatField> &out) const;
  void emit(const std::string &path, const std::string &column,
            const json &value, std::vector<FlatField> &out) const;
  bool isExcluded(const std::string &path) const;
  bool isIncluded(const std::string &path) const;
  bool hasIncludedDescendant(const std::string &path) const;
};

#endif
