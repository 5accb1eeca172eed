#include "transfer/document_flattener.h"
#include "core/relay_defaults.h"
#include "core/relay_errors.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <set>

namespace {

const std::set<std::string> EXTENDED_JSON_KEYS = {
    "$oid",       "$date",      "$numberLong", "$numberInt",
    "$numberDouble", "$numberDecimal", "$binary", "$timestamp",
    "$regularExpression", "$symbol", "$code", "$minKey",
    "$maxKey",    "$uuid",      "$undefined",  "$dbPointer"};

bool coerce(const FlatField &field, ColumnType target, json &out) {
  if (!field.type) {
    out = nullptr;
    return true;
  }
  ColumnType source = *field.type;

  switch (target) {
  case ColumnType::Text:
    if (field.value.is_string())
      out = field.value;
    else if (field.value.is_boolean())
      out = field.value.get<bool>() ? "true" : "false";
    else
      out = field.value.dump();
    return true;
  case ColumnType::Integer:
    if (source == ColumnType::Integer) {
      out = field.value;
      return true;
    }
    if (source == ColumnType::Float) {
      double d = field.value.get<double>();
      if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 9.0e18) {
        out = static_cast<int64_t>(d);
        return true;
      }
    }
    return false;
  case ColumnType::Float:
    if (source == ColumnType::Integer || source == ColumnType::Float) {
      out = field.value;
      return true;
    }
    return false;
  case ColumnType::Boolean:
  case ColumnType::Timestamp:
    if (source == target) {
      out = field.value;
      return true;
    }
    return false;
  default:
    return false;
  }
}

std::string stripUtcSuffix(std::string text) {
  if (StringUtils::endsWith(text, "Z"))
    text.pop_back();
  else if (StringUtils::endsWith(text, "+00:00"))
    text.erase(text.size() - 6);
  return text;
}

} // namespace

FlattenOptions
FlattenOptions::fromParameters(const DocumentTransferParameters &p) {
  FlattenOptions options;
  options.flattenNested = p.flattenNestedDocuments;
  options.separator = p.flattenSeparator;
  options.arrayHandling = p.arrayHandling;
  options.includeFields = p.includeFields;
  options.excludeFields = p.excludeFields;
  options.fieldMappings = p.fieldMappings;
  return options;
}

void DocumentSchema::add(ColumnDefinition column) {
  index[column.name] = columns.size();
  columns.push_back(std::move(column));
}

std::vector<std::string> DocumentSchema::columnNames() const {
  std::vector<std::string> names;
  names.reserve(columns.size());
  for (const auto &column : columns)
    names.push_back(column.name);
  return names;
}

DocumentFlattener::DocumentFlattener(FlattenOptions options)
    : options_(std::move(options)) {}

bool DocumentFlattener::isExcluded(const std::string &path) const {
  for (const auto &field : options_.excludeFields) {
    if (path == field || StringUtils::startsWith(path, field + "."))
      return true;
  }
  return false;
}

bool DocumentFlattener::isIncluded(const std::string &path) const {
  if (options_.includeFields.empty())
    return true;
  for (const auto &field : options_.includeFields) {
    if (path == field || StringUtils::startsWith(path, field + "."))
      return true;
  }
  return false;
}

bool DocumentFlattener::hasIncludedDescendant(const std::string &path) const {
  for (const auto &field : options_.includeFields) {
    if (StringUtils::startsWith(field, path + "."))
      return true;
  }
  return false;
}

std::vector<FlatField> DocumentFlattener::flatten(const json &document) const {
  if (!document.is_object()) {
    throw DataError("Document is not a JSON object");
  }

  bool idRequested = std::find(options_.includeFields.begin(),
                               options_.includeFields.end(),
                               "_id") != options_.includeFields.end() ||
                     hasIncludedDescendant("_id");

  std::vector<FlatField> out;
  for (auto it = document.begin(); it != document.end(); ++it) {
    const std::string &key = it.key();
    if (key == "_id" && !idRequested)
      continue;
    if (isExcluded(key))
      continue;
    if (!isIncluded(key) && !hasIncludedDescendant(key))
      continue;
    walk(key, sanitizeColumnName(key), it.value(), out);
  }
  return out;
}

void DocumentFlattener::walk(const std::string &path, const std::string &column,
                             const json &value,
                             std::vector<FlatField> &out) const {
  if (isExtendedJsonValue(value)) {
    emit(path, column, value, out);
    return;
  }

  if (value.is_object()) {
    if (!options_.flattenNested) {
      emit(path, column, json(value.dump()), out);
      return;
    }
    for (auto it = value.begin(); it != value.end(); ++it) {
      std::string childPath = path + "." + it.key();
      if (isExcluded(childPath))
        continue;
      if (!isIncluded(childPath) && !hasIncludedDescendant(childPath))
        continue;
      walk(childPath,
           column + options_.separator + sanitizeColumnName(it.key()),
           it.value(), out);
    }
    return;
  }

  if (value.is_array()) {
    switch (options_.arrayHandling) {
    case ArrayHandling::Skip:
      return;
    case ArrayHandling::FirstElement:
      if (value.empty()) {
        emit(path, column, json(nullptr), out);
      } else if ((value[0].is_object() || value[0].is_array()) &&
                 !isExtendedJsonValue(value[0])) {
        emit(path, column, json(value[0].dump()), out);
      } else {
        emit(path, column, value[0], out);
      }
      return;
    case ArrayHandling::Serialize:
    default:
      emit(path, column, json(value.dump()), out);
      return;
    }
  }

  emit(path, column, value, out);
}

void DocumentFlattener::emit(const std::string &path, const std::string &column,
                             const json &value,
                             std::vector<FlatField> &out) const {
  std::string name = sanitizeColumnName(column);
  auto mapped = options_.fieldMappings.find(path);
  if (mapped != options_.fieldMappings.end())
    name = mapped->second;

  for (const auto &existing : out) {
    if (existing.column == name)
      return;
  }

  FlatField field;
  field.sourcePath = path;
  field.column = name;
  field.value = normalizeScalar(value, field.type);
  out.push_back(std::move(field));
}

DocumentSchema
DocumentFlattener::inferSchema(const std::vector<json> &sample) const {
  std::vector<std::string> order;
  std::map<std::string, std::optional<ColumnType>> types;

  for (const auto &document : sample) {
    if (!document.is_object())
      continue;
    for (const auto &field : flatten(document)) {
      auto it = types.find(field.column);
      if (it == types.end()) {
        order.push_back(field.column);
        types[field.column] = field.type;
        continue;
      }
      if (!field.type)
        continue;
      std::optional<ColumnType> &current = it->second;
      if (!current) {
        current = field.type;
      } else if (*current != *field.type) {
        bool numeric =
            (*current == ColumnType::Integer || *current == ColumnType::Float) &&
            (*field.type == ColumnType::Integer ||
             *field.type == ColumnType::Float);
        current = numeric ? ColumnType::Float : ColumnType::Text;
      }
    }
  }

  DocumentSchema schema;
  for (const auto &name : order) {
    ColumnDefinition column;
    column.name = name;
    column.type = types[name].value_or(ColumnType::Text);
    schema.add(std::move(column));
  }
  return schema;
}

RowMapping DocumentFlattener::mapDocument(const json &document,
                                          const DocumentSchema &schema) const {
  RowMapping mapping;
  if (!document.is_object()) {
    mapping.reason = "document is not a JSON object";
    return mapping;
  }

  mapping.row.assign(schema.columns.size(), json(nullptr));
  for (const auto &field : flatten(document)) {
    auto it = schema.index.find(field.column);
    if (it == schema.index.end()) {
      mapping.unknownColumns.push_back(field.column);
      continue;
    }
    const ColumnDefinition &column = schema.columns[it->second];
    json converted;
    if (!coerce(field, column.type, converted)) {
      mapping.reason = "field '" + field.sourcePath + "' holds a " +
                       columnTypeToString(*field.type) + " value but column " +
                       column.name + " is " + columnTypeToString(column.type);
      mapping.row.clear();
      return mapping;
    }
    mapping.row[it->second] = std::move(converted);
  }
  mapping.mapped = true;
  return mapping;
}

bool DocumentFlattener::isExtendedJsonValue(const json &value) {
  if (!value.is_object() || value.empty() || value.size() > 2)
    return false;
  return EXTENDED_JSON_KEYS.count(value.begin().key()) > 0;
}

json DocumentFlattener::normalizeScalar(const json &value,
                                        std::optional<ColumnType> &type) {
  type.reset();
  if (value.is_null())
    return nullptr;
  if (value.is_boolean()) {
    type = ColumnType::Boolean;
    return value;
  }
  if (value.is_number_integer()) {
    type = ColumnType::Integer;
    return value;
  }
  if (value.is_number_float()) {
    type = ColumnType::Float;
    return value;
  }
  if (value.is_string()) {
    type = ColumnType::Text;
    return value;
  }

  if (!isExtendedJsonValue(value)) {
    type = ColumnType::Text;
    return value.dump();
  }

  const std::string &key = value.begin().key();
  const json &inner = value.begin().value();

  if (key == "$oid" && inner.is_string()) {
    type = ColumnType::Text;
    return inner;
  }

  if (key == "$date") {
    type = ColumnType::Timestamp;
    if (inner.is_string())
      return stripUtcSuffix(inner.get<std::string>());
    if (inner.is_number_integer())
      return formatEpochMillis(inner.get<int64_t>());
    if (inner.is_object() && inner.contains("$numberLong") &&
        inner["$numberLong"].is_string()) {
      try {
        return formatEpochMillis(
            std::stoll(inner["$numberLong"].get<std::string>()));
      } catch (const std::invalid_argument &) {
      } catch (const std::out_of_range &) {
      }
    }
    type = ColumnType::Text;
    return value.dump();
  }

  if ((key == "$numberLong" || key == "$numberInt") && inner.is_string()) {
    try {
      int64_t parsed = std::stoll(inner.get<std::string>());
      type = ColumnType::Integer;
      return parsed;
    } catch (const std::invalid_argument &) {
    } catch (const std::out_of_range &) {
    }
    type = ColumnType::Text;
    return inner;
  }

  if (key == "$numberDouble" && inner.is_string()) {
    type = ColumnType::Float;
    try {
      double parsed = std::stod(inner.get<std::string>());
      if (std::isfinite(parsed))
        return parsed;
    } catch (const std::invalid_argument &) {
    } catch (const std::out_of_range &) {
    }
    // Infinity and NaN have no portable SQL representation.
    return nullptr;
  }

  if (key == "$numberDecimal" && inner.is_string()) {
    type = ColumnType::Text;
    return inner;
  }

  if (key == "$timestamp" && inner.is_object() && inner.contains("t") &&
      inner["t"].is_number_integer()) {
    type = ColumnType::Integer;
    return inner["t"];
  }

  type = ColumnType::Text;
  return value.dump();
}

std::string DocumentFlattener::sanitizeColumnName(const std::string &name) {
  std::string out;
  out.reserve(name.size() + 1);
  for (char c : name) {
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '_')
      out += c;
    else
      out += '_';
  }
  if (out.empty() || std::isdigit(static_cast<unsigned char>(out[0])))
    out.insert(out.begin(), '_');
  if (out.size() > RelayDefaults::MAX_IDENTIFIER_LENGTH)
    out.resize(RelayDefaults::MAX_IDENTIFIER_LENGTH);
  return out;
}

std::string DocumentFlattener::formatEpochMillis(int64_t millis) {
  int64_t seconds = millis / 1000;
  int64_t remainder = millis % 1000;
  if (remainder < 0) {
    remainder += 1000;
    seconds -= 1;
  }

  std::time_t time = static_cast<std::time_t>(seconds);
  std::tm tm{};
  gmtime_r(&time, &tm);

  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm);
  char fraction[8];
  std::snprintf(fraction, sizeof(fraction), ".%03d",
                static_cast<int>(remainder));
  return std::string(buffer) + fraction;
}
