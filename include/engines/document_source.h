#ifndef DOCUMENT_SOURCE_H
#define DOCUMENT_SOURCE_H

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

struct DocumentQuery {
  std::string collection;
  json filter = json::object();
  // Non-empty pipeline takes precedence over filter.
  json pipeline = json::array();
};

class IDocumentSource {
public:
  virtual ~IDocumentSource() = default;

  virtual void open(const DocumentQuery &query) = 0;
  // Appends up to maxDocuments documents as JSON objects; zero means the
  // cursor is exhausted.
  virtual size_t readBatch(size_t maxDocuments, std::vector<json> &documents) = 0;
};

#endif
