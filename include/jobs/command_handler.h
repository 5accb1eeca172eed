#ifndef COMMAND_HANDLER_H
#define COMMAND_HANDLER_H

#include "jobs/job_service.h"
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

// Line protocol over JobService: one JSON command in, one JSON response out.
//   {"op":"submit","kind":"DataSync","parameters":{...}}
//   {"op":"status","jobId":"..."}
//   {"op":"list","limit":20,"status":"Failed"}
//   {"op":"cancel","jobId":"..."}
// Failures come back as {"ok":false,"errorKind":"...","error":"..."}.
class CommandHandler {
  JobService &service_;

public:
  explicit CommandHandler(JobService &service);

  json handle(const json &command);
  std::string handleLine(const std::string &line);

private:
  json handleSubmit(const json &command);
  json handleStatus(const json &command);
  json handleList(const json &command);
  json handleCancel(const json &command);

  static std::string requireString(const json &command, const std::string &key);
  static json errorResponse(ErrorKind kind, const std::string &message);
};

#endif
