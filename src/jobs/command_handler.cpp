#include "jobs/command_handler.h"
#include "core/logger.h"
#include "utils/string_utils.h"

CommandHandler::CommandHandler(JobService &service) : service_(service) {}

std::string CommandHandler::requireString(const json &command,
                                          const std::string &key) {
  if (!command.contains(key) || !command[key].is_string() ||
      command[key].get<std::string>().empty()) {
    throw ValidationError("Command field '" + key +
                          "' is required and must be a string");
  }
  return command[key].get<std::string>();
}

json CommandHandler::errorResponse(ErrorKind kind, const std::string &message) {
  return {{"ok", false},
          {"errorKind", errorKindToString(kind)},
          {"error", StringUtils::redactSecrets(message)}};
}

json CommandHandler::handle(const json &command) {
  try {
    if (!command.is_object()) {
      throw ValidationError("Command must be a JSON object");
    }
    std::string op = requireString(command, "op");
    if (op == "submit")
      return handleSubmit(command);
    if (op == "status")
      return handleStatus(command);
    if (op == "list")
      return handleList(command);
    if (op == "cancel")
      return handleCancel(command);
    throw ValidationError("Unknown op '" + op +
                          "' (expected submit, status, list or cancel)");
  } catch (const RelayError &e) {
    return errorResponse(e.kind(), e.what());
  } catch (const json::exception &e) {
    return errorResponse(ErrorKind::Validation, e.what());
  } catch (const std::exception &e) {
    Logger::error(LogCategory::SYSTEM, "CommandHandler::handle",
                  "Unexpected error handling command: " + std::string(e.what()));
    return errorResponse(ErrorKind::Internal, e.what());
  }
}

std::string CommandHandler::handleLine(const std::string &line) {
  json command;
  try {
    command = json::parse(line);
  } catch (const json::parse_error &e) {
    return errorResponse(ErrorKind::Validation,
                         "Invalid JSON command: " + std::string(e.what()))
        .dump();
  }
  return handle(command).dump();
}

json CommandHandler::handleSubmit(const json &command) {
  std::string kind = requireString(command, "kind");
  json parameters = command.value("parameters", json::object());
  SubmitResult submitted = service_.submitJob(kind, parameters);

  json response = submitted.toJson();
  response["ok"] = true;
  response["status"] = "Pending";
  return response;
}

json CommandHandler::handleStatus(const json &command) {
  Job job = service_.getJobStatus(requireString(command, "jobId"));
  return {{"ok", true}, {"job", job.toJson()}};
}

json CommandHandler::handleList(const json &command) {
  size_t limit = 0;
  if (command.contains("limit") && !command["limit"].is_null()) {
    if (!command["limit"].is_number_integer() ||
        command["limit"].get<int64_t>() < 0) {
      throw ValidationError("Command field 'limit' must be a non-negative "
                            "integer");
    }
    limit = command["limit"].get<size_t>();
  }

  std::vector<Job> jobs;
  if (command.contains("status") && command["status"].is_string()) {
    jobs = service_.listJobsByStatus(
        parseJobStatus(command["status"].get<std::string>()), limit);
  } else {
    jobs = service_.listRecentJobs(limit);
  }

  json list = json::array();
  for (const auto &job : jobs)
    list.push_back(job.toJson());
  return {{"ok", true}, {"jobs", list}};
}

json CommandHandler::handleCancel(const json &command) {
  std::string jobId = requireString(command, "jobId");
  bool cancelled = service_.cancelJob(jobId);
  return {{"ok", true}, {"jobId", jobId}, {"cancelled", cancelled}};
}
