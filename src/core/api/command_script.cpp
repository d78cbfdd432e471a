#include "core/api/command_script.hpp"

#include <cstdint>
#include <istream>
#include <limits>
#include <optional>
#include <ostream>
#include <utility>

#include "core/model/names.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace sentinel {
namespace {

std::string id_list(const std::vector<std::uint64_t>& ids) {
  std::string out;
  for (const auto id : ids) {
    if (!out.empty()) {
      out.push_back(',');
    }
    out += std::to_string(id);
  }
  return out.empty() ? "-" : out;
}

Result usage_error(std::string_view command, std::string_view shape) {
  return Result::failure(ErrorCode::InvalidInput, "usage: " + std::string{command} + "|" + std::string{shape});
}

std::optional<std::int64_t> number_at(const std::vector<std::string>& fields, std::size_t index) {
  if (index >= fields.size()) {
    return std::nullopt;
  }
  return util::parse_int64(fields[index]);
}

// Record ids are positive; a negative value is malformed rather than a huge id.
std::optional<std::uint64_t> id_at(const std::vector<std::string>& fields, std::size_t index) {
  const auto value = number_at(fields, index);
  if (!value || *value < 0) {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(*value);
}

Result narrow_int(std::int64_t value, ErrorCode code, std::string_view field, int& out) {
  if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
    return Result::failure(code, std::string{field} + " " + std::to_string(value) + " is out of range.");
  }
  out = static_cast<int>(value);
  return Result::success();
}

// Accepts a 64-digit hex digest, otherwise fingerprints the text as raw evidence.
DataHash evidence_hash(std::string_view text) {
  DataHash hash{};
  if (text.empty()) {
    return hash;
  }
  if (util::parse_data_hash(text, hash)) {
    return hash;
  }
  return util::evidence_fingerprint(text);
}

Result run_register(SentinelCore& core, const std::vector<std::string>& f) {
  constexpr std::string_view shape = "caller|type|severity|confidence|lat_e6|lon_e6|description|evidence|population";
  if (f.size() != 10) {
    return usage_error("register", shape);
  }
  const auto type = parse_threat_type(f[2]);
  const auto severity = number_at(f, 3);
  const auto confidence = number_at(f, 4);
  const auto lat = number_at(f, 5);
  const auto lon = number_at(f, 6);
  const auto population = number_at(f, 9);
  if (!type || !severity || !confidence || !lat || !lon || !population || *population < 0) {
    return usage_error("register", shape);
  }
  int severity_value = 0;
  if (const Result narrowed = narrow_int(*severity, ErrorCode::InvalidSeverity, "Severity", severity_value);
      !narrowed.ok) {
    return narrowed;
  }
  int confidence_value = 0;
  if (const Result narrowed = narrow_int(*confidence, ErrorCode::InvalidConfidence, "Confidence", confidence_value);
      !narrowed.ok) {
    return narrowed;
  }

  ThreatId id = 0;
  Result result = core.register_threat(Principal{f[1]},
                                       {
                                           .threat_type = *type,
                                           .severity = severity_value,
                                           .confidence = confidence_value,
                                           .location = {.latitude_e6 = *lat, .longitude_e6 = *lon},
                                           .description = f[7],
                                           .data_hash = evidence_hash(f[8]),
                                           .affected_population = static_cast<std::uint64_t>(*population),
                                       },
                                       id);
  if (result.ok) {
    result.data = "threat_id=" + std::to_string(id);
  }
  return result;
}

Result run_threat_status(SentinelCore& core, const std::vector<std::string>& f) {
  const auto id = id_at(f, 2);
  const auto status = f.size() == 4 ? parse_threat_status(f[3]) : std::nullopt;
  if (f.size() != 4 || !id || !status) {
    return usage_error("threat-status", "caller|threat_id|status");
  }
  return core.update_threat_status(Principal{f[1]}, *id, *status);
}

Result run_verify(SentinelCore& core, const std::vector<std::string>& f) {
  const auto id = id_at(f, 2);
  if (f.size() != 4 || !id || (f[3] != "true" && f[3] != "false")) {
    return usage_error("verify", "caller|threat_id|true|false");
  }
  return core.verify_threat(Principal{f[1]}, *id, f[3] == "true");
}

Result run_alert(SentinelCore& core, const std::vector<std::string>& f) {
  constexpr std::string_view shape = "caller|threat_id|severity|channels|recipients|message";
  const auto threat_id = id_at(f, 2);
  const auto severity = number_at(f, 3);
  if (f.size() != 7 || !threat_id || !severity) {
    return usage_error("alert", shape);
  }
  int severity_value = 0;
  if (const Result narrowed = narrow_int(*severity, ErrorCode::InvalidSeverity, "Severity", severity_value);
      !narrowed.ok) {
    return narrowed;
  }
  std::vector<AlertChannel> channels;
  for (const auto& name : util::split_csv(f[4])) {
    const auto channel = parse_alert_channel(name);
    if (!channel) {
      return Result::failure(ErrorCode::InvalidInput, "Unknown alert channel `" + name + "`.");
    }
    channels.push_back(*channel);
  }

  AlertId id = 0;
  Result result = core.create_alert(Principal{f[1]},
                                    {
                                        .threat_id = *threat_id,
                                        .message = f[6],
                                        .severity = severity_value,
                                        .channels = std::move(channels),
                                        .recipients = util::split_csv(f[5]),
                                    },
                                    id);
  if (result.ok) {
    Alert created;
    const Result fetched = core.alert(id, created);
    result.data = "alert_id=" + std::to_string(id);
    if (fetched.ok && created.is_emergency) {
      result.data += " emergency=true";
    }
  }
  return result;
}

Result run_alert_status(SentinelCore& core, const std::vector<std::string>& f) {
  const auto id = id_at(f, 2);
  const auto status = f.size() >= 4 ? parse_alert_status(f[3]) : std::nullopt;
  if ((f.size() != 4 && f.size() != 5) || !id || !status) {
    return usage_error("alert-status", "caller|alert_id|status[|failure_reason]");
  }
  const std::string_view reason = f.size() == 5 ? std::string_view{f[4]} : std::string_view{};
  return core.update_alert_status(Principal{f[1]}, *id, *status, reason);
}

Result run_threshold(SentinelCore& core, const std::vector<std::string>& f) {
  const auto value = number_at(f, 2);
  if (f.size() != 3 || !value) {
    return usage_error("threshold", "caller|value");
  }
  int threshold = 0;
  if (const Result narrowed = narrow_int(*value, ErrorCode::InvalidSeverity, "Threshold", threshold); !narrowed.ok) {
    return narrowed;
  }
  return core.set_emergency_threshold(Principal{f[1]}, threshold);
}

Result run_role_change(SentinelCore& core, const std::vector<std::string>& f, bool grant) {
  const std::string_view command = grant ? "grant" : "revoke";
  const auto role = f.size() == 4 ? parse_role(f[2]) : std::nullopt;
  if (f.size() != 4 || !role) {
    return usage_error(command, "caller|role|principal");
  }
  return grant ? core.grant_role(Principal{f[1]}, *role, Principal{f[3]})
               : core.revoke_role(Principal{f[1]}, *role, Principal{f[3]});
}

Result run_transfer(SentinelCore& core, const std::vector<std::string>& f) {
  if (f.size() != 3) {
    return usage_error("transfer", "caller|new_owner");
  }
  return core.transfer_ownership(Principal{f[1]}, Principal{f[2]});
}

Result run_listing(SentinelCore& core, const std::vector<std::string>& f) {
  const auto offset = id_at(f, 1);
  const auto limit = id_at(f, 2);
  if (f.size() != 3 || !offset || !limit) {
    return usage_error(f[0], "offset|limit");
  }
  const auto off = static_cast<std::size_t>(*offset);
  const auto lim = static_cast<std::size_t>(*limit);

  std::vector<std::uint64_t> ids;
  Result result = Result::success();
  if (f[0] == "list-active") {
    result = core.list_active_threats(off, lim, ids);
  } else if (f[0] == "list-recent") {
    result = core.list_recent_alerts(off, lim, ids);
  } else {
    result = core.list_emergency_alerts(off, lim, ids);
  }
  if (result.ok) {
    result.data = "ids=" + id_list(ids);
  }
  return result;
}

Result run_stats(const SentinelCore& core) {
  const HealthReport report = core.health();
  if (!core.initialized()) {
    return Result::failure(ErrorCode::NotInitialized, report.details);
  }
  const auto& t = report.threats;
  const auto& a = report.alerts;
  return Result::success(
      "", "threats total=" + std::to_string(t.total) + " active=" + std::to_string(t.active) +
              " resolved=" + std::to_string(t.resolved) + " verified=" + std::to_string(t.verified) +
              " | alerts total=" + std::to_string(a.total) + " successful=" + std::to_string(a.successful) +
              " failed=" + std::to_string(a.failed) + " emergency=" + std::to_string(a.emergency_count) +
              " avg_delivery_seconds=" + std::to_string(a.avg_delivery_seconds));
}

Result run_health(const SentinelCore& core) {
  const HealthReport report = core.health();
  std::string data = "healthy=";
  data += report.healthy ? "true" : "false";
  data += " journal_events=" + std::to_string(report.journal_events);
  data += " journal_head=" + report.journal_head;
  data += " chain_valid=";
  data += report.journal_chain_valid ? "true" : "false";
  data += " emergency_threshold=" + std::to_string(report.emergency_threshold);
  data += " owner=" + report.threat_owner;
  if (!report.healthy) {
    Result failure = Result::failure(ErrorCode::None, report.details);
    failure.data = std::move(data);
    return failure;
  }
  return Result::success(report.details, std::move(data));
}

void print_result(std::ostream& out, std::size_t line_number, const std::string& command, const Result& result) {
  out << line_number << ' ' << command << ' ';
  if (result.ok) {
    out << "ok";
    if (!result.data.empty()) {
      out << ' ' << result.data;
    }
    out << '\n';
    return;
  }
  out << "error";
  if (result.code != ErrorCode::None) {
    out << ' ' << error_code_name(result.code);
  }
  if (!result.data.empty()) {
    out << ' ' << result.data;
  }
  out << ": " << result.message << '\n';
}

}  // namespace

std::vector<std::string> split_command_fields(std::string_view line) {
  std::vector<std::string> fields;
  std::size_t start = 0;
  while (true) {
    const std::size_t bar = line.find('|', start);
    fields.push_back(util::trim_copy(line.substr(start, bar == std::string_view::npos ? bar : bar - start)));
    if (bar == std::string_view::npos) {
      break;
    }
    start = bar + 1;
  }
  return fields;
}

Result run_command(SentinelCore& core, const std::vector<std::string>& fields) {
  if (fields.empty()) {
    return Result::failure(ErrorCode::InvalidInput, "Empty command.");
  }
  const std::string& command = fields[0];
  if (command == "register") {
    return run_register(core, fields);
  }
  if (command == "threat-status") {
    return run_threat_status(core, fields);
  }
  if (command == "verify") {
    return run_verify(core, fields);
  }
  if (command == "alert") {
    return run_alert(core, fields);
  }
  if (command == "alert-status") {
    return run_alert_status(core, fields);
  }
  if (command == "threshold") {
    return run_threshold(core, fields);
  }
  if (command == "grant" || command == "revoke") {
    return run_role_change(core, fields, command == "grant");
  }
  if (command == "transfer") {
    return run_transfer(core, fields);
  }
  if (command == "list-active" || command == "list-recent" || command == "list-emergency") {
    return run_listing(core, fields);
  }
  if (command == "stats") {
    return run_stats(core);
  }
  if (command == "health") {
    return run_health(core);
  }
  return Result::failure(ErrorCode::InvalidInput, "Unknown command `" + command + "`.");
}

std::size_t run_command_script(SentinelCore& core, std::istream& script, std::ostream& out) {
  std::string line;
  std::size_t line_number = 0;
  std::size_t executed = 0;
  while (std::getline(script, line)) {
    ++line_number;
    const std::string trimmed = util::trim_copy(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    const std::vector<std::string> fields = split_command_fields(trimmed);
    print_result(out, line_number, fields[0], run_command(core, fields));
    ++executed;
  }
  return executed;
}

}  // namespace sentinel
