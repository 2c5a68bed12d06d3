#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "alarmsrv/v1/alert_rule_service.grpc.pb.h"
#include "alarmsrv/v1.hpp"
#include "internal/util/time.hpp"

using namespace alarmsrv::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  alarmctl <addr> create channel_id=<n> data_type=<T|S|C|A> point_id=<n> rule_name=<s>\n"
            << "                         warning_level=<1|2|3> op=<op> value=<x> [enabled=true|false] [description=<s>]\n"
            << "  alarmctl <addr> get <id>\n"
            << "  alarmctl <addr> list [channel_id=<n>] [data_type=<c>] [point_id=<n>] [warning_level=<n>]\n"
            << "                       [enabled=true|false] [keyword=<s>] [from=<time>] [to=<time>]\n"
            << "                       [page=<n>] [page_size=<n>]\n"
            << "  alarmctl <addr> point <channel_id> <data_type> <point_id>\n"
            << "  alarmctl <addr> update <id> <same fields as create>\n"
            << "  alarmctl <addr> delete <id>\n"
            << "  alarmctl <addr> enable <id>\n"
            << "  alarmctl <addr> disable <id>\n"
            << "  alarmctl <addr> stats\n"
            << "\n"
            << "  <time> is YYYY-MM-DD[( |T)HH[:MM[:SS[.ffffff]]]] in UTC, or now, today, yesterday\n";
}

// key=value arguments starting at argv[first]
static std::map<std::string, std::string> ParseArgs(int argc, char** argv, int first) {
  std::map<std::string, std::string> args;
  for (int i = first; i < argc; ++i) {
    std::string arg = argv[i];
    auto        eq  = arg.find('=');
    if (eq == std::string::npos) {
      throw std::invalid_argument("expected key=value, got '" + arg + "'");
    }
    args[arg.substr(0, eq)] = arg.substr(eq + 1);
  }
  return args;
}

static bool ParseBool(const std::string& value) {
  if (value == "true" || value == "1") return true;
  if (value == "false" || value == "0") return false;
  throw std::invalid_argument("expected true or false, got '" + value + "'");
}

static google::protobuf::Timestamp ParseTime(const std::string& value) {
  auto tp = alarmsrv::util::ParseTimestamp(value);
  if (!tp) {
    throw std::invalid_argument("invalid time '" + value + "'");
  }
  return alarmsrv::util::ToProto(*tp);
}

static RuleFields MakeFields(const std::map<std::string, std::string>& args) {
  RuleFields fields;
  for (const auto& [key, value] : args) {
    if (key == "channel_id") {
      fields.set_channel_id(std::stoll(value));
    } else if (key == "data_type") {
      fields.set_data_type(value);
    } else if (key == "point_id") {
      fields.set_point_id(std::stoll(value));
    } else if (key == "rule_name") {
      fields.set_rule_name(value);
    } else if (key == "warning_level") {
      fields.set_warning_level(std::stoi(value));
    } else if (key == "op") {
      fields.set_op(value);
    } else if (key == "value") {
      fields.set_value(std::stod(value));
    } else if (key == "enabled") {
      fields.set_enabled(ParseBool(value));
    } else if (key == "description") {
      fields.set_description(value);
    } else {
      throw std::invalid_argument("unknown field '" + key + "'");
    }
  }
  return fields;
}

static ListRulesRequest MakeListRequest(const std::map<std::string, std::string>& args) {
  ListRulesRequest req;
  for (const auto& [key, value] : args) {
    if (key == "channel_id") {
      req.set_channel_id(std::stoll(value));
    } else if (key == "data_type") {
      req.set_data_type(value);
    } else if (key == "point_id") {
      req.set_point_id(std::stoll(value));
    } else if (key == "warning_level") {
      req.set_warning_level(std::stoi(value));
    } else if (key == "enabled") {
      req.set_enabled(ParseBool(value));
    } else if (key == "keyword") {
      req.set_keyword(value);
    } else if (key == "from") {
      *req.mutable_created_after() = ParseTime(value);
    } else if (key == "to") {
      *req.mutable_created_before() = ParseTime(value);
    } else if (key == "page") {
      req.set_page(static_cast<uint32_t>(std::stoul(value)));
    } else if (key == "page_size") {
      req.set_page_size(static_cast<uint32_t>(std::stoul(value)));
    } else {
      throw std::invalid_argument("unknown filter '" + key + "'");
    }
  }
  return req;
}

static void PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("cannot render response: " + std::string(status.message()));
  }
  std::cout << json;
}

static int Report(const grpc::Status& status) {
  std::cerr << "error (" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = AlertRuleService::NewStub(channel);

  grpc::ClientContext ctx;

  try {
    if (cmd == "create") {
      CreateRuleRequest req;
      *req.mutable_fields() = MakeFields(ParseArgs(argc, argv, 3));

      CreateRuleResponse resp;
      auto               status = stub->CreateRule(&ctx, req, &resp);
      if (!status.ok()) return Report(status);
      PrintJson(resp.rule());
      return 0;
    }

    if (cmd == "get") {
      if (argc < 4) return 1;
      GetRuleRequest req;
      req.set_id(std::stoll(argv[3]));

      GetRuleResponse resp;
      auto            status = stub->GetRule(&ctx, req, &resp);
      if (!status.ok()) return Report(status);
      PrintJson(resp.rule());
      return 0;
    }

    if (cmd == "list") {
      auto req = MakeListRequest(ParseArgs(argc, argv, 3));

      ListRulesResponse resp;
      auto              status = stub->ListRules(&ctx, req, &resp);
      if (!status.ok()) return Report(status);
      PrintJson(resp);
      return 0;
    }

    if (cmd == "point") {
      if (argc < 6) return 1;
      ListPointRulesRequest req;
      req.set_channel_id(std::stoll(argv[3]));
      req.set_data_type(argv[4]);
      req.set_point_id(std::stoll(argv[5]));

      ListRulesResponse resp;
      auto              status = stub->ListPointRules(&ctx, req, &resp);
      if (!status.ok()) return Report(status);
      PrintJson(resp);
      return 0;
    }

    if (cmd == "update") {
      if (argc < 4) return 1;
      UpdateRuleRequest req;
      req.set_id(std::stoll(argv[3]));
      *req.mutable_fields() = MakeFields(ParseArgs(argc, argv, 4));

      UpdateRuleResponse resp;
      auto               status = stub->UpdateRule(&ctx, req, &resp);
      if (!status.ok()) return Report(status);
      PrintJson(resp.rule());
      return 0;
    }

    if (cmd == "delete") {
      if (argc < 4) return 1;
      DeleteRuleRequest req;
      req.set_id(std::stoll(argv[3]));

      DeleteRuleResponse resp;
      auto               status = stub->DeleteRule(&ctx, req, &resp);
      if (!status.ok()) return Report(status);
      std::cout << "deleted " << req.id() << "\n";
      return 0;
    }

    if (cmd == "enable" || cmd == "disable") {
      if (argc < 4) return 1;
      SetRuleEnabledRequest req;
      req.set_id(std::stoll(argv[3]));

      SetRuleEnabledResponse resp;
      auto status = cmd == "enable" ? stub->EnableRule(&ctx, req, &resp) : stub->DisableRule(&ctx, req, &resp);
      if (!status.ok()) return Report(status);
      PrintJson(resp.rule());
      return 0;
    }

    if (cmd == "stats") {
      GetRuleStatsResponse resp;
      auto                 status = stub->GetRuleStats(&ctx, GetRuleStatsRequest{}, &resp);
      if (!status.ok()) return Report(status);
      PrintJson(resp);
      return 0;
    }
  } catch (const std::exception& e) {
    std::cerr << "alarmctl: " << e.what() << "\n";
    return 1;
  }

  Usage();
  return 1;
}
