#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "alarmsrv/v1/alert_rule_service.grpc.pb.h"
#include "internal/service/rule_service.hpp"

namespace alarmsrv::grpc {

class RuleServer final : public alarmsrv::v1::AlertRuleService::Service {
public:
  explicit RuleServer(std::shared_ptr<alarmsrv::service::RuleService> svc);

  ::grpc::Status CreateRule(::grpc::ServerContext*,
                            const alarmsrv::v1::CreateRuleRequest*,
                            alarmsrv::v1::CreateRuleResponse*) override;

  ::grpc::Status GetRule(::grpc::ServerContext*,
                         const alarmsrv::v1::GetRuleRequest*,
                         alarmsrv::v1::GetRuleResponse*) override;

  ::grpc::Status ListRules(::grpc::ServerContext*,
                           const alarmsrv::v1::ListRulesRequest*,
                           alarmsrv::v1::ListRulesResponse*) override;

  ::grpc::Status ListPointRules(::grpc::ServerContext*,
                                const alarmsrv::v1::ListPointRulesRequest*,
                                alarmsrv::v1::ListRulesResponse*) override;

  ::grpc::Status UpdateRule(::grpc::ServerContext*,
                            const alarmsrv::v1::UpdateRuleRequest*,
                            alarmsrv::v1::UpdateRuleResponse*) override;

  ::grpc::Status DeleteRule(::grpc::ServerContext*,
                            const alarmsrv::v1::DeleteRuleRequest*,
                            alarmsrv::v1::DeleteRuleResponse*) override;

  ::grpc::Status EnableRule(::grpc::ServerContext*,
                            const alarmsrv::v1::SetRuleEnabledRequest*,
                            alarmsrv::v1::SetRuleEnabledResponse*) override;

  ::grpc::Status DisableRule(::grpc::ServerContext*,
                             const alarmsrv::v1::SetRuleEnabledRequest*,
                             alarmsrv::v1::SetRuleEnabledResponse*) override;

  ::grpc::Status GetRuleStats(::grpc::ServerContext*,
                              const alarmsrv::v1::GetRuleStatsRequest*,
                              alarmsrv::v1::GetRuleStatsResponse*) override;

private:
  std::shared_ptr<alarmsrv::service::RuleService> service_;
};

}
