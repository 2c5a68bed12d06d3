#include "rule_server.hpp"
#include "grpc_error.hpp"

namespace alarmsrv::grpc {

using namespace alarmsrv::v1;

RuleServer::RuleServer(std::shared_ptr<alarmsrv::service::RuleService> svc)
    : service_(std::move(svc)) {}

::grpc::Status RuleServer::CreateRule(::grpc::ServerContext*,
                                      const CreateRuleRequest* req,
                                      CreateRuleResponse* resp) {
  try {
    *resp = service_->Create(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RuleServer::GetRule(::grpc::ServerContext*,
                                   const GetRuleRequest* req,
                                   GetRuleResponse* resp) {
  try {
    *resp = service_->Get(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RuleServer::ListRules(::grpc::ServerContext*,
                                     const ListRulesRequest* req,
                                     ListRulesResponse* resp) {
  try {
    *resp = service_->List(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RuleServer::ListPointRules(::grpc::ServerContext*,
                                          const ListPointRulesRequest* req,
                                          ListRulesResponse* resp) {
  try {
    *resp = service_->ListForPoint(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RuleServer::UpdateRule(::grpc::ServerContext*,
                                      const UpdateRuleRequest* req,
                                      UpdateRuleResponse* resp) {
  try {
    *resp = service_->Update(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RuleServer::DeleteRule(::grpc::ServerContext*,
                                      const DeleteRuleRequest* req,
                                      DeleteRuleResponse*) {
  try {
    service_->Delete(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RuleServer::EnableRule(::grpc::ServerContext*,
                                      const SetRuleEnabledRequest* req,
                                      SetRuleEnabledResponse* resp) {
  try {
    *resp = service_->Enable(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RuleServer::DisableRule(::grpc::ServerContext*,
                                       const SetRuleEnabledRequest* req,
                                       SetRuleEnabledResponse* resp) {
  try {
    *resp = service_->Disable(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RuleServer::GetRuleStats(::grpc::ServerContext*,
                                        const GetRuleStatsRequest* req,
                                        GetRuleStatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
