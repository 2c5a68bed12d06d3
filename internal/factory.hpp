#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/service/rule_service.hpp"

namespace alarmsrv::factory {

/*
  RuntimeDependencies

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<service::RuleService> rule_service;
};

/*
  Build

  Constructs the backend and services from the runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
  Storage initialization failures propagate as exceptions.
*/
RuntimeDependencies Build(const alarmsrv::runtime::config::RuntimeConfig& config);

}
