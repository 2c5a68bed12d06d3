#pragma once

#include <memory>

namespace alarmsrv::db { class Repository; }

namespace alarmsrv::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<alarmsrv::db::Repository> repository;
};

}
