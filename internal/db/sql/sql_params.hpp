#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace alarmsrv::db::sql {

/*
  Parameter abstraction for dynamically assembled statements
  (filters). Ordered binding: the n-th Param binds the n-th '?'.
*/

using Param = std::variant<
    std::nullptr_t,
    int32_t,
    int64_t,
    uint64_t,
    double,
    std::string
>;

using Params = std::vector<Param>;

}
