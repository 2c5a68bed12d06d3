#pragma once

#include "alarmsrv/v1/alert_rule.pb.h"
