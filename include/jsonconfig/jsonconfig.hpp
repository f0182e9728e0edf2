#pragma once

#include "jsonconfig/api/status.hpp"
#include "jsonconfig/api/version.hpp"
#include "jsonconfig/config/reader.hpp"
#include "jsonconfig/config/writer.hpp"
#include "jsonconfig/json/i_json.hpp"
#include "jsonconfig/json/numeric_coercion.hpp"
#include "jsonconfig/json/sanitizer.hpp"
#include "jsonconfig/log/i_logger.hpp"
#include "jsonconfig/log/log_types.hpp"
#include "jsonconfig/log/logging.hpp"
