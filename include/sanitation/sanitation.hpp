#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "hex.hpp"
#include "logging.hpp"
#include "sanitized_boolean.hpp"
#include "sanitized_buffer.hpp"
#include "utf8_classifier.hpp"
